#include <QtTest/QtTest>

#include "CommandLine.h"
#include "Errors.h"
#include "Logger.h"

#include <ctime>

using Cloclify::Command;

class CommandLineTests : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void listsTodayWithoutCommand();
    void startsWithDescriptionAndProject();
    void startsWithShorthandTokens();
    void startsAtGivenTime();
    void stopsNowOrAtGivenTime();
    void addsSpanOnGivenDay();
    void addsOpenEndedEntry();
    void listsDaysAndRanges();
    void editsEntry();
    void deletesAndDumps();
    void acceptsCommandsWithoutArguments();
    void readsGlobalOptionsBeforeAndAfterCommand();
    void producesHelpAndVersion();

    void rejectsInvalidInput_data();
    void rejectsInvalidInput();

private:
    Command parse(const QStringList &arguments) const { return Cloclify::parseCommandLine(arguments, m_now); }

    // Wednesday
    const QDateTime m_now{QDate{2024, 1, 3}, QTime{12, 0}};
};

void CommandLineTests::initTestCase()
{
    qputenv("TZ", "UTC");
    tzset();
    QStandardPaths::setTestModeEnabled(true);
    Cloclify::logs::init(false);
}

void CommandLineTests::listsTodayWithoutCommand()
{
    auto command = parse({});
    QVERIFY(command.type == Command::Type::List);
    QCOMPARE(command.from, m_now.date());
    QCOMPARE(command.to, m_now.date());
}

void CommandLineTests::startsWithDescriptionAndProject()
{
    auto command = parse({QStringLiteral("start"), QStringLiteral("writing spec"), QStringLiteral("--project"), QStringLiteral("X")});

    QVERIFY(command.type == Command::Type::Start);
    QCOMPARE(command.description, QStringLiteral("writing spec"));
    QCOMPARE(command.project, QStringLiteral("X"));
    QVERIFY(command.tags.isEmpty());
    QVERIFY(!command.billable);
    QCOMPARE(command.start, m_now);
}

void CommandLineTests::startsWithShorthandTokens()
{
    auto command = parse({QStringLiteral("start"),
                          QStringLiteral("fix"),
                          QStringLiteral("@Backend"),
                          QStringLiteral("bug"),
                          QStringLiteral("+urgent"),
                          QStringLiteral("-t"),
                          QStringLiteral("dev"),
                          QStringLiteral("$")});

    QCOMPARE(command.description, QStringLiteral("fix bug"));
    QCOMPARE(command.project, QStringLiteral("Backend"));
    QCOMPARE(command.tags, (QStringList{QStringLiteral("dev"), QStringLiteral("urgent")}));
    QVERIFY(command.billable.value_or(false));
}

void CommandLineTests::startsAtGivenTime()
{
    auto command = parse({QStringLiteral("start"), QStringLiteral("--at"), QStringLiteral("9:15"), QStringLiteral("-b")});

    QCOMPARE(command.start, QDateTime(QDate(2024, 1, 3), QTime(9, 15)));
    QVERIFY(command.description.isEmpty());
    QVERIFY(command.billable.value_or(false));
}

void CommandLineTests::stopsNowOrAtGivenTime()
{
    auto command = parse({QStringLiteral("stop")});
    QVERIFY(command.type == Command::Type::Stop);
    QCOMPARE(command.end, m_now);

    command = parse({QStringLiteral("stop"), QStringLiteral("--at"), QStringLiteral("17:00")});
    QCOMPARE(command.end, QDateTime(QDate(2024, 1, 3), QTime(17, 0)));
}

void CommandLineTests::addsSpanOnGivenDay()
{
    auto command = parse({QStringLiteral("add"),
                          QStringLiteral("9:00-10:30"),
                          QStringLiteral("standup"),
                          QStringLiteral("meeting"),
                          QStringLiteral("-d"),
                          QStringLiteral("yesterday"),
                          QStringLiteral("-p"),
                          QStringLiteral("Internal")});

    QVERIFY(command.type == Command::Type::Add);
    QCOMPARE(command.start, QDateTime(QDate(2024, 1, 2), QTime(9, 0)));
    QCOMPARE(command.end, QDateTime(QDate(2024, 1, 2), QTime(10, 30)));
    QCOMPARE(command.description, QStringLiteral("standup meeting"));
    QCOMPARE(command.project, QStringLiteral("Internal"));
}

void CommandLineTests::addsOpenEndedEntry()
{
    auto command = parse({QStringLiteral("add"), QStringLiteral("11:00-/")});
    QCOMPARE(command.start, QDateTime(QDate(2024, 1, 3), QTime(11, 0)));
    QVERIFY(!command.end.isValid());

    command = parse({QStringLiteral("add"), QStringLiteral("11:00-now")});
    QCOMPARE(command.end, m_now);
}

void CommandLineTests::listsDaysAndRanges()
{
    auto command = parse({QStringLiteral("list"), QStringLiteral("-d"), QStringLiteral("monday")});
    QCOMPARE(command.from, QDate(2024, 1, 1));
    QCOMPARE(command.to, QDate(2024, 1, 1));

    command = parse({QStringLiteral("list"), QStringLiteral("--from"), QStringLiteral("2024-01-01"), QStringLiteral("--to"), QStringLiteral("2024-01-02")});
    QCOMPARE(command.from, QDate(2024, 1, 1));
    QCOMPARE(command.to, QDate(2024, 1, 2));

    command = parse({QStringLiteral("list"), QStringLiteral("--from"), QStringLiteral("2023-12-30")});
    QCOMPARE(command.from, QDate(2023, 12, 30));
    QCOMPARE(command.to, m_now.date());
}

void CommandLineTests::editsEntry()
{
    auto command = parse({QStringLiteral("edit"), QStringLiteral("abc123"), QStringLiteral("new"), QStringLiteral("text")});
    QVERIFY(command.type == Command::Type::Edit);
    QCOMPARE(command.entryId, QStringLiteral("abc123"));
    QCOMPARE(command.description, QStringLiteral("new text"));
    QVERIFY(command.descriptionSet);

    command = parse({QStringLiteral("edit"),
                     QStringLiteral("abc123"),
                     QStringLiteral("--start"),
                     QStringLiteral("8:30"),
                     QStringLiteral("--end"),
                     QStringLiteral("9:45"),
                     QStringLiteral("-d"),
                     QStringLiteral("2024-01-01"),
                     QStringLiteral("--not-billable")});
    QVERIFY(!command.descriptionSet);
    QVERIFY(command.startTime && command.endTime && command.editDate);
    QCOMPARE(*command.startTime, QTime(8, 30));
    QCOMPARE(*command.endTime, QTime(9, 45));
    QCOMPARE(*command.editDate, QDate(2024, 1, 1));
    QVERIFY(command.billable.has_value());
    QVERIFY(!*command.billable);
}

void CommandLineTests::deletesAndDumps()
{
    auto command = parse({QStringLiteral("delete"), QStringLiteral("abc123")});
    QVERIFY(command.type == Command::Type::Delete);
    QCOMPARE(command.entryId, QStringLiteral("abc123"));

    command = parse({QStringLiteral("dump"), QStringLiteral("2024-02")});
    QVERIFY(command.type == Command::Type::Dump);
    QCOMPARE(command.from, QDate(2024, 2, 1));
    QCOMPARE(command.to, QDate(2024, 2, 29));
}

void CommandLineTests::acceptsCommandsWithoutArguments()
{
    QVERIFY(parse({QStringLiteral("status")}).type == Command::Type::Status);
    QVERIFY(parse({QStringLiteral("projects")}).type == Command::Type::Projects);
    QVERIFY(parse({QStringLiteral("tags")}).type == Command::Type::Tags);
    QVERIFY(parse({QStringLiteral("workspaces")}).type == Command::Type::Workspaces);
    QCOMPARE(Cloclify::commandNames().size(), 11);
}

void CommandLineTests::readsGlobalOptionsBeforeAndAfterCommand()
{
    auto command = parse({QStringLiteral("--debug"),
                          QStringLiteral("-w"),
                          QStringLiteral("Work"),
                          QStringLiteral("list"),
                          QStringLiteral("--color"),
                          QStringLiteral("never")});

    QVERIFY(command.type == Command::Type::List);
    QVERIFY(command.global.debug);
    QCOMPARE(command.global.workspace, QStringLiteral("Work"));
    QVERIFY(command.global.color == Cloclify::ColorMode::Never);

    command = parse({QStringLiteral("status"), QStringLiteral("--workspace"), QStringLiteral("ws1")});
    QCOMPARE(command.global.workspace, QStringLiteral("ws1"));
    QVERIFY(!command.global.debug);
    QVERIFY(!command.global.color);
}

void CommandLineTests::producesHelpAndVersion()
{
    auto command = parse({QStringLiteral("--help")});
    QVERIFY(command.type == Command::Type::Help);
    QVERIFY(command.text.startsWith(QStringLiteral("Usage: cloclify")));
    QVERIFY(command.text.contains(QStringLiteral("workspaces")));
    QVERIFY(command.text.contains(QStringLiteral("CLOCKIFY_API_KEY")));

    command = parse({QStringLiteral("start"), QStringLiteral("--help")});
    QVERIFY(command.type == Command::Type::Help);
    QVERIFY(command.text.startsWith(QStringLiteral("Usage: cloclify start")));
    QVERIFY(command.text.contains(QStringLiteral("--project")));

    // the span is not required when only asking for help
    command = parse({QStringLiteral("--help"), QStringLiteral("add")});
    QVERIFY(command.type == Command::Type::Help);
    QVERIFY(command.text.startsWith(QStringLiteral("Usage: cloclify add")));

    command = parse({QStringLiteral("--version")});
    QVERIFY(command.type == Command::Type::Version);
    QVERIFY(command.text.startsWith(QStringLiteral("cloclify ")));
}

void CommandLineTests::rejectsInvalidInput_data()
{
    QTest::addColumn<QStringList>("arguments");

    QTest::newRow("unknown command") << QStringList{QStringLiteral("begin")};
    QTest::newRow("unknown option") << QStringList{QStringLiteral("list"), QStringLiteral("--verbose")};
    QTest::newRow("unknown global option") << QStringList{QStringLiteral("--verbose")};
    QTest::newRow("bad color") << QStringList{QStringLiteral("--color"), QStringLiteral("rainbow")};
    QTest::newRow("two projects") << QStringList{QStringLiteral("start"), QStringLiteral("@A"), QStringLiteral("-p"), QStringLiteral("B")};
    QTest::newRow("two shorthand projects") << QStringList{QStringLiteral("start"), QStringLiteral("@A"), QStringLiteral("@B")};
    QTest::newRow("dollar with text") << QStringList{QStringLiteral("start"), QStringLiteral("$5")};
    QTest::newRow("bad start time") << QStringList{QStringLiteral("start"), QStringLiteral("--at"), QStringLiteral("noon")};
    QTest::newRow("stop with argument") << QStringList{QStringLiteral("stop"), QStringLiteral("now")};
    QTest::newRow("add without span") << QStringList{QStringLiteral("add")};
    QTest::newRow("add with description only") << QStringList{QStringLiteral("add"), QStringLiteral("meeting")};
    QTest::newRow("add ending before start") << QStringList{QStringLiteral("add"), QStringLiteral("10:00-9:00")};
    QTest::newRow("add with open start") << QStringList{QStringLiteral("add"), QStringLiteral("/-9:00")};
    QTest::newRow("add now on another day")
        << QStringList{QStringLiteral("add"), QStringLiteral("9:00-now"), QStringLiteral("-d"), QStringLiteral("yesterday")};
    QTest::newRow("add on unknown day")
        << QStringList{QStringLiteral("add"), QStringLiteral("9:00-10:00"), QStringLiteral("-d"), QStringLiteral("someday")};
    QTest::newRow("list date and range")
        << QStringList{QStringLiteral("list"), QStringLiteral("-d"), QStringLiteral("today"), QStringLiteral("--from"), QStringLiteral("monday")};
    QTest::newRow("list to without from") << QStringList{QStringLiteral("list"), QStringLiteral("--to"), QStringLiteral("today")};
    QTest::newRow("list reversed range")
        << QStringList{QStringLiteral("list"), QStringLiteral("--from"), QStringLiteral("2024-01-02"), QStringLiteral("--to"), QStringLiteral("2024-01-01")};
    QTest::newRow("list with argument") << QStringList{QStringLiteral("list"), QStringLiteral("today")};
    QTest::newRow("edit without id") << QStringList{QStringLiteral("edit")};
    QTest::newRow("edit without change") << QStringList{QStringLiteral("edit"), QStringLiteral("abc")};
    QTest::newRow("edit billable twice")
        << QStringList{QStringLiteral("edit"), QStringLiteral("abc"), QStringLiteral("-b"), QStringLiteral("--not-billable")};
    QTest::newRow("edit with bad time") << QStringList{QStringLiteral("edit"), QStringLiteral("abc"), QStringLiteral("--end"), QStringLiteral("now")};
    QTest::newRow("delete without id") << QStringList{QStringLiteral("delete")};
    QTest::newRow("delete two ids") << QStringList{QStringLiteral("delete"), QStringLiteral("a"), QStringLiteral("b")};
    QTest::newRow("dump without month") << QStringList{QStringLiteral("dump")};
    QTest::newRow("dump with bad month") << QStringList{QStringLiteral("dump"), QStringLiteral("february")};
    QTest::newRow("projects with argument") << QStringList{QStringLiteral("projects"), QStringLiteral("all")};
    QTest::newRow("option without value") << QStringList{QStringLiteral("start"), QStringLiteral("--project")};
}

void CommandLineTests::rejectsInvalidInput()
{
    QFETCH(QStringList, arguments);

    try
    {
        parse(arguments);
        QFAIL("expected a usage error");
    }
    catch (const Cloclify::UsageError &e)
    {
        QVERIFY(!e.message().isEmpty());
        QVERIFY(e.exitCode() == Cloclify::UsageFailure);
    }
}

QTEST_GUILESS_MAIN(CommandLineTests)
#include "test_command_line.moc"

#include "CommandLine.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QObject>

#include <algorithm>

#include "Errors.h"
#include "Utils.h"
#include "version.h"

using Cloclify::Command;
using Cloclify::UsageError;

namespace
{
    const QString programName{QStringLiteral("cloclify")};

    struct CommandInfo
    {
        QString name;
        Command::Type type;
        QString usage;
        QString summary;
    };

    const QVector<CommandInfo> &commandTable()
    {
        static const QVector<CommandInfo> table{
            {QStringLiteral("start"),
             Command::Type::Start,
             QStringLiteral("start [options] [description...]"),
             QObject::tr("Start a new running time entry.")},
            {QStringLiteral("stop"), Command::Type::Stop, QStringLiteral("stop [options]"), QObject::tr("Stop the running time entry.")},
            {QStringLiteral("add"),
             Command::Type::Add,
             QStringLiteral("add [options] <HH:MM-HH:MM> [description...]"),
             QObject::tr("Add a time entry for a span of time.")},
            {QStringLiteral("list"),
             Command::Type::List,
             QStringLiteral("list [options]"),
             QObject::tr("List the time entries of a day or a range of days.")},
            {QStringLiteral("edit"),
             Command::Type::Edit,
             QStringLiteral("edit [options] <id> [description...]"),
             QObject::tr("Change an existing time entry.")},
            {QStringLiteral("delete"), Command::Type::Delete, QStringLiteral("delete <id>"), QObject::tr("Delete a time entry.")},
            {QStringLiteral("status"), Command::Type::Status, QStringLiteral("status"), QObject::tr("Show the running time entry.")},
            {QStringLiteral("dump"),
             Command::Type::Dump,
             QStringLiteral("dump <YYYY-MM>"),
             QObject::tr("List the time entries of a month, day by day.")},
            {QStringLiteral("projects"), Command::Type::Projects, QStringLiteral("projects"), QObject::tr("List the projects of the workspace.")},
            {QStringLiteral("tags"), Command::Type::Tags, QStringLiteral("tags"), QObject::tr("List the tags of the workspace.")},
            {QStringLiteral("workspaces"), Command::Type::Workspaces, QStringLiteral("workspaces"), QObject::tr("List your workspaces.")},
        };

        return table;
    }

    struct GlobalOptionSet
    {
        QCommandLineOption debug{QStringLiteral("debug"), QObject::tr("Print debug information to the command line.")};
        QCommandLineOption workspace{QStringList{QStringLiteral("w"), QStringLiteral("workspace")},
                                     QObject::tr("Use this workspace instead of the configured one."),
                                     QStringLiteral("name|id")};
        QCommandLineOption color{QStringLiteral("color"),
                                 QObject::tr("When to color the output: auto, always or never."),
                                 QStringLiteral("when")};

        void addTo(QCommandLineParser &parser) const { parser.addOptions({debug, workspace, color}); }

        void read(const QCommandLineParser &parser, Cloclify::GlobalOptions &globals) const
        {
            if (parser.isSet(debug))
                globals.debug = true;

            if (parser.isSet(workspace))
            {
                globals.workspace = parser.value(workspace).trimmed();
                if (globals.workspace.isEmpty())
                    throw UsageError{QStringLiteral("--workspace needs a workspace name or id")};
            }

            if (parser.isSet(color))
            {
                auto mode = Cloclify::parseColorMode(parser.value(color));
                if (!mode)
                    throw UsageError{QStringLiteral("Invalid value '%1' for --color, expected auto, always or never")
                                         .arg(parser.value(color))};
                globals.color = mode;
            }
        }
    };

    // The words of a description with the @project, +tag and $ shorthands taken out.
    struct DescriptionWords
    {
        QString description;
        bool hasWords{false};
        QString project;
        QStringList tags;
        bool billable{false};
    };

    DescriptionWords splitDescription(const QStringList &words)
    {
        DescriptionWords result;
        QStringList plain;

        for (const auto &word : words)
        {
            if (word.size() > 1 && word.startsWith('@'))
            {
                if (!result.project.isEmpty())
                    throw UsageError{QStringLiteral("Only one project can be given, got '@%1' and '%2'").arg(result.project, word)};
                result.project = word.mid(1);
            }
            else if (word.size() > 1 && word.startsWith('+'))
                result.tags.append(word.mid(1));
            else if (word == QStringLiteral("$"))
                result.billable = true;
            else if (word.startsWith('$'))
                throw UsageError{QStringLiteral("'$' marks an entry as billable and cannot carry text, got '%1'").arg(word)};
            else
                plain.append(word);
        }

        result.description = plain.join(' ').trimmed();
        result.hasWords = !result.description.isEmpty();
        return result;
    }

    void applyEntryFields(Command &command,
                          const DescriptionWords &words,
                          const QCommandLineParser &parser,
                          const QCommandLineOption &project,
                          const QCommandLineOption &tag,
                          const QCommandLineOption &billable)
    {
        command.description = words.description;
        command.descriptionSet = words.hasWords;

        command.project = parser.value(project).trimmed();
        if (parser.isSet(project) && command.project.isEmpty())
            throw UsageError{QStringLiteral("--project needs a project name")};
        if (!words.project.isEmpty())
        {
            if (!command.project.isEmpty())
                throw UsageError{QStringLiteral("Only one project can be given, got '%1' and '@%2'").arg(command.project, words.project)};
            command.project = words.project;
        }

        for (const auto &name : parser.values(tag))
        {
            if (name.trimmed().isEmpty())
                throw UsageError{QStringLiteral("--tag needs a tag name")};
            command.tags.append(name.trimmed());
        }
        command.tags.append(words.tags);

        if (parser.isSet(billable) || words.billable)
            command.billable = true;
    }

    void expectNoArguments(const QStringList &positional)
    {
        if (!positional.isEmpty())
            throw UsageError{QStringLiteral("Unexpected argument '%1'").arg(positional.constFirst())};
    }

    QDate dateValue(const QCommandLineParser &parser, const QCommandLineOption &option, const QDate &today)
    {
        const auto text = parser.value(option);
        auto date = Cloclify::parseDate(text, today);
        if (!date)
            throw UsageError{QStringLiteral("Could not understand the date '%1', expected YYYY-MM-DD, today, yesterday, "
                                            "'N days ago' or a weekday")
                                 .arg(text)};
        return *date;
    }

    // --at for start and stop
    QDateTime atValue(const QCommandLineParser &parser, const QCommandLineOption &option, const QDateTime &now)
    {
        if (!parser.isSet(option))
            return now;

        const auto text = parser.value(option);
        auto token = Cloclify::parseTimeToken(text);
        if (!token || token->kind == Cloclify::TimeToken::Kind::Open)
            throw UsageError{QStringLiteral("Could not understand the time '%1', expected HH:MM or now").arg(text)};

        if (token->kind == Cloclify::TimeToken::Kind::Now)
            return now;
        return QDateTime{now.date(), token->time};
    }

    std::optional<QTime> clockValue(const QCommandLineParser &parser, const QCommandLineOption &option)
    {
        if (!parser.isSet(option))
            return std::nullopt;

        const auto text = parser.value(option);
        auto token = Cloclify::parseTimeToken(text);
        if (!token || token->kind != Cloclify::TimeToken::Kind::Clock)
            throw UsageError{QStringLiteral("Could not understand the time '%1', expected HH:MM").arg(text)};

        return token->time;
    }

    QString helpText(const QCommandLineParser &parser, const QString &usage)
    {
        // the first line names the binary, which is not what the user typed
        auto text = parser.helpText();
        return QStringLiteral("Usage: %1 %2").arg(programName, usage) + text.mid(text.indexOf('\n'));
    }

    QString overallHelp(const QCommandLineParser &parser)
    {
        auto text = helpText(parser, QStringLiteral("[options] [command] [command options]"));

        qsizetype width{0};
        for (const auto &info : commandTable())
            width = qMax(width, info.name.size());

        text += QStringLiteral("\nCommands:\n");
        for (const auto &info : commandTable())
            text += QStringLiteral("  %1  %2\n").arg(info.name.leftJustified(width), info.summary);

        text += QObject::tr("\nWithout a command, today's time entries are listed.\n"
                            "In descriptions, @name selects a project, +name adds a tag and a lone $ makes the entry "
                            "billable.\n"
                            "The API key is read from CLOCKIFY_API_KEY.\n");
        return text;
    }

    void parseStart(Command &command, QCommandLineParser &parser, const QStringList &arguments, const QDateTime &now)
    {
        QCommandLineOption project{QStringList{QStringLiteral("p"), QStringLiteral("project")},
                                   QObject::tr("Project name."),
                                   QStringLiteral("name")};
        QCommandLineOption tag{QStringList{QStringLiteral("t"), QStringLiteral("tag")},
                               QObject::tr("Tag name, may be repeated."),
                               QStringLiteral("name")};
        QCommandLineOption billable{QStringList{QStringLiteral("b"), QStringLiteral("billable")},
                                    QObject::tr("Mark the entry as billable.")};
        QCommandLineOption at{QStringLiteral("at"), QObject::tr("Start time instead of now."), QStringLiteral("HH:MM|now")};
        parser.addOptions({project, tag, billable, at});
        parser.addPositionalArgument(QStringLiteral("description"), QObject::tr("What you are working on."), QStringLiteral("[description...]"));

        if (!parser.parse(arguments))
            throw UsageError{parser.errorText()};
        if (parser.isSet(QStringLiteral("help")) || parser.isSet(QStringLiteral("version")))
            return;

        applyEntryFields(command, splitDescription(parser.positionalArguments()), parser, project, tag, billable);
        command.start = atValue(parser, at, now);
    }

    void parseStop(Command &command, QCommandLineParser &parser, const QStringList &arguments, const QDateTime &now)
    {
        QCommandLineOption at{QStringLiteral("at"), QObject::tr("End time instead of now."), QStringLiteral("HH:MM|now")};
        parser.addOption(at);

        if (!parser.parse(arguments))
            throw UsageError{parser.errorText()};
        if (parser.isSet(QStringLiteral("help")) || parser.isSet(QStringLiteral("version")))
            return;

        expectNoArguments(parser.positionalArguments());
        command.end = atValue(parser, at, now);
    }

    void parseAdd(Command &command, QCommandLineParser &parser, const QStringList &arguments, const QDateTime &now)
    {
        QCommandLineOption date{QStringList{QStringLiteral("d"), QStringLiteral("date")},
                                QObject::tr("Day of the entry, today if not given."),
                                QStringLiteral("date")};
        QCommandLineOption project{QStringList{QStringLiteral("p"), QStringLiteral("project")},
                                   QObject::tr("Project name."),
                                   QStringLiteral("name")};
        QCommandLineOption tag{QStringList{QStringLiteral("t"), QStringLiteral("tag")},
                               QObject::tr("Tag name, may be repeated."),
                               QStringLiteral("name")};
        QCommandLineOption billable{QStringList{QStringLiteral("b"), QStringLiteral("billable")},
                                    QObject::tr("Mark the entry as billable.")};
        parser.addOptions({date, project, tag, billable});
        parser.addPositionalArgument(QStringLiteral("span"),
                                     QObject::tr("Start and end, e.g. 9:00-12:30. Use / as end to leave the entry running."));
        parser.addPositionalArgument(QStringLiteral("description"), QObject::tr("What you worked on."), QStringLiteral("[description...]"));

        if (!parser.parse(arguments))
            throw UsageError{parser.errorText()};
        if (parser.isSet(QStringLiteral("help")) || parser.isSet(QStringLiteral("version")))
            return;

        auto positional = parser.positionalArguments();
        if (positional.isEmpty())
            throw UsageError{QStringLiteral("add needs a time span like 9:00-10:30")};

        const auto spanText = positional.takeFirst();
        auto span = Cloclify::looksLikeTimespan(spanText) ? Cloclify::parseTimespan(spanText) : std::nullopt;
        if (!span)
            throw UsageError{QStringLiteral("'%1' is not a time span like 9:00-10:30").arg(spanText)};

        const auto day = parser.isSet(date) ? dateValue(parser, date, now.date()) : now.date();
        auto resolve = [&](const Cloclify::TimeToken &token) -> QDateTime {
            switch (token.kind)
            {
            case Cloclify::TimeToken::Kind::Clock:
                return QDateTime{day, token.time};
            case Cloclify::TimeToken::Kind::Now:
                if (day != now.date())
                    throw UsageError{QStringLiteral("'now' can only be used for entries of today")};
                return now;
            case Cloclify::TimeToken::Kind::Open:
                return {};
            }

            Q_UNREACHABLE();
            return {};
        };

        if (span->first.kind == Cloclify::TimeToken::Kind::Open)
            throw UsageError{QStringLiteral("The start of '%1' cannot be left open").arg(spanText)};

        command.start = resolve(span->first);
        command.end = resolve(span->second);
        if (command.end.isValid() && command.end <= command.start)
            throw UsageError{QStringLiteral("The end of '%1' is not after its start").arg(spanText)};

        applyEntryFields(command, splitDescription(positional), parser, project, tag, billable);
    }

    void parseList(Command &command, QCommandLineParser &parser, const QStringList &arguments, const QDateTime &now)
    {
        QCommandLineOption date{QStringList{QStringLiteral("d"), QStringLiteral("date")},
                                QObject::tr("Day to list, today if not given."),
                                QStringLiteral("date")};
        QCommandLineOption from{QStringLiteral("from"), QObject::tr("First day of a range."), QStringLiteral("date")};
        QCommandLineOption to{QStringLiteral("to"), QObject::tr("Last day of a range, today if not given."), QStringLiteral("date")};
        parser.addOptions({date, from, to});

        if (!parser.parse(arguments))
            throw UsageError{parser.errorText()};
        if (parser.isSet(QStringLiteral("help")) || parser.isSet(QStringLiteral("version")))
            return;

        expectNoArguments(parser.positionalArguments());

        const auto today = now.date();
        if (parser.isSet(date) && (parser.isSet(from) || parser.isSet(to)))
            throw UsageError{QStringLiteral("--date cannot be combined with --from or --to")};
        if (parser.isSet(to) && !parser.isSet(from))
            throw UsageError{QStringLiteral("--to needs --from")};

        if (parser.isSet(date))
            command.from = command.to = dateValue(parser, date, today);
        else if (parser.isSet(from))
        {
            command.from = dateValue(parser, from, today);
            command.to = parser.isSet(to) ? dateValue(parser, to, today) : today;
        }
        else
            command.from = command.to = today;

        if (command.from > command.to)
            throw UsageError{QStringLiteral("The range starts on %1, after its end on %2")
                                 .arg(command.from.toString(Qt::ISODate), command.to.toString(Qt::ISODate))};
    }

    void parseEdit(Command &command, QCommandLineParser &parser, const QStringList &arguments, const QDateTime &now)
    {
        QCommandLineOption project{QStringList{QStringLiteral("p"), QStringLiteral("project")},
                                   QObject::tr("New project name."),
                                   QStringLiteral("name")};
        QCommandLineOption tag{QStringList{QStringLiteral("t"), QStringLiteral("tag")},
                               QObject::tr("Replace the tags, may be repeated."),
                               QStringLiteral("name")};
        QCommandLineOption billable{QStringList{QStringLiteral("b"), QStringLiteral("billable")},
                                    QObject::tr("Mark the entry as billable.")};
        QCommandLineOption notBillable{QStringLiteral("not-billable"), QObject::tr("Mark the entry as not billable.")};
        QCommandLineOption start{QStringLiteral("start"), QObject::tr("New start time."), QStringLiteral("HH:MM")};
        QCommandLineOption end{QStringLiteral("end"), QObject::tr("New end time."), QStringLiteral("HH:MM")};
        QCommandLineOption date{QStringList{QStringLiteral("d"), QStringLiteral("date")},
                                QObject::tr("Move the entry to this day."),
                                QStringLiteral("date")};
        parser.addOptions({project, tag, billable, notBillable, start, end, date});
        parser.addPositionalArgument(QStringLiteral("id"), QObject::tr("Id of the time entry, as shown by list."));
        parser.addPositionalArgument(QStringLiteral("description"), QObject::tr("New description."), QStringLiteral("[description...]"));

        if (!parser.parse(arguments))
            throw UsageError{parser.errorText()};
        if (parser.isSet(QStringLiteral("help")) || parser.isSet(QStringLiteral("version")))
            return;

        auto positional = parser.positionalArguments();
        if (positional.isEmpty())
            throw UsageError{QStringLiteral("edit needs the id of a time entry")};
        command.entryId = positional.takeFirst();

        if (parser.isSet(billable) && parser.isSet(notBillable))
            throw UsageError{QStringLiteral("--billable and --not-billable cannot be combined")};

        const auto words = splitDescription(positional);
        if (words.billable && parser.isSet(notBillable))
            throw UsageError{QStringLiteral("$ and --not-billable cannot be combined")};

        applyEntryFields(command, words, parser, project, tag, billable);
        if (parser.isSet(notBillable))
            command.billable = false;

        command.startTime = clockValue(parser, start);
        command.endTime = clockValue(parser, end);
        if (parser.isSet(date))
            command.editDate = dateValue(parser, date, now.date());

        if (!command.descriptionSet && command.project.isEmpty() && command.tags.isEmpty() && !command.billable
            && !command.startTime && !command.endTime && !command.editDate)
            throw UsageError{QStringLiteral("Nothing to change, give a description or one of the options")};
    }

    void parseSingleArgument(Command &command,
                             QCommandLineParser &parser,
                             const QStringList &arguments,
                             const QString &name,
                             const QString &description)
    {
        parser.addPositionalArgument(name, description);

        if (!parser.parse(arguments))
            throw UsageError{parser.errorText()};
        if (parser.isSet(QStringLiteral("help")) || parser.isSet(QStringLiteral("version")))
            return;

        const auto positional = parser.positionalArguments();
        if (positional.isEmpty())
            throw UsageError{QStringLiteral("%1 needs %2").arg(arguments.constFirst(), name)};
        if (positional.size() > 1)
            throw UsageError{QStringLiteral("Unexpected argument '%1'").arg(positional.at(1))};

        if (command.type == Command::Type::Delete)
        {
            command.entryId = positional.constFirst();
            return;
        }

        auto month = Cloclify::parseMonth(positional.constFirst());
        if (!month)
            throw UsageError{QStringLiteral("Could not understand the month '%1', expected YYYY-MM").arg(positional.constFirst())};
        command.from = *month;
        command.to = month->addMonths(1).addDays(-1);
    }

    void parseWithoutArguments(QCommandLineParser &parser, const QStringList &arguments)
    {
        if (!parser.parse(arguments))
            throw UsageError{parser.errorText()};
        if (parser.isSet(QStringLiteral("help")) || parser.isSet(QStringLiteral("version")))
            return;

        expectNoArguments(parser.positionalArguments());
    }

    QString versionText()
    {
        return QStringLiteral("%1 %2").arg(programName, QStringLiteral(CLOCLIFY_VERSION_STR));
    }
} // namespace

QStringList Cloclify::commandNames()
{
    QStringList names;
    for (const auto &info : commandTable())
        names.append(info.name);

    return names;
}

Command Cloclify::parseCommandLine(const QStringList &arguments, const QDateTime &now)
{
    const auto localNow = now.toLocalTime();
    const GlobalOptionSet globalOptions;

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Track your time on Clockify from the command line."));
    // everything after the command name belongs to the command
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    const auto help = parser.addHelpOption();
    const auto version = parser.addVersionOption();
    globalOptions.addTo(parser);

    if (!parser.parse(QStringList{programName} + arguments))
        throw UsageError{parser.errorText()};

    Command command;
    globalOptions.read(parser, command.global);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty())
    {
        if (parser.isSet(help))
        {
            command.type = Command::Type::Help;
            command.text = overallHelp(parser);
        }
        else if (parser.isSet(version))
        {
            command.type = Command::Type::Version;
            command.text = versionText();
        }
        else
            command.from = command.to = localNow.date();

        return command;
    }

    const auto &name = positional.constFirst();
    auto info = std::find_if(commandTable().cbegin(), commandTable().cend(), [&name](const CommandInfo &i) {
        return i.name == name;
    });
    if (info == commandTable().cend())
        throw UsageError{QStringLiteral("Unknown command '%1', run '%2 --help' for a list of commands").arg(name, programName)};

    command.type = info->type;

    QCommandLineParser commandParser;
    commandParser.setApplicationDescription(info->summary);
    const auto commandHelp = commandParser.addHelpOption();
    const auto commandVersion = commandParser.addVersionOption();
    globalOptions.addTo(commandParser);

    // the command name takes the place of the program name; a global --help asks for the command's help
    auto commandArguments = positional;
    if (parser.isSet(help))
        commandArguments.insert(1, QStringLiteral("--help"));
    else if (parser.isSet(version))
        commandArguments.insert(1, QStringLiteral("--version"));

    switch (command.type)
    {
    case Command::Type::Start:
        parseStart(command, commandParser, commandArguments, localNow);
        break;
    case Command::Type::Stop:
        parseStop(command, commandParser, commandArguments, localNow);
        break;
    case Command::Type::Add:
        parseAdd(command, commandParser, commandArguments, localNow);
        break;
    case Command::Type::List:
        parseList(command, commandParser, commandArguments, localNow);
        break;
    case Command::Type::Edit:
        parseEdit(command, commandParser, commandArguments, localNow);
        break;
    case Command::Type::Delete:
        parseSingleArgument(command, commandParser, commandArguments, QStringLiteral("id"), QObject::tr("Id of the time entry."));
        break;
    case Command::Type::Dump:
        parseSingleArgument(command, commandParser, commandArguments, QStringLiteral("month"), QObject::tr("Month as YYYY-MM."));
        break;
    case Command::Type::Status:
    case Command::Type::Projects:
    case Command::Type::Tags:
    case Command::Type::Workspaces:
        parseWithoutArguments(commandParser, commandArguments);
        break;
    case Command::Type::Help:
    case Command::Type::Version:
        Q_UNREACHABLE();
        break;
    }

    globalOptions.read(commandParser, command.global);

    if (commandParser.isSet(commandHelp))
    {
        command.type = Command::Type::Help;
        command.text = helpText(commandParser, info->usage);
    }
    else if (commandParser.isSet(commandVersion))
    {
        command.type = Command::Type::Version;
        command.text = versionText();
    }

    return command;
}

#include <QtTest/QtTest>

#include <QNetworkProxy>

#include "ClockifyManager.h"
#include "Errors.h"
#include "Logger.h"
#include "MockClockifyServer.h"

#include <ctime>
#include <memory>

namespace
{
    QDateTime utc(const char *timestamp)
    {
        return QDateTime::fromString(QString::fromLatin1(timestamp), Qt::ISODate);
    }

    json entryJson(const char *id, const char *description, const char *start, const char *end, const char *projectId = nullptr)
    {
        json j{{"id", id},
               {"description", description},
               {"billable", false},
               {"userId", "u1"},
               {"workspaceId", "ws1"},
               {"tagIds", json::array()},
               {"timeInterval", {{"start", start}, {"end", end ? json(end) : json(nullptr)}}}};
        j["projectId"] = projectId ? json(projectId) : json(nullptr);
        return j;
    }

    const json projects = json::array({{{"id", "p1"}, {"name", "Project X"}, {"color", "#03A9F4"}, {"archived", false}},
                                       {{"id", "p2"}, {"name", "Internal"}, {"color", "#000000"}, {"archived", false}},
                                       {{"id", "p3"}, {"name", "internal"}, {"color", "#000000"}, {"archived", true}}});
    const json tags = json::array({{{"id", "t1"}, {"name", "dev"}}, {{"id", "t2"}, {"name", "meeting"}}});
} // namespace

class ClockifyManagerTests : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();

    void sendsApiKeyAndReadsOwner();
    void createsEntry();
    void stopsRunningEntry();
    void readsRunningEntry();
    void listsEntriesInServiceOrder();
    void modifiesAndDeletesEntry();
    void resolvesNamesOnce();
    void decodesReferencesWithoutRequests();
    void resolvesReferences();
    void keepsIdsWhenListsFail();
    void reportsAuthenticationFailure();
    void reportsServiceMessage();
    void reportsMalformedResponses_data();
    void reportsMalformedResponses();
    void reportsUnreachableHost();
    void reportsTimeout();

private:
    std::unique_ptr<MockClockifyServer> m_server;
    std::unique_ptr<ClockifyManager> m_manager;
};

void ClockifyManagerTests::initTestCase()
{
    qputenv("TZ", "UTC");
    tzset();
    QStandardPaths::setTestModeEnabled(true);
    Cloclify::logs::init(false);
    QNetworkProxy::setApplicationProxy(QNetworkProxy::NoProxy);
}

void ClockifyManagerTests::init()
{
    m_manager.reset();
    m_server = std::make_unique<MockClockifyServer>();
    QVERIFY(m_server->listen());

    m_server->setJsonResponse("GET", QStringLiteral("/workspaces/ws1/projects"), projects);
    m_server->setJsonResponse("GET", QStringLiteral("/workspaces/ws1/tags"), tags);

    m_manager = std::make_unique<ClockifyManager>(QByteArrayLiteral("secret-key"), m_server->baseUrl());
    m_manager->setLogger(Cloclify::logs::network());
    m_manager->setWorkspaceId(QStringLiteral("ws1"));
}

void ClockifyManagerTests::sendsApiKeyAndReadsOwner()
{
    m_server->setJsonResponse("GET",
                              QStringLiteral("/user"),
                              {{"id", "u1"},
                               {"name", "Ada"},
                               {"email", "ada@example.com"},
                               {"activeWorkspace", "ws1"},
                               {"defaultWorkspace", "ws0"}});

    auto user = m_manager->getApiKeyOwner();
    QCOMPARE(user.userId(), QStringLiteral("u1"));
    QCOMPARE(user.name(), QStringLiteral("Ada"));
    QCOMPARE(user.activeWorkspaceId(), QStringLiteral("ws1"));
    QCOMPARE(user.defaultWorkspaceId(), QStringLiteral("ws0"));

    QCOMPARE(m_server->requests().size(), 1);
    const auto &request = m_server->requests().constFirst();
    QCOMPARE(request.headers.value("x-api-key"), QByteArrayLiteral("secret-key"));
    QCOMPARE(request.headers.value("accept"), QByteArrayLiteral("application/json"));
    QCOMPARE(request.headers.value("content-type"), QByteArrayLiteral("application/json"));
}

void ClockifyManagerTests::createsEntry()
{
    m_server->setJsonResponse("POST",
                              QStringLiteral("/workspaces/ws1/time-entries"),
                              entryJson("e1", "writing spec", "2024-01-01T10:00:00Z", nullptr, "p1"),
                              201);

    TimeEntry entry{QString{},
                    QStringLiteral("writing spec"),
                    QDateTime{QDate{2024, 1, 1}, QTime{10, 0}},
                    QDateTime{},
                    *m_manager->projectByName(QStringLiteral("Project X")),
                    {*m_manager->tagByName(QStringLiteral("dev"))},
                    true};
    auto created = m_manager->createTimeEntry(entry);

    QCOMPARE(created.id(), QStringLiteral("e1"));
    QVERIFY(created.running());
    QCOMPARE(created.project().id(), QStringLiteral("p1"));
    QCOMPARE(created.start(), utc("2024-01-01T10:00:00Z"));
    // the name lookups above were the only list requests
    QCOMPARE(m_server->requests().size(), 3);

    auto posts = m_server->requestsTo("POST", QStringLiteral("/workspaces/ws1/time-entries"));
    QCOMPARE(posts.size(), 1);
    auto body = posts.constFirst().bodyJson();
    QCOMPARE(body["start"].get<std::string>(), std::string{"2024-01-01T10:00:00Z"});
    QVERIFY(!body.contains("end"));
    QCOMPARE(body["description"].get<std::string>(), std::string{"writing spec"});
    QCOMPARE(body["billable"].get<bool>(), true);
    QCOMPARE(body["projectId"].get<std::string>(), std::string{"p1"});
    QVERIFY(body["tagIds"] == json::array({"t1"}));
}

void ClockifyManagerTests::stopsRunningEntry()
{
    m_server->setJsonResponse("PATCH",
                              QStringLiteral("/workspaces/ws1/user/u1/time-entries"),
                              entryJson("e1", "writing", "2024-01-01T10:00:00Z", "2024-01-01T11:30:00Z"));

    auto stopped = m_manager->stopRunningTimeEntry(QStringLiteral("u1"), utc("2024-01-01T11:30:00Z"));
    QVERIFY(!stopped.running());
    QCOMPARE(stopped.duration({}), qint64{90 * 60 * 1000});

    auto patches = m_server->requestsTo("PATCH", QStringLiteral("/workspaces/ws1/user/u1/time-entries"));
    QCOMPARE(patches.size(), 1);
    QVERIFY(patches.constFirst().bodyJson() == json({{"end", "2024-01-01T11:30:00Z"}}));
}

void ClockifyManagerTests::readsRunningEntry()
{
    m_server->setJsonResponse("GET", QStringLiteral("/workspaces/ws1/user/u1/time-entries"), json::array());
    QVERIFY(!m_manager->getRunningTimeEntry(QStringLiteral("u1")));
    QCOMPARE(m_server->requests().constFirst().query.queryItemValue(QStringLiteral("in-progress")), QStringLiteral("true"));

    m_server->setJsonResponse("GET",
                              QStringLiteral("/workspaces/ws1/user/u1/time-entries"),
                              json::array({entryJson("e1", "writing", "2024-01-01T10:00:00Z", nullptr)}));
    auto running = m_manager->getRunningTimeEntry(QStringLiteral("u1"));
    QVERIFY(running);
    QVERIFY(running->running());
    QCOMPARE(running->description(), QStringLiteral("writing"));
}

void ClockifyManagerTests::listsEntriesInServiceOrder()
{
    m_server->setJsonResponse("GET",
                              QStringLiteral("/workspaces/ws1/user/u1/time-entries"),
                              json::array({entryJson("late", "b", "2024-01-02T15:00:00Z", "2024-01-02T16:00:00Z"),
                                           entryJson("early", "a", "2024-01-01T08:00:00Z", "2024-01-01T09:00:00Z")}));
    m_manager->setPageSize(50);

    auto entries = m_manager->getTimeEntries(QStringLiteral("u1"), utc("2024-01-01T00:00:00Z"), utc("2024-01-03T00:00:00Z"));
    QCOMPARE(entries.size(), 2);
    QCOMPARE(entries[0].id(), QStringLiteral("late"));
    QCOMPARE(entries[1].id(), QStringLiteral("early"));

    const auto &query = m_server->requests().constFirst().query;
    QCOMPARE(query.queryItemValue(QStringLiteral("start")), QStringLiteral("2024-01-01T00:00:00Z"));
    QCOMPARE(query.queryItemValue(QStringLiteral("end")), QStringLiteral("2024-01-03T00:00:00Z"));
    QCOMPARE(query.queryItemValue(QStringLiteral("page-size")), QStringLiteral("50"));
}

void ClockifyManagerTests::modifiesAndDeletesEntry()
{
    m_server->setJsonResponse("GET",
                              QStringLiteral("/workspaces/ws1/time-entries/e1"),
                              entryJson("e1", "old", "2024-01-01T08:00:00Z", "2024-01-01T09:00:00Z"));
    m_server->setJsonResponse("PUT",
                              QStringLiteral("/workspaces/ws1/time-entries/e1"),
                              entryJson("e1", "new", "2024-01-01T08:00:00Z", "2024-01-01T09:00:00Z"));
    m_server->setResponse("DELETE", QStringLiteral("/workspaces/ws1/time-entries/e1"), 204, {});

    auto entry = m_manager->getTimeEntry(QStringLiteral("e1"));
    entry.setDescription(QStringLiteral("new"));
    auto updated = m_manager->modifyTimeEntry(entry);
    QCOMPARE(updated.description(), QStringLiteral("new"));

    auto puts = m_server->requestsTo("PUT", QStringLiteral("/workspaces/ws1/time-entries/e1"));
    QCOMPARE(puts.size(), 1);
    auto body = puts.constFirst().bodyJson();
    QCOMPARE(body["description"].get<std::string>(), std::string{"new"});
    QCOMPARE(body["end"].get<std::string>(), std::string{"2024-01-01T09:00:00Z"});
    QVERIFY(body["projectId"].is_null());

    m_manager->deleteTimeEntry(QStringLiteral("e1"));
    QCOMPARE(m_server->requestsTo("DELETE", QStringLiteral("/workspaces/ws1/time-entries/e1")).size(), 1);
}

void ClockifyManagerTests::resolvesNamesOnce()
{
    QVERIFY(m_manager->projectByName(QStringLiteral("Project X")));
    QVERIFY(m_manager->projectByName(QStringLiteral("project x")));
    // "Internal" matches exactly even though "internal" exists as well
    QCOMPARE(m_manager->projectByName(QStringLiteral("Internal"))->id(), QStringLiteral("p2"));
    // two case-insensitive matches are ambiguous
    QVERIFY(!m_manager->projectByName(QStringLiteral("INTERNAL")));
    QVERIFY(!m_manager->projectByName(QStringLiteral("Unknown")));
    QCOMPARE(m_manager->tagByName(QStringLiteral("Meeting"))->id(), QStringLiteral("t2"));

    QCOMPARE(m_server->requestsTo("GET", QStringLiteral("/workspaces/ws1/projects")).size(), 1);
    QCOMPARE(m_server->requestsTo("GET", QStringLiteral("/workspaces/ws1/tags")).size(), 1);
    QCOMPARE(m_server->requests().constFirst().query.queryItemValue(QStringLiteral("page-size")), QStringLiteral("1000"));
}

void ClockifyManagerTests::decodesReferencesWithoutRequests()
{
    auto raw = entryJson("e1", "", "2024-01-01T08:00:00Z", "2024-01-01T09:00:00Z", "p1");
    raw["tagIds"] = json::array({"t1"});
    m_server->setJsonResponse("PATCH", QStringLiteral("/workspaces/ws1/user/u1/time-entries"), raw);

    auto entry = m_manager->stopRunningTimeEntry(QStringLiteral("u1"), utc("2024-01-01T09:00:00Z"));
    QCOMPARE(entry.project().id(), QStringLiteral("p1"));
    QCOMPARE(entry.tags().size(), 1);
    QCOMPARE(entry.tags()[0].id(), QStringLiteral("t1"));

    QCOMPARE(m_server->requests().size(), 1);
}

void ClockifyManagerTests::resolvesReferences()
{
    auto raw = entryJson("e1", "", "2024-01-01T08:00:00Z", nullptr, "gone");
    raw["tagIds"] = json::array({"t1", "t9"});
    m_server->setJsonResponse("GET", QStringLiteral("/workspaces/ws1/time-entries/e1"), raw);

    auto entry = m_manager->getTimeEntry(QStringLiteral("e1"));
    m_manager->resolveReferences(entry);
    QCOMPARE(entry.project().name(), QStringLiteral("gone"));
    QVERIFY(entry.project().color().isEmpty());
    QCOMPARE(entry.tags().size(), 2);
    QCOMPARE(entry.tags()[0].name(), QStringLiteral("dev"));
    QCOMPARE(entry.tags()[1].name(), QStringLiteral("t9"));

    raw["projectId"] = "p1";
    m_server->setJsonResponse("GET", QStringLiteral("/workspaces/ws1/time-entries/e1"), raw);
    entry = m_manager->getTimeEntry(QStringLiteral("e1"));
    m_manager->resolveReferences(entry);
    QCOMPARE(entry.project().name(), QStringLiteral("Project X"));
    QCOMPARE(entry.project().color(), QStringLiteral("#03A9F4"));

    // both lists come from the cache the second time
    QCOMPARE(m_server->requestsTo("GET", QStringLiteral("/workspaces/ws1/projects")).size(), 1);
    QCOMPARE(m_server->requestsTo("GET", QStringLiteral("/workspaces/ws1/tags")).size(), 1);
}

void ClockifyManagerTests::keepsIdsWhenListsFail()
{
    m_server->setResponse("GET", QStringLiteral("/workspaces/ws1/projects"), 500, R"({"message":"try later"})");
    m_server->setResponse("GET", QStringLiteral("/workspaces/ws1/tags"), 200, "not json");

    TimeEntry entry{QStringLiteral("e1"),
                    QString{},
                    utc("2024-01-01T08:00:00Z"),
                    QDateTime{},
                    Project{QStringLiteral("p1"), QStringLiteral("p1")},
                    {Tag{QStringLiteral("t1"), QStringLiteral("t1")}},
                    false};
    m_manager->resolveReferences(entry);
    QCOMPARE(entry.project().name(), QStringLiteral("p1"));
    QCOMPARE(entry.tags()[0].name(), QStringLiteral("t1"));

    // a failed list is not requested again
    m_manager->resolveReferences(entry);
    QCOMPARE(m_server->requestsTo("GET", QStringLiteral("/workspaces/ws1/projects")).size(), 1);
    QCOMPARE(m_server->requestsTo("GET", QStringLiteral("/workspaces/ws1/tags")).size(), 1);
}

void ClockifyManagerTests::reportsAuthenticationFailure()
{
    m_server->setResponse("GET", QStringLiteral("/user"), 401, R"({"message":"Full authentication is required","code":401})");

    try
    {
        m_manager->getApiKeyOwner();
        QFAIL("expected an API error");
    }
    catch (const Cloclify::ApiError &e)
    {
        QCOMPARE(e.status(), 401);
        QVERIFY(e.isAuthenticationFailure());
        QVERIFY(e.message().contains(QStringLiteral("Authentication failed")));
        QVERIFY(e.message().contains(QStringLiteral("CLOCKIFY_API_KEY")));
        QVERIFY(e.exitCode() == Cloclify::ApiFailure);
    }
}

void ClockifyManagerTests::reportsServiceMessage()
{
    m_server->setResponse("POST",
                          QStringLiteral("/workspaces/ws1/time-entries"),
                          400,
                          R"({"message":"Time entry overlaps with a running entry","code":501})");

    try
    {
        m_manager->createTimeEntry(TimeEntry{QString{}, QStringLiteral("x"), utc("2024-01-01T10:00:00Z"), {}, {}, {}, false});
        QFAIL("expected an API error");
    }
    catch (const Cloclify::ApiError &e)
    {
        QCOMPARE(e.status(), 400);
        QCOMPARE(e.method(), QStringLiteral("POST"));
        QVERIFY(e.path().endsWith(QStringLiteral("/workspaces/ws1/time-entries")));
        QVERIFY(e.message().contains(QStringLiteral("Time entry overlaps with a running entry")));
    }
}

void ClockifyManagerTests::reportsMalformedResponses_data()
{
    QTest::addColumn<QByteArray>("body");

    QTest::newRow("not json") << QByteArray{"<html>oops</html>"};
    QTest::newRow("missing interval") << QByteArray{R"({"id":"e1","description":"x"})"};
    QTest::newRow("bad timestamp") << QByteArray{R"({"id":"e1","timeInterval":{"start":"yesterday"}})"};
    QTest::newRow("wrong type") << QByteArray{R"({"id":42,"timeInterval":{"start":"2024-01-01T10:00:00Z"}})"};
}

void ClockifyManagerTests::reportsMalformedResponses()
{
    QFETCH(QByteArray, body);
    m_server->setResponse("GET", QStringLiteral("/workspaces/ws1/time-entries/e1"), 200, body);

    try
    {
        m_manager->getTimeEntry(QStringLiteral("e1"));
        QFAIL("expected an API error");
    }
    catch (const Cloclify::ApiError &e)
    {
        QCOMPARE(e.status(), 200);
        QVERIFY(e.message().contains(QStringLiteral("unreadable response")));
    }
}

void ClockifyManagerTests::reportsUnreachableHost()
{
    QString url;
    {
        MockClockifyServer closed;
        QVERIFY(closed.listen());
        url = closed.baseUrl();
    }

    ClockifyManager manager{QByteArrayLiteral("secret-key"), url};
    try
    {
        manager.getApiKeyOwner();
        QFAIL("expected a network error");
    }
    catch (const Cloclify::NetworkError &e)
    {
        QVERIFY(e.exitCode() == Cloclify::NetworkFailure);
        QVERIFY(e.message().contains(QStringLiteral("127.0.0.1")));
    }
}

void ClockifyManagerTests::reportsTimeout()
{
    m_server->setSilent("GET", QStringLiteral("/user"));
    m_manager->setTransferTimeout(300);

    try
    {
        m_manager->getApiKeyOwner();
        QFAIL("expected a network error");
    }
    catch (const Cloclify::NetworkError &e)
    {
        QVERIFY2(e.message().contains(QStringLiteral("timed out")), qPrintable(e.message()));
    }
}

QTEST_GUILESS_MAIN(ClockifyManagerTests)
#include "test_clockify_manager.moc"

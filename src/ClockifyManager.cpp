#include "ClockifyManager.h"

#include <QUrlQuery>

#include <stdexcept>

namespace
{
    // Clockify sends null for a number of optional string fields.
    QString stringOrEmpty(const json &j, const char *key)
    {
        if (!j.contains(key) || j[key].is_null())
            return {};
        return j[key].get<QString>();
    }
} // namespace

ClockifyManager::ClockifyManager(const QByteArray &apiKey, const QString &baseUrl, QObject *parent)
    : AbstractTimeServiceManager{apiKey, parent},
      m_baseUrl{baseUrl.endsWith('/') ? baseUrl.chopped(1) : baseUrl}
{
    callInitVirtualMethods();
}

QUrl ClockifyManager::createTimeEntryUrl(const QString &workspaceId) const
{
    return {apiBaseUrl() + "/workspaces/" + workspaceId + "/time-entries"};
}

QUrl ClockifyManager::runningTimeEntryUrl(const QString &userId, const QString &workspaceId) const
{
    QUrl url{apiBaseUrl() + "/workspaces/" + workspaceId + "/user/" + userId + "/time-entries"};
    QUrlQuery q;
    q.addQueryItem(QStringLiteral("in-progress"), QStringLiteral("true"));
    url.setQuery(q);
    return url;
}

QUrl ClockifyManager::stopTimeEntryUrl(const QString &userId, const QString &workspaceId) const
{
    return {apiBaseUrl() + "/workspaces/" + workspaceId + "/user/" + userId + "/time-entries"};
}

QUrl ClockifyManager::timeEntryUrl(const QString &workspaceId, const QString &timeEntryId) const
{
    return {apiBaseUrl() + "/workspaces/" + workspaceId + "/time-entries/" + timeEntryId};
}

QUrl ClockifyManager::timeEntriesUrl(const QString &userId,
                                     const QString &workspaceId,
                                     const QDateTime &start,
                                     const QDateTime &end) const
{
    QUrl url{apiBaseUrl() + "/workspaces/" + workspaceId + "/user/" + userId + "/time-entries"};
    QUrlQuery q;
    q.addQueryItem(QStringLiteral("start"), json(start).get<QString>());
    q.addQueryItem(QStringLiteral("end"), json(end).get<QString>());
    q.addQueryItem(QStringLiteral("page-size"), QString::number(pageSize()));
    url.setQuery(q);
    return url;
}

QUrl ClockifyManager::currentUserUrl() const
{
    return {apiBaseUrl() + "/user"};
}

QUrl ClockifyManager::workspacesUrl() const
{
    return {apiBaseUrl() + "/workspaces"};
}

QUrl ClockifyManager::projectsUrl(const QString &workspaceId) const
{
    QUrl url{apiBaseUrl() + "/workspaces/" + workspaceId + "/projects"};
    QUrlQuery q;
    q.addQueryItem(QStringLiteral("page-size"), QString::number(pageSize()));
    url.setQuery(q);
    return url;
}

QUrl ClockifyManager::tagsUrl(const QString &workspaceId) const
{
    QUrl url{apiBaseUrl() + "/workspaces/" + workspaceId + "/tags"};
    QUrlQuery q;
    q.addQueryItem(QStringLiteral("page-size"), QString::number(pageSize()));
    url.setQuery(q);
    return url;
}

TimeEntry ClockifyManager::jsonToTimeEntry(const json &j)
{
    // only the ids are known here, resolveReferences() fills in the names
    Project project;
    if (auto projectId = stringOrEmpty(j, "projectId"); !projectId.isEmpty())
        project = Project{projectId, projectId};

    QVector<Tag> tags;
    if (j.contains("tagIds") && j["tagIds"].is_array())
        for (const auto &tagId : j["tagIds"])
        {
            auto id = tagId.get<QString>();
            tags.append(Tag{id, id});
        }

    const auto &interval = j.at("timeInterval");
    auto start = interval.at("start").get<QDateTime>();
    if (!start.isValid())
        throw std::invalid_argument{"timeInterval.start is not a timestamp"};
    QDateTime end;
    if (interval.contains("end") && !interval["end"].is_null())
    {
        end = interval["end"].get<QDateTime>();
        if (!end.isValid())
            throw std::invalid_argument{"timeInterval.end is not a timestamp"};
    }

    return TimeEntry{j.at("id").get<QString>(),
                     stringOrEmpty(j, "description"),
                     start,
                     end,
                     project,
                     tags,
                     j.value("billable", false),
                     stringOrEmpty(j, "userId"),
                     stringOrEmpty(j, "workspaceId")};
}

User ClockifyManager::jsonToUser(const json &j)
{
    return User{j.at("id").get<QString>(),
                stringOrEmpty(j, "name"),
                stringOrEmpty(j, "email"),
                stringOrEmpty(j, "activeWorkspace"),
                stringOrEmpty(j, "defaultWorkspace")};
}

Workspace ClockifyManager::jsonToWorkspace(const json &j)
{
    return Workspace{j.at("id").get<QString>(), j.at("name").get<QString>()};
}

Project ClockifyManager::jsonToProject(const json &j)
{
    return Project{j.at("id").get<QString>(), j.at("name").get<QString>(), stringOrEmpty(j, "color"), j.value("archived", false)};
}

Tag ClockifyManager::jsonToTag(const json &j)
{
    return Tag{j.at("id").get<QString>(), j.at("name").get<QString>(), j.value("archived", false)};
}

json ClockifyManager::timeEntryToJson(const TimeEntry &t, TimeEntryAction action)
{
    json j;
    switch (action)
    {
    case TimeEntryAction::StopTimeEntry:
        j["end"] = t.end();
        return j;
    case TimeEntryAction::GetRunningTimeEntry:
    case TimeEntryAction::GetTimeEntry:
    case TimeEntryAction::DeleteTimeEntry:
        return {};
    case TimeEntryAction::CreateTimeEntry:
    case TimeEntryAction::ModifyTimeEntry:
        break;
    }

    j["start"] = t.start();
    if (!t.running())
        j["end"] = t.end();
    j["description"] = t.description();
    j["billable"] = t.billable();
    if (t.project().isValid())
        j["projectId"] = t.project().id();
    else
        j["projectId"] = nullptr;

    j["tagIds"] = json::array();
    for (const auto &tag : t.tags())
        j["tagIds"].push_back(tag.id());

    return j;
}

QString ClockifyManager::jsonToErrorMessage(const json &j) const
{
    if (j.is_object() && j.contains("message") && j["message"].is_string())
        return j["message"].get<QString>();
    return {};
}

AbstractTimeServiceManager::HttpVerb ClockifyManager::httpVerbForAction(const TimeEntryAction action) const
{
    switch (action)
    {
    case TimeEntryAction::GetRunningTimeEntry:
    case TimeEntryAction::GetTimeEntry:
        return HttpVerb::Get;
    case TimeEntryAction::CreateTimeEntry:
        return HttpVerb::Post;
    case TimeEntryAction::StopTimeEntry:
        return HttpVerb::Patch;
    case TimeEntryAction::ModifyTimeEntry:
        return HttpVerb::Put;
    case TimeEntryAction::DeleteTimeEntry:
        return HttpVerb::Delete;
    default:
        logger()->error("Unhandled time entry action: {}:{}", __FILE__, __LINE__);
        Q_UNREACHABLE();
        return HttpVerb::Get;
    }
}

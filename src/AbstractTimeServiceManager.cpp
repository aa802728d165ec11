#include "AbstractTimeServiceManager.h"

#include <QEventLoop>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QScopedPointer>

#include <algorithm>
#include <stdexcept>

#include "Errors.h"

using Cloclify::ApiError;
using Cloclify::NetworkError;

AbstractTimeServiceManager::AbstractTimeServiceManager(const QByteArray &apiKey, QObject *parent)
    : QObject{parent},
      m_apiKey{apiKey}
{}

QVector<Project> &AbstractTimeServiceManager::projects()
{
    if (!m_projects)
        m_projects = listFromReply<Project>(httpRequest(HttpVerb::Get, projectsUrl(m_workspaceId)),
                                            [this](const json &j) { return jsonToProject(j); });

    return *m_projects;
}

QVector<Tag> &AbstractTimeServiceManager::tags()
{
    if (!m_tags)
        m_tags = listFromReply<Tag>(httpRequest(HttpVerb::Get, tagsUrl(m_workspaceId)),
                                    [this](const json &j) { return jsonToTag(j); });

    return *m_tags;
}

QVector<Workspace> &AbstractTimeServiceManager::workspaces()
{
    if (!m_workspaces)
        m_workspaces = listFromReply<Workspace>(httpRequest(HttpVerb::Get, workspacesUrl()),
                                                [this](const json &j) { return jsonToWorkspace(j); });

    return *m_workspaces;
}

std::optional<Project> AbstractTimeServiceManager::projectByName(const QString &name)
{
    std::optional<Project> caseInsensitiveMatch;
    int caseInsensitiveMatches{0};

    for (const auto &item : projects())
    {
        if (item.name() == name)
            return item;
        if (item.name().compare(name, Qt::CaseInsensitive) == 0)
        {
            caseInsensitiveMatch = item;
            ++caseInsensitiveMatches;
        }
    }

    return caseInsensitiveMatches == 1 ? caseInsensitiveMatch : std::nullopt;
}

std::optional<Tag> AbstractTimeServiceManager::tagByName(const QString &name)
{
    std::optional<Tag> caseInsensitiveMatch;
    int caseInsensitiveMatches{0};

    for (const auto &item : tags())
    {
        if (item.name() == name)
            return item;
        if (item.name().compare(name, Qt::CaseInsensitive) == 0)
        {
            caseInsensitiveMatch = item;
            ++caseInsensitiveMatches;
        }
    }

    return caseInsensitiveMatches == 1 ? caseInsensitiveMatch : std::nullopt;
}

void AbstractTimeServiceManager::resolveReferences(TimeEntry &t)
{
    if (t.project().isValid())
        if (const auto *known = projectsIfAvailable())
        {
            const auto project = t.project();
            if (auto match = std::find(known->cbegin(), known->cend(), project); match != known->cend())
                t.setProject(*match);
            else
                logger()->warn("Time entry {} references unknown project {}", t.id().toStdString(), project.id().toStdString());
        }

    if (!t.tags().isEmpty())
        if (const auto *known = tagsIfAvailable())
        {
            auto tags = t.tags();
            for (auto &tag : tags)
            {
                if (auto match = std::find(known->cbegin(), known->cend(), tag); match != known->cend())
                    tag = *match;
                else
                    logger()->warn("Time entry {} references unknown tag {}", t.id().toStdString(), tag.id().toStdString());
            }
            t.setTags(tags);
        }
}

User AbstractTimeServiceManager::getApiKeyOwner()
{
    return fromReply<User>(httpRequest(HttpVerb::Get, currentUserUrl()), [this](const json &j) { return jsonToUser(j); });
}

TimeEntry AbstractTimeServiceManager::createTimeEntry(const TimeEntry &t)
{
    auto reply = timeEntryReq(createTimeEntryUrl(m_workspaceId),
                              TimeEntryAction::CreateTimeEntry,
                              timeEntryToJson(t, TimeEntryAction::CreateTimeEntry));
    return fromReply<TimeEntry>(reply, [this](const json &j) { return jsonToTimeEntry(j); });
}

TimeEntry AbstractTimeServiceManager::stopRunningTimeEntry(const QString &userId, const QDateTime &end)
{
    TimeEntry t;
    t.setEnd(end);
    auto reply = timeEntryReq(stopTimeEntryUrl(userId, m_workspaceId),
                              TimeEntryAction::StopTimeEntry,
                              timeEntryToJson(t, TimeEntryAction::StopTimeEntry));
    return fromReply<TimeEntry>(reply, [this](const json &j) { return jsonToTimeEntry(j); });
}

std::optional<TimeEntry> AbstractTimeServiceManager::getRunningTimeEntry(const QString &userId)
{
    auto reply = timeEntryReq(runningTimeEntryUrl(userId, m_workspaceId), TimeEntryAction::GetRunningTimeEntry);
    auto entries = listFromReply<TimeEntry>(reply, [this](const json &j) { return jsonToTimeEntry(j); });

    if (entries.isEmpty())
        return std::nullopt;
    else
        return entries.first();
}

QVector<TimeEntry> AbstractTimeServiceManager::getTimeEntries(const QString &userId,
                                                              const QDateTime &start,
                                                              const QDateTime &end)
{
    auto reply = httpRequest(HttpVerb::Get, timeEntriesUrl(userId, m_workspaceId, start, end));
    return listFromReply<TimeEntry>(reply, [this](const json &j) { return jsonToTimeEntry(j); });
}

TimeEntry AbstractTimeServiceManager::getTimeEntry(const QString &timeEntryId)
{
    auto reply = timeEntryReq(timeEntryUrl(m_workspaceId, timeEntryId), TimeEntryAction::GetTimeEntry);
    return fromReply<TimeEntry>(reply, [this](const json &j) { return jsonToTimeEntry(j); });
}

TimeEntry AbstractTimeServiceManager::modifyTimeEntry(const TimeEntry &t)
{
    auto reply = timeEntryReq(timeEntryUrl(m_workspaceId, t.id()),
                              TimeEntryAction::ModifyTimeEntry,
                              timeEntryToJson(t, TimeEntryAction::ModifyTimeEntry));
    return fromReply<TimeEntry>(reply, [this](const json &j) { return jsonToTimeEntry(j); });
}

void AbstractTimeServiceManager::deleteTimeEntry(const QString &timeEntryId)
{
    timeEntryReq(timeEntryUrl(m_workspaceId, timeEntryId), TimeEntryAction::DeleteTimeEntry);
}

void AbstractTimeServiceManager::setWorkspaceId(const QString &workspaceId)
{
    if (workspaceId == m_workspaceId)
        return;

    m_workspaceId = workspaceId;
    m_projects.reset();
    m_tags.reset();
    m_projectsUnavailable = false;
    m_tagsUnavailable = false;
}

void AbstractTimeServiceManager::setLogger(std::shared_ptr<spdlog::logger> newLogger)
{
    m_logger = newLogger ? newLogger : std::make_shared<spdlog::logger>(serviceIdentifier().toStdString());
}

void AbstractTimeServiceManager::callInitVirtualMethods()
{
    // set up logger
    setLogger(nullptr);
}

template<class T>
T AbstractTimeServiceManager::fromReply(const JsonReply &reply, const std::function<T(const json &)> &convert)
{
    try
    {
        // some endpoints wrap a single object in an array
        return convert(reply.body.is_array() ? reply.body.at(0) : reply.body);
    }
    catch (const json::exception &e)
    {
        throw malformed(reply, e.what());
    }
    catch (const std::invalid_argument &e)
    {
        throw malformed(reply, e.what());
    }
}

template<class T>
QVector<T> AbstractTimeServiceManager::listFromReply(const JsonReply &reply,
                                                      const std::function<T(const json &)> &convert)
{
    if (reply.body.is_null())
        return {};
    if (!reply.body.is_array())
        throw ApiError::malformedResponse(reply.method, reply.path, reply.status, QStringLiteral("expected a JSON array"));

    QVector<T> items;
    items.reserve(static_cast<qsizetype>(reply.body.size()));
    try
    {
        for (const auto &item : reply.body)
            items.append(convert(item));
    }
    catch (const json::exception &e)
    {
        throw malformed(reply, e.what());
    }
    catch (const std::invalid_argument &e)
    {
        throw malformed(reply, e.what());
    }

    return items;
}

const QVector<Project> *AbstractTimeServiceManager::projectsIfAvailable()
{
    if (m_projectsUnavailable)
        return nullptr;

    try
    {
        return &projects();
    }
    catch (const Cloclify::Error &e)
    {
        logger()->warn("Showing project ids, the projects could not be loaded: {}", e.what());
        m_projectsUnavailable = true;
        return nullptr;
    }
}

const QVector<Tag> *AbstractTimeServiceManager::tagsIfAvailable()
{
    if (m_tagsUnavailable)
        return nullptr;

    try
    {
        return &tags();
    }
    catch (const Cloclify::Error &e)
    {
        logger()->warn("Showing tag ids, the tags could not be loaded: {}", e.what());
        m_tagsUnavailable = true;
        return nullptr;
    }
}

ApiError AbstractTimeServiceManager::malformed(const JsonReply &reply, const char *what) const
{
    logger()->error("Could not read the answer to {} {}: {}", reply.method.toStdString(), reply.path.toStdString(), what);
    return ApiError::malformedResponse(reply.method, reply.path, reply.status, QString::fromUtf8(what));
}

AbstractTimeServiceManager::JsonReply AbstractTimeServiceManager::timeEntryReq(const QUrl &url,
                                                                               const TimeEntryAction action,
                                                                               const json &body)
{
    return httpRequest(httpVerbForAction(action),
                       url,
                       body.is_null() ? QByteArray{} : QByteArray::fromStdString(body.dump()));
}

QString AbstractTimeServiceManager::verbName(const HttpVerb verb)
{
    switch (verb)
    {
    case HttpVerb::Get:
        return QStringLiteral("GET");
    case HttpVerb::Post:
        return QStringLiteral("POST");
    case HttpVerb::Patch:
        return QStringLiteral("PATCH");
    case HttpVerb::Put:
        return QStringLiteral("PUT");
    case HttpVerb::Delete:
        return QStringLiteral("DELETE");
    }

    Q_UNREACHABLE();
    return {};
}

QString AbstractTimeServiceManager::serviceMessage(const QByteArray &data) const
{
    try
    {
        if (auto message = jsonToErrorMessage(json::parse(data.toStdString())); !message.isEmpty())
            return message;
    }
    catch (const json::exception &e)
    {
        logger()->debug("Error response is not JSON: {}", e.what());
    }

    auto raw = QString::fromUtf8(data).simplified();
    if (raw.size() > 200)
        raw = raw.left(200) + QStringLiteral("...");
    return raw;
}

// *****************************************************************************
// *****     BEYOND THIS POINT THERE ARE ONLY FUNCTIONS FOR REST STUFF     *****
// *****************************************************************************

AbstractTimeServiceManager::JsonReply AbstractTimeServiceManager::httpRequest(const HttpVerb verb,
                                                                              const QUrl &url,
                                                                              const QByteArray &body)
{
    const auto method = verbName(verb);
    const auto path = url.path();

    QNetworkRequest req{url};
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setRawHeader("Accept", "application/json");
    req.setRawHeader(authHeaderName(), apiKeyForRequests());
    req.setTransferTimeout(m_transferTimeout);

    logger()->debug("{} {}", method.toStdString(), url.toString().toStdString());
    if (!body.isEmpty())
        logger()->debug("Request body: {}", body.toStdString());

    QNetworkReply *rep = nullptr;
    switch (verb)
    {
    case HttpVerb::Get:
        rep = m_manager.get(req);
        break;
    case HttpVerb::Post:
        rep = m_manager.post(req, body);
        break;
    case HttpVerb::Patch:
        rep = m_manager.sendCustomRequest(req, QByteArrayLiteral("PATCH"), body);
        break;
    case HttpVerb::Put:
        rep = m_manager.put(req, body);
        break;
    case HttpVerb::Delete:
        rep = m_manager.deleteResource(req);
        break;
    }
    QScopedPointer<QNetworkReply, QScopedPointerDeleteLater> reply{rep};

    if (!reply->isFinished())
    {
        QEventLoop loop;
        connect(rep, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const auto status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const auto data = reply->readAll();

    // no HTTP status means we never got an answer
    if (status == 0)
    {
        logger()->warn("{} {} failed: {}", method.toStdString(), path.toStdString(), reply->errorString().toStdString());
        if (reply->error() == QNetworkReply::OperationCanceledError || reply->error() == QNetworkReply::TimeoutError)
            throw NetworkError{QStringLiteral("%1 %2 timed out after %3 seconds")
                                   .arg(method, url.toString(), QString::number(m_transferTimeout / 1000))};
        throw NetworkError{QStringLiteral("Could not reach %1: %2").arg(url.host(), reply->errorString())};
    }

    logger()->debug("Answer ({}): {}", status, data.toStdString());

    if (status < 200 || status > 299) [[unlikely]]
    {
        logger()->error("Request {} {} failed with code {}", method.toStdString(), path.toStdString(), status);
        throw ApiError::rejected(method, path, status, serviceMessage(data));
    }

    if (data.trimmed().isEmpty())
        return {method, path, status, json{}};

    try
    {
        return {method, path, status, json::parse(data.toStdString())};
    }
    catch (const json::parse_error &e)
    {
        throw ApiError::malformedResponse(method, path, status, QString::fromUtf8(e.what()));
    }
}

#ifndef ABSTRACTTIMESERVICEMANAGER_H
#define ABSTRACTTIMESERVICEMANAGER_H

#include <QNetworkAccessManager>
#include <QObject>
#include <QUrl>

#include <spdlog/spdlog.h>

#include <functional>
#include <optional>

#include "Errors.h"
#include "JsonHelper.h"
#include "Project.h"
#include "Tag.h"
#include "TimeEntry.h"
#include "User.h"
#include "Workspace.h"

//! One method per remote operation. Every operation blocks until its single HTTP request is answered and throws
//! Cloclify::ApiError or Cloclify::NetworkError when it does not succeed.
class AbstractTimeServiceManager : public QObject
{
    Q_OBJECT

public:
    explicit AbstractTimeServiceManager(const QByteArray &apiKey, QObject *parent = nullptr);

    // These are requested the first time they are needed and kept for the lifetime of the manager.
    QVector<Project> &projects();
    QVector<Tag> &tags();
    QVector<Workspace> &workspaces();

    //! Exact matches win; otherwise a single case-insensitive match is accepted.
    std::optional<Project> projectByName(const QString &name);
    std::optional<Tag> tagByName(const QString &name);

    //! Replaces the raw project and tag ids of @p t with the workspace's records. An id the workspace does not know,
    //! or a list that cannot be loaded, leaves the raw id in place; this never throws.
    void resolveReferences(TimeEntry &t);

    User getApiKeyOwner();

    TimeEntry createTimeEntry(const TimeEntry &t);
    TimeEntry stopRunningTimeEntry(const QString &userId, const QDateTime &end);
    std::optional<TimeEntry> getRunningTimeEntry(const QString &userId);
    //! The entries are returned in the order the service sends them.
    QVector<TimeEntry> getTimeEntries(const QString &userId, const QDateTime &start, const QDateTime &end);
    TimeEntry getTimeEntry(const QString &timeEntryId);
    TimeEntry modifyTimeEntry(const TimeEntry &t);
    void deleteTimeEntry(const QString &timeEntryId);

    QString apiKey() const { return m_apiKey; }
    QString workspaceId() const { return m_workspaceId; }

    //! Switching workspaces drops the cached projects and tags.
    void setWorkspaceId(const QString &workspaceId);

    int transferTimeout() const { return m_transferTimeout; }
    void setTransferTimeout(int msecs) { m_transferTimeout = msecs; }

    int pageSize() const { return m_pageSize; }
    void setPageSize(int size) { m_pageSize = size; }

    //! Register a custom logger object to be used.

    //! By default, AbstractTimeServiceManager generates a basic spdlog::logger object without sinks. If you wish to
    //! register a custom spdlog::logger for use by AbstractTimeServiceManager, pass it to this function. To regenerate the
    //! default handler, call this function with `nullptr` as the parameter.
    void setLogger(std::shared_ptr<spdlog::logger> newLogger);

    // ***** BEGIN FUNCTIONS THAT SHOULD BE OVERRIDDEN *****

    //! Override this to provide a unique identifier for your time service, e.g. `com.clockify`.
    virtual QString serviceIdentifier() const = 0;
    //! This function provides the application with a service name appropriate for display to the user (e.g. "Clockify").
    virtual QString serviceName() const = 0;

    //! The URL that is the base of all API requests.
    virtual const QString apiBaseUrl() const = 0;

    //! Return the current date and time as defined by your time service.
    virtual const QDateTime currentDateTime() const = 0;

    // ***** END FUNCTIONS THAT SHOULD BE OVERRIDDEN *****

protected:
    enum class HttpVerb
    {
        Get,
        Post,
        Patch,
        Put,
        Delete,
    };
    enum class TimeEntryAction
    {
        CreateTimeEntry,
        GetRunningTimeEntry,
        StopTimeEntry,
        GetTimeEntry,
        ModifyTimeEntry,
        DeleteTimeEntry,
    };

    // ***** BEGIN FUNCTIONS THAT SHOULD BE OVERRIDDEN *****
    virtual const QByteArray authHeaderName() const = 0;

    //! This function will have the API key substituted into it with arg(). Use if your time service requires more text
    //! than just the API key for authorization.
    virtual const QString apiKeyTemplate() const { return QStringLiteral("%1"); }

    virtual QUrl createTimeEntryUrl(const QString &workspaceId) const = 0;
    virtual QUrl runningTimeEntryUrl(const QString &userId, const QString &workspaceId) const = 0;
    virtual QUrl stopTimeEntryUrl(const QString &userId, const QString &workspaceId) const = 0;
    virtual QUrl timeEntryUrl(const QString &workspaceId, const QString &timeEntryId) const = 0;
    virtual QUrl timeEntriesUrl(const QString &userId,
                                const QString &workspaceId,
                                const QDateTime &start,
                                const QDateTime &end) const = 0;
    virtual QUrl currentUserUrl() const = 0;
    virtual QUrl workspacesUrl() const = 0;
    virtual QUrl projectsUrl(const QString &workspaceId) const = 0;
    virtual QUrl tagsUrl(const QString &workspaceId) const = 0;

    // These may throw nlohmann::json::exception or std::invalid_argument on malformed input; the caller turns either
    // into an ApiError.
    virtual TimeEntry jsonToTimeEntry(const json &j) = 0;
    virtual User jsonToUser(const json &j) = 0;
    virtual Workspace jsonToWorkspace(const json &j) = 0;
    virtual Project jsonToProject(const json &j) = 0;
    virtual Tag jsonToTag(const json &j) = 0;

    virtual json timeEntryToJson(const TimeEntry &t, TimeEntryAction action) = 0;

    //! Pull the human-readable explanation out of an error response body.
    virtual QString jsonToErrorMessage(const json &j) const = 0;

    virtual HttpVerb httpVerbForAction(const TimeEntryAction action) const = 0;

    // ***** END FUNCTIONS THAT SHOULD BE OVERRIDDEN *****

    //! Call this function in the constructor of any derived, non-abstract class.
    void callInitVirtualMethods();

    //! Returns a general-purpose logger object.
    std::shared_ptr<spdlog::logger> logger() const { return m_logger; }

private:
    struct JsonReply
    {
        QString method;
        QString path;
        int status;
        json body;
    };

    QByteArray apiKeyForRequests() const { return apiKeyTemplate().arg(m_apiKey).toUtf8(); }

    template<class T>
    T fromReply(const JsonReply &reply, const std::function<T(const json &)> &convert);
    template<class T>
    QVector<T> listFromReply(const JsonReply &reply, const std::function<T(const json &)> &convert);

    Cloclify::ApiError malformed(const JsonReply &reply, const char *what) const;

    // nullptr once loading the list has failed
    const QVector<Project> *projectsIfAvailable();
    const QVector<Tag> *tagsIfAvailable();

    JsonReply timeEntryReq(const QUrl &url, const TimeEntryAction action, const json &body = {});
    JsonReply httpRequest(const HttpVerb verb, const QUrl &url, const QByteArray &body = {});

    static QString verbName(const HttpVerb verb);
    QString serviceMessage(const QByteArray &data) const;

    std::shared_ptr<spdlog::logger> m_logger;

    QString m_workspaceId;
    QByteArray m_apiKey;

    std::optional<QVector<Project>> m_projects;
    std::optional<QVector<Tag>> m_tags;
    std::optional<QVector<Workspace>> m_workspaces;
    bool m_projectsUnavailable{false};
    bool m_tagsUnavailable{false};

    QNetworkAccessManager m_manager{this};

    int m_transferTimeout{30 * 1000};
    int m_pageSize{1000};
};

#endif // ABSTRACTTIMESERVICEMANAGER_H

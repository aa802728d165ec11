#ifndef CLOCKIFYMANAGER_H
#define CLOCKIFYMANAGER_H

#include "AbstractTimeServiceManager.h"

class ClockifyManager : public AbstractTimeServiceManager
{
    Q_OBJECT

public:
    explicit ClockifyManager(const QByteArray &apiKey,
                             const QString &baseUrl = defaultApiBaseUrl(),
                             QObject *parent = nullptr);

    static QString defaultApiBaseUrl() { return QStringLiteral("https://api.clockify.me/api/v1"); }

    virtual QString serviceIdentifier() const final { return QStringLiteral("com.clockify"); }
    virtual QString serviceName() const final { return QStringLiteral("Clockify"); }
    virtual const QString apiBaseUrl() const final { return m_baseUrl; }
    virtual const QDateTime currentDateTime() const final { return QDateTime::currentDateTimeUtc(); }

protected:
    virtual const QByteArray authHeaderName() const final { return QByteArrayLiteral("X-Api-Key"); }

    virtual QUrl createTimeEntryUrl(const QString &workspaceId) const final;
    virtual QUrl runningTimeEntryUrl(const QString &userId, const QString &workspaceId) const final;
    virtual QUrl stopTimeEntryUrl(const QString &userId, const QString &workspaceId) const final;
    virtual QUrl timeEntryUrl(const QString &workspaceId, const QString &timeEntryId) const final;
    virtual QUrl timeEntriesUrl(const QString &userId,
                                const QString &workspaceId,
                                const QDateTime &start,
                                const QDateTime &end) const final;
    virtual QUrl currentUserUrl() const final;
    virtual QUrl workspacesUrl() const final;
    virtual QUrl projectsUrl(const QString &workspaceId) const final;
    virtual QUrl tagsUrl(const QString &workspaceId) const final;

    virtual TimeEntry jsonToTimeEntry(const json &j) final;
    virtual User jsonToUser(const json &j) final;
    virtual Workspace jsonToWorkspace(const json &j) final;
    virtual Project jsonToProject(const json &j) final;
    virtual Tag jsonToTag(const json &j) final;

    virtual json timeEntryToJson(const TimeEntry &t, TimeEntryAction action) final;
    virtual QString jsonToErrorMessage(const json &j) const final;

    virtual HttpVerb httpVerbForAction(const TimeEntryAction action) const final;

private:
    QString m_baseUrl;
};

#endif // CLOCKIFYMANAGER_H

#ifndef TIMEENTRY_H
#define TIMEENTRY_H

#include <QDateTime>
#include <QObject>
#include <QVector>

#include "Project.h"
#include "Tag.h"

class TimeEntry : public QObject
{
    Q_OBJECT

public:
    //! @param end Pass a null QDateTime for a running entry.
    TimeEntry(const QString &id,
              const QString &description,
              const QDateTime &start,
              const QDateTime &end,
              const Project &project,
              const QVector<Tag> &tags,
              bool billable,
              const QString &userId = {},
              const QString &workspaceId = {},
              QObject *parent = nullptr);
    TimeEntry(const TimeEntry &that);
    TimeEntry(QObject *parent = nullptr);

    QString id() const { return m_id; }
    QString description() const { return m_description; }
    QDateTime start() const { return m_start; }
    QDateTime end() const { return m_end; }
    Project project() const { return m_project; }
    QVector<Tag> tags() const { return m_tags; }
    bool billable() const { return m_billable; }
    QString userId() const { return m_userId; }
    QString workspaceId() const { return m_workspaceId; }

    bool running() const { return !m_end.isValid(); }
    //! Length of the entry in milliseconds; a running entry is measured up to @p now.
    qint64 duration(const QDateTime &now) const;

    void setDescription(const QString &description) { m_description = description; }
    void setStart(const QDateTime &start) { m_start = start; }
    void setEnd(const QDateTime &end) { m_end = end; }
    void setProject(const Project &project) { m_project = project; }
    void setTags(const QVector<Tag> &tags) { m_tags = tags; }
    void setBillable(bool billable) { m_billable = billable; }

    bool isValid() const { return m_isValid; }

    TimeEntry &operator=(const TimeEntry &other);
    bool operator==(const TimeEntry &other) const { return m_id == other.m_id; }

private:
    QString m_id;
    QString m_description;
    QDateTime m_start;
    QDateTime m_end;
    Project m_project;
    QVector<Tag> m_tags;
    bool m_billable{false};
    QString m_userId;
    QString m_workspaceId;

    bool m_isValid{false};
};

#endif // TIMEENTRY_H

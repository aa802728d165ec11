#include "TimeEntry.h"

TimeEntry::TimeEntry(const QString &id,
                     const QString &description,
                     const QDateTime &start,
                     const QDateTime &end,
                     const Project &project,
                     const QVector<Tag> &tags,
                     bool billable,
                     const QString &userId,
                     const QString &workspaceId,
                     QObject *parent)
    : QObject{parent},
      m_id{id},
      m_description{description},
      m_start{start},
      m_end{end},
      m_project{project},
      m_tags{tags},
      m_billable{billable},
      m_userId{userId},
      m_workspaceId{workspaceId},
      m_isValid{true}
{}

TimeEntry::TimeEntry(QObject *parent)
    : QObject{parent}
{}

TimeEntry::TimeEntry(const TimeEntry &that)
    : QObject{that.parent()}
{
    *this = that;
}

qint64 TimeEntry::duration(const QDateTime &now) const
{
    if (!m_start.isValid())
        return 0;

    return m_start.msecsTo(running() ? now : m_end);
}

TimeEntry &TimeEntry::operator=(const TimeEntry &other)
{
    m_id = other.m_id;
    m_description = other.m_description;
    m_start = other.m_start;
    m_end = other.m_end;
    m_project = other.m_project;
    m_tags = other.m_tags;
    m_billable = other.m_billable;
    m_userId = other.m_userId;
    m_workspaceId = other.m_workspaceId;
    m_isValid = other.m_isValid;

    return *this;
}

#include "Project.h"

Project::Project(const QString &id, const QString &name, const QString &color, bool archived, QObject *parent)
    : QObject{parent},
      m_id{id},
      m_name{name},
      m_color{color},
      m_archived{archived}
{}

Project::Project(const QString &id, const QString &name, QObject *parent)
    : Project{id, name, {}, false, parent}
{}

Project::Project(const Project &that)
    : QObject{that.parent()}
{
    *this = that;
}

Project::Project(QObject *parent)
    : QObject{parent}
{}

Project &Project::operator=(const Project &other)
{
    m_id = other.m_id;
    m_name = other.m_name;
    m_color = other.m_color;
    m_archived = other.m_archived;

    return *this;
}

bool Project::operator==(const Project &other) const
{
    return m_id == other.m_id;
}

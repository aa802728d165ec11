#include "Tag.h"

Tag::Tag(const QString &id, const QString &name, bool archived, QObject *parent)
    : QObject{parent},
      m_id{id},
      m_name{name},
      m_archived{archived}
{}

Tag::Tag(const Tag &that)
    : QObject{that.parent()}
{
    *this = that;
}

Tag::Tag(QObject *parent)
    : QObject{parent}
{}

Tag &Tag::operator=(const Tag &other)
{
    m_id = other.m_id;
    m_name = other.m_name;
    m_archived = other.m_archived;

    return *this;
}

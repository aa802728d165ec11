#include "User.h"

User::User(const QString &userId,
           const QString &name,
           const QString &email,
           const QString &activeWorkspaceId,
           const QString &defaultWorkspaceId,
           QObject *parent)
    : QObject{parent},
      m_userId{userId},
      m_name{name},
      m_email{email},
      m_activeWorkspaceId{activeWorkspaceId},
      m_defaultWorkspaceId{defaultWorkspaceId}
{}

User::User(const User &that)
    : QObject{that.parent()}
{
    *this = that;
}

User::User(QObject *parent)
    : QObject{parent},
      m_isValid{false}
{}

User &User::operator=(const User &other)
{
    m_userId = other.m_userId;
    m_name = other.m_name;
    m_email = other.m_email;
    m_activeWorkspaceId = other.m_activeWorkspaceId;
    m_defaultWorkspaceId = other.m_defaultWorkspaceId;
    m_isValid = other.m_isValid;

    return *this;
}

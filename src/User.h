#ifndef USER_H
#define USER_H

#include <QObject>

//! The owner of the API key.
class User : public QObject
{
    Q_OBJECT

public:
    explicit User(const QString &userId,
                  const QString &name,
                  const QString &email,
                  const QString &activeWorkspaceId,
                  const QString &defaultWorkspaceId,
                  QObject *parent = nullptr);
    User(const User &that);
    User(QObject *parent = nullptr);

    User &operator=(const User &other);

    QString userId() const { return m_userId; }
    QString name() const { return m_name; }
    QString email() const { return m_email; }
    QString activeWorkspaceId() const { return m_activeWorkspaceId; }
    QString defaultWorkspaceId() const { return m_defaultWorkspaceId; }
    bool isValid() const { return m_isValid; }

private:
    QString m_userId;
    QString m_name;
    QString m_email;
    QString m_activeWorkspaceId;
    QString m_defaultWorkspaceId;

    bool m_isValid{true};
};

#endif // USER_H

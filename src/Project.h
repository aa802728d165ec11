#ifndef PROJECT_H
#define PROJECT_H

#include <QObject>

class Project : public QObject
{
    Q_OBJECT

public:
    //! @param color The project color as the service reports it, e.g. "#03A9F4". May be empty.
    Project(const QString &id, const QString &name, const QString &color, bool archived = false, QObject *parent = nullptr);
    Project(const QString &id, const QString &name, QObject *parent = nullptr);
    Project(const Project &that);
    Project(QObject *parent = nullptr);

    QString id() const { return m_id; }
    QString name() const { return m_name; }
    QString color() const { return m_color; }
    bool archived() const { return m_archived; }
    bool isValid() const { return !m_id.isEmpty(); }

    Project &operator=(const Project &other);
    bool operator==(const Project &other) const;

private:
    QString m_id;
    QString m_name;
    QString m_color;
    bool m_archived{false};
};

#endif // PROJECT_H

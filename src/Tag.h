#ifndef TAG_H
#define TAG_H

#include <QObject>

class Tag : public QObject
{
    Q_OBJECT

public:
    Tag(const QString &id, const QString &name, bool archived = false, QObject *parent = nullptr);
    Tag(const Tag &that);
    Tag(QObject *parent = nullptr);

    QString id() const { return m_id; }
    QString name() const { return m_name; }
    bool archived() const { return m_archived; }

    Tag &operator=(const Tag &other);
    bool operator==(const Tag &other) const { return m_id == other.m_id; }

private:
    QString m_id;
    QString m_name;
    bool m_archived{false};
};

#endif // TAG_H

#ifndef SETTINGS_H
#define SETTINGS_H

#include <QSettings>
#include <QString>

//! Values read from the INI settings file. A missing file yields the defaults.
class Settings
{
public:
    explicit Settings(const QString &fileName);

    //! <config dir>/cloclify/cloclify.conf
    static QString defaultFileName();

    const QString &fileName() const { return m_fileName; }
    QSettings::Status status() const { return m_status; }

    const QString &workspace() const { return m_workspace; }
    const QString &userId() const { return m_userId; }
    const QString &apiUrl() const { return m_apiUrl; }
    const QString &project() const { return m_project; }
    const QString &color() const { return m_color; }

    // -1 if the file holds something that is not a number
    int requestTimeout() const { return m_requestTimeout; }
    int pageSize() const { return m_pageSize; }

private:
    void load();

    static int intValue(const QSettings &settings, const QString &key, int defaultValue);

    QString m_fileName;
    QSettings::Status m_status{QSettings::NoError};

    QString m_workspace;
    QString m_userId;
    QString m_apiUrl;
    QString m_project;
    QString m_color;

    int m_requestTimeout;
    int m_pageSize;
};

#endif // SETTINGS_H

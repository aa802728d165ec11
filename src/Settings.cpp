#include "Settings.h"

#include <QStandardPaths>

#include "Logger.h"

namespace logs = Cloclify::logs;

Settings::Settings(const QString &fileName)
    : m_fileName{fileName}
{
    load();
}

QString Settings::defaultFileName()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
           + QStringLiteral("/cloclify/cloclify.conf");
}

void Settings::load()
{
    QSettings settings{m_fileName, QSettings::IniFormat};
    m_status = settings.status();

    if (m_status != QSettings::NoError)
        logs::app()->warn("Could not read settings file {}", m_fileName.toStdString());
    else
        logs::app()->trace("Reading settings from {}", m_fileName.toStdString());

    m_workspace = settings.value(QStringLiteral("workspace")).toString().trimmed();
    m_userId = settings.value(QStringLiteral("userId")).toString().trimmed();
    m_apiUrl = settings.value(QStringLiteral("apiUrl")).toString().trimmed();
    m_project = settings.value(QStringLiteral("project")).toString().trimmed();
    m_color = settings.value(QStringLiteral("color")).toString().trimmed();

    m_requestTimeout = intValue(settings, QStringLiteral("requestTimeout"), 30);
    m_pageSize = intValue(settings, QStringLiteral("pageSize"), 1000);
}

int Settings::intValue(const QSettings &settings, const QString &key, int defaultValue)
{
    if (!settings.contains(key))
        return defaultValue;

    bool ok{false};
    auto value = settings.value(key).toString().trimmed().toInt(&ok);
    return ok ? value : -1;
}

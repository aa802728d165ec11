#include "Configuration.h"

#include <QUrl>

#include "ClockifyManager.h"
#include "Errors.h"
#include "Logger.h"

namespace logs = Cloclify::logs;

namespace
{
    // one day; the transfer timeout is kept in milliseconds as an int
    constexpr int maxRequestTimeout{24 * 60 * 60};
    // the largest page Clockify hands out
    constexpr int maxPageSize{5000};

    QString firstNonEmpty(const QString &a, const QString &b)
    {
        return a.trimmed().isEmpty() ? b : a.trimmed();
    }
} // namespace

Cloclify::Configuration Cloclify::Configuration::resolve(const QProcessEnvironment &environment,
                                                         const Settings &settings,
                                                         const GlobalOptions &options)
{
    if (settings.status() != QSettings::NoError)
        throw ConfigurationError{QStringLiteral("The settings file %1 could not be read").arg(settings.fileName())};

    Configuration config;

    config.apiKey = environment.value(QStringLiteral("CLOCKIFY_API_KEY")).trimmed().toUtf8();
    if (config.apiKey.isEmpty())
        throw ConfigurationError{QStringLiteral("No API key found. Set the CLOCKIFY_API_KEY environment variable to "
                                                "your Clockify API key (Profile settings > API).")};

    config.workspace = firstNonEmpty(options.workspace,
                                     firstNonEmpty(environment.value(QStringLiteral("CLOCKIFY_WORKSPACE")), settings.workspace()));
    config.userId = firstNonEmpty(environment.value(QStringLiteral("CLOCKIFY_USER_ID")), settings.userId());

    config.apiUrl = firstNonEmpty(environment.value(QStringLiteral("CLOCKIFY_API_URL")),
                                  firstNonEmpty(settings.apiUrl(), ClockifyManager::defaultApiBaseUrl()));
    if (QUrl url{config.apiUrl, QUrl::StrictMode};
        !url.isValid() || url.host().isEmpty() || (url.scheme() != QStringLiteral("http") && url.scheme() != QStringLiteral("https")))
        throw ConfigurationError{QStringLiteral("The API URL '%1' is not an http or https URL").arg(config.apiUrl)};

    config.defaultProject = settings.project();

    config.requestTimeout = settings.requestTimeout();
    if (config.requestTimeout <= 0 || config.requestTimeout > maxRequestTimeout)
        throw ConfigurationError{QStringLiteral("requestTimeout in %1 must be between 1 and %2 seconds")
                                     .arg(settings.fileName(), QString::number(maxRequestTimeout))};

    config.pageSize = settings.pageSize();
    if (config.pageSize <= 0 || config.pageSize > maxPageSize)
        throw ConfigurationError{QStringLiteral("pageSize in %1 must be between 1 and %2")
                                     .arg(settings.fileName(), QString::number(maxPageSize))};

    if (options.color)
        config.colorMode = *options.color;
    else if (!settings.color().isEmpty())
    {
        auto mode = parseColorMode(settings.color());
        if (!mode)
            throw ConfigurationError{QStringLiteral("color in %1 must be auto, always or never, not '%2'")
                                         .arg(settings.fileName(), settings.color())};
        config.colorMode = *mode;
    }
    else if (environment.contains(QStringLiteral("NO_COLOR")))
        config.colorMode = ColorMode::Never;

    logs::app()->debug("Using API {} with workspace '{}' and user '{}'",
                       config.apiUrl.toStdString(),
                       config.workspace.toStdString(),
                       config.userId.toStdString());

    return config;
}

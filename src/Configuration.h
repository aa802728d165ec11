#ifndef CONFIGURATION_H
#define CONFIGURATION_H

#include <QProcessEnvironment>

#include "CommandLine.h"
#include "Formatter.h"
#include "Settings.h"

namespace Cloclify
{
    struct Configuration
    {
        QByteArray apiKey;
        //! Name or id, empty to use the active workspace of the API key's owner.
        QString workspace;
        //! Empty to use the owner of the API key.
        QString userId;
        QString apiUrl;
        QString defaultProject;
        int requestTimeout; // seconds
        int pageSize;
        ColorMode colorMode{ColorMode::Auto};

        //! Environment beats the settings file; command-line options beat both. Throws Cloclify::ConfigurationError.
        static Configuration resolve(const QProcessEnvironment &environment,
                                     const Settings &settings,
                                     const GlobalOptions &options);
    };
} // namespace Cloclify

#endif // CONFIGURATION_H

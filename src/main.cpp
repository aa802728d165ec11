#include <QCoreApplication>
#include <QProcessEnvironment>
#include <QTextStream>

#include <cstring>

#include "Application.h"
#include "Logger.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication a{argc, argv};
    QCoreApplication::setApplicationName(QStringLiteral("cloclify"));
    QCoreApplication::setApplicationVersion(QStringLiteral(CLOCLIFY_VERSION_STR));

#if defined(IS_DEBUG_BUILD)
    // debug mode will always be on in debug builds
    Cloclify::logs::init(true);
#else
    // the console sink has to be set up before the arguments are parsed
    bool debugMode{false};
    for (int i = 0; i < argc; ++i)
        if (std::strcmp(argv[i], "--debug") == 0)
        {
            debugMode = true;
            break;
        }
    Cloclify::logs::init(debugMode);
#endif

    Cloclify::logs::app()->trace("Starting cloclify {}...", CLOCLIFY_VERSION_STR);

    QTextStream out{stdout};
    QTextStream err{stderr};
    Cloclify::Application app{QProcessEnvironment::systemEnvironment(), out, err};

    auto arguments = QCoreApplication::arguments();
    arguments.removeFirst();
    const auto retCode = app.exec(arguments);

    Cloclify::logs::app()->trace("quitting with {}", retCode);

    return retCode;
}

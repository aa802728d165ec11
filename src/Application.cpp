#include "Application.h"

#include <unistd.h>

#include <cstdio>

#include "ClockifyManager.h"
#include "CommandLine.h"
#include "CommandRunner.h"
#include "Configuration.h"
#include "Errors.h"
#include "Formatter.h"
#include "JsonHelper.h"
#include "Logger.h"
#include "Settings.h"

namespace logs = Cloclify::logs;

Cloclify::Application::Application(const QProcessEnvironment &environment, QTextStream &out, QTextStream &err)
    : m_environment{environment},
      m_out{out},
      m_err{err}
{}

int Cloclify::Application::exec(const QStringList &arguments)
{
    try
    {
        run(arguments);
        m_out.flush();
        return Success;
    }
    catch (const Error &e)
    {
        logs::app()->debug("Command failed with exit code {}: {}", static_cast<int>(e.exitCode()), e.what());
        return fail(e.message(), e.exitCode());
    }
    catch (const json::exception &e)
    {
        logs::app()->error("Unhandled JSON error: {}", e.what());
        return fail(QStringLiteral("Unexpected data: %1").arg(QString::fromUtf8(e.what())), UnexpectedFailure);
    }
    catch (const std::exception &e)
    {
        logs::app()->error("Unhandled exception: {}", e.what());
        return fail(QString::fromUtf8(e.what()), UnexpectedFailure);
    }
}

bool Cloclify::Application::outputIsTerminal() const
{
    return isatty(fileno(stdout)) == 1;
}

void Cloclify::Application::run(const QStringList &arguments)
{
    const auto now = currentDateTime();
    const auto command = parseCommandLine(arguments, now);

    if (command.type == Command::Type::Help || command.type == Command::Type::Version)
    {
        m_out << command.text.trimmed() << '\n';
        return;
    }

    const Settings settings{m_environment.value(QStringLiteral("CLOCLIFY_CONFIG"), Settings::defaultFileName())};
    const auto config = Configuration::resolve(m_environment, settings, command.global);

    const bool colors =
        config.colorMode == ColorMode::Always || (config.colorMode == ColorMode::Auto && outputIsTerminal());
    const Formatter formatter{colors, now};

    ClockifyManager manager{config.apiKey, config.apiUrl};
    manager.setLogger(logs::network());

    CommandRunner runner{manager, config, formatter, now, m_out};
    runner.run(command);
}

int Cloclify::Application::fail(const QString &message, int exitCode)
{
    m_out.flush();
    m_err << QStringLiteral("Error: %1").arg(message) << '\n';
    m_err.flush();
    return exitCode;
}

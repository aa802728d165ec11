#include "Logger.h"

#include <QDateTime>
#include <QStandardPaths>

#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <backward.hpp>

#include <csignal>
#include <fstream>

namespace Cloclify::logs
{
    std::shared_ptr<spdlog::logger> _app, _network, _qt;

    extern "C" void crashHandler(int signal);
}

QString Cloclify::logs::logFileLocation()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation).append("/cloclify");
}

void Cloclify::logs::qtMessagesToSpdlog(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    auto formatted = qFormatLogMessage(type, context, msg);

    switch (type)
    {
    case QtDebugMsg:
        _qt->debug(formatted.toStdString());
        break;
    case QtInfoMsg:
        _qt->info(formatted.toStdString());
        break;
    case QtWarningMsg:
        _qt->warn(formatted.toStdString());
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        _qt->critical(formatted.toStdString());
        break;
    default:
        break;
    }
}

void Cloclify::logs::init(bool debugMode)
{
    // stdout carries the command output, so the console only ever sees stderr
    auto console = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>();
    console->set_level(debugMode ? spdlog::level::debug : spdlog::level::warn);
    std::vector<spdlog::sink_ptr> sinks = {console};

    std::string fileError;
    try
    {
        auto file =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFileLocation().append("/cloclify.log").toStdString());
        file->set_level(spdlog::level::trace);
        sinks.push_back(file);
    }
    catch (const spdlog::spdlog_ex &e)
    {
        fileError = e.what();
    }

    _app = std::make_shared<spdlog::logger>("cloclify", sinks.begin(), sinks.end());
    _app->set_level(spdlog::level::trace);
    _app->flush_on(spdlog::level::trace);
    _network = std::make_shared<spdlog::logger>("network", sinks.begin(), sinks.end());
    _network->set_level(spdlog::level::trace);
    _network->flush_on(spdlog::level::trace);
    _qt = std::make_shared<spdlog::logger>("qt", sinks.begin(), sinks.end());
    _qt->set_level(spdlog::level::trace);
    _qt->flush_on(spdlog::level::trace);

    if (!fileError.empty())
        _app->warn("Logging to the console only, could not open the log file: {}", fileError);

    qInstallMessageHandler(Cloclify::logs::qtMessagesToSpdlog);
    std::signal(SIGILL, crashHandler);
    std::signal(SIGSEGV, crashHandler);
    std::signal(SIGABRT, crashHandler);
    std::signal(SIGFPE, crashHandler);
}

std::shared_ptr<spdlog::logger> Cloclify::logs::app()
{
    return _app;
}

std::shared_ptr<spdlog::logger> Cloclify::logs::network()
{
    return _network;
}

void Cloclify::logs::crashHandler(int signal)
{
    _app->critical("Crash signal detected! {}", signal);
    _app->critical("stack trace:");

    using namespace backward;

    StackTrace st;
    st.load_here(100);
    Printer p;
    p.address = true;
    p.object = true;
    p.print(st);

    auto filename{logFileLocation().toStdString() + "/backtrace-" +
                  std::to_string(QDateTime::currentDateTime().toMSecsSinceEpoch()) + ".txt"};
    std::ofstream dump{filename};
    if (dump)
    {
        p.print(st, dump);
        _app->critical("Also dumped stack trace to {}", filename);
    }

    _app->flush();
    _network->flush();
    _qt->flush();

    std::signal(signal, SIG_DFL);
    std::raise(signal);
}

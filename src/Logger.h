#pragma once

#include <QString>
#include <QtGlobal>

#include <spdlog/spdlog.h>

namespace Cloclify::logs
{
    QString logFileLocation();
    void qtMessagesToSpdlog(QtMsgType type, const QMessageLogContext &context, const QString &msg);
    void init(bool debugMode);

    std::shared_ptr<spdlog::logger> app();
    std::shared_ptr<spdlog::logger> network();

} // namespace Cloclify::logs

#pragma once

#include <QLoggingCategory>
#include <QString>
#include <QtGlobal>

Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcSettings)
Q_DECLARE_LOGGING_CATEGORY(lcSubtitle)
Q_DECLARE_LOGGING_CATEGORY(lcFfmpeg)
Q_DECLARE_LOGGING_CATEGORY(lcUi)

// Routes Qt log output to <logDir>/application.log (rotated) and the console.
namespace Logger {

inline constexpr qint64 MaxLogBytes = 256 * 1024;
inline constexpr int BackupCount = 5;
inline constexpr const char* LogFileName = "application.log";

// Installs the message handler. Records below consoleThreshold are written
// to the file only. Returns false if the log directory cannot be created;
// console output keeps working in that case.
bool setup(const QString& logDir, QtMsgType consoleThreshold = QtDebugMsg);

// Restores Qt's default handler and closes the log file.
void shutdown();

QString defaultLogDir();

// "2024-01-01 12:00:00|INFO|file.cpp:12|func|message"
QString formatRecord(QtMsgType type, const QMessageLogContext& context, const QString& message);

} // namespace Logger

#include "Logger.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <cstdio>
#include <cstdlib>

Q_LOGGING_CATEGORY(lcApp, "subinserter.app")
Q_LOGGING_CATEGORY(lcSettings, "subinserter.settings")
Q_LOGGING_CATEGORY(lcSubtitle, "subinserter.subtitle")
Q_LOGGING_CATEGORY(lcFfmpeg, "subinserter.ffmpeg")
Q_LOGGING_CATEGORY(lcUi, "subinserter.ui")

namespace {

struct LogState {
    QMutex mutex;
    QFile file;
    QString path;
    QtMsgType consoleThreshold = QtDebugMsg;
    bool installed = false;
};

LogState& state() {
    static LogState s;
    return s;
}

// QtMsgType is not ordered by severity (QtInfoMsg was added last)
int severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:    return 0;
        case QtInfoMsg:     return 1;
        case QtWarningMsg:  return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg:    return 4;
    }
    return 0;
}

const char* levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARNING";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "CRITICAL";
    }
    return "DEBUG";
}

void rotate(LogState& s) {
    s.file.close();
    QFile::remove(QString("%1.%2").arg(s.path).arg(Logger::BackupCount));
    for (int i = Logger::BackupCount - 1; i >= 1; --i) {
        QString from = QString("%1.%2").arg(s.path).arg(i);
        if (QFile::exists(from))
            QFile::rename(from, QString("%1.%2").arg(s.path).arg(i + 1));
    }
    QFile::rename(s.path, s.path + ".1");
    s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
}

// Set while this thread holds the log mutex. A Qt warning raised by QFile in
// that section comes straight back into the handler and must not lock again.
thread_local bool t_writingRecord = false;

void writeConsole(const QByteArray& line) {
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    const QByteArray line = (Logger::formatRecord(type, context, message) + '\n').toUtf8();

    if (t_writingRecord) {
        writeConsole(line);
        if (type == QtFatalMsg)
            std::abort();
        return;
    }

    LogState& s = state();
    {
        QMutexLocker lock(&s.mutex);
        t_writingRecord = true;
        if (s.file.isOpen()) {
            if (s.file.size() + line.size() > Logger::MaxLogBytes)
                rotate(s);
            if (s.file.isOpen()) {
                s.file.write(line);
                s.file.flush();
            }
        }
        if (severity(type) >= severity(s.consoleThreshold))
            writeConsole(line);
        t_writingRecord = false;
    }

    if (type == QtFatalMsg)
        std::abort();
}

} // namespace

namespace Logger {

QString formatRecord(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    QString file = context.file ? QFileInfo(QString::fromUtf8(context.file)).fileName() : QString("?");
    QString function = context.function ? QString::fromUtf8(context.function) : QString("?");
    return QString("%1|%2|%3:%4|%5|%6")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss"),
             QString::fromLatin1(levelName(type)),
             file)
        .arg(context.line)
        .arg(function, message);
}

bool setup(const QString& logDir, QtMsgType consoleThreshold) {
    LogState& s = state();
    bool fileOk = true;
    {
        QMutexLocker lock(&s.mutex);
        s.consoleThreshold = consoleThreshold;
        s.file.close();

        if (!QDir().mkpath(logDir)) {
            fileOk = false;
        } else {
            s.path = QDir(logDir).filePath(LogFileName);
            s.file.setFileName(s.path);
            fileOk = s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
        }

        if (!s.installed) {
            qInstallMessageHandler(messageHandler);
            s.installed = true;
        }
    }

    if (!fileOk)
        qCWarning(lcApp) << "Cannot open log file in" << logDir;
    return fileOk;
}

void shutdown() {
    LogState& s = state();
    QMutexLocker lock(&s.mutex);
    if (s.installed) {
        qInstallMessageHandler(nullptr);
        s.installed = false;
    }
    s.file.close();
}

QString defaultLogDir() {
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)).filePath("logs");
}

} // namespace Logger

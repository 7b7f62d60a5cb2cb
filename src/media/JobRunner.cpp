#include "JobRunner.h"
#include "FfmpegCommandBuilder.h"
#include "Logger.h"
#include "TimeUtil.h"

#include <QFileInfo>
#include <QRegularExpression>
#include <QTimer>
#include <algorithm>

JobRunner::JobRunner(QObject* parent) : QObject(parent) {}

JobRunner::~JobRunner() {
    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->disconnect(this);
        m_process->kill();
        m_process->waitForFinished(StopGraceMs);
    }
}

bool JobRunner::start(const QString& program, const QStringList& args, double durationSeconds) {
    if (isRunning()) {
        qCWarning(lcFfmpeg) << "A job is already running";
        return false;
    }

    if (m_process) {
        m_process->deleteLater();
        m_process = nullptr;
    }

    m_program = program;
    m_duration = durationSeconds > 0 ? durationSeconds : 0.0;
    m_buffer.clear();
    m_tail.clear();
    m_stopRequested = false;
    m_finished = false;

    m_process = new QProcess(this);
    m_process->setProgram(program);
    m_process->setArguments(args);
    m_process->setStandardInputFile(QProcess::nullDevice());
    m_process->setStandardOutputFile(QProcess::nullDevice());

    connect(m_process, &QProcess::readyReadStandardError, this, &JobRunner::onReadyReadStandardError);
    connect(m_process, qOverload<int, QProcess::ExitStatus>(&QProcess::finished),
            this, &JobRunner::onProcessFinished);
    connect(m_process, &QProcess::errorOccurred, this, &JobRunner::onErrorOccurred);

    qCInfo(lcFfmpeg) << "Run:" << FfmpegCommandBuilder::commandLine(program, args);
    m_process->start();
    return true;
}

void JobRunner::stop() {
    if (!isRunning()) return;

    qCInfo(lcFfmpeg) << "Stop requested";
    m_stopRequested = true;
    m_process->terminate();

    QProcess* proc = m_process;
    QTimer::singleShot(StopGraceMs, this, [this, proc]() {
        if (m_process == proc && proc->state() != QProcess::NotRunning) {
            qCWarning(lcFfmpeg) << "Process ignored terminate, killing it";
            proc->kill();
        }
    });
}

bool JobRunner::isRunning() const {
    return m_process && m_process->state() != QProcess::NotRunning;
}

double JobRunner::parseDurationLine(const QString& line) {
    static const QRegularExpression re(R"(Duration:\s*([0-9:.]+))");
    QRegularExpressionMatch m = re.match(line);
    if (!m.hasMatch()) return -1.0;
    return TimeUtil::parseFfmpegTime(m.captured(1));
}

double JobRunner::parseProgressLine(const QString& line) {
    static const QRegularExpression re(R"(time=\s*(-?[0-9:.]+))");
    QRegularExpressionMatch m = re.match(line);
    if (!m.hasMatch()) return -1.0;
    return TimeUtil::parseFfmpegTime(m.captured(1));
}

void JobRunner::onReadyReadStandardError() {
    m_buffer += m_process->readAllStandardError();

    // ffmpeg ends progress lines with '\r', everything else with '\n'
    while (true) {
        int cut = -1;
        for (int i = 0; i < m_buffer.size(); ++i) {
            if (m_buffer[i] == '\n' || m_buffer[i] == '\r') {
                cut = i;
                break;
            }
        }
        if (cut < 0) break;

        QString line = QString::fromUtf8(m_buffer.left(cut)).trimmed();
        m_buffer.remove(0, cut + 1);
        if (!line.isEmpty()) handleLine(line);
    }
}

void JobRunner::flushBuffer() {
    if (m_process)
        m_buffer += m_process->readAllStandardError();
    const QList<QByteArray> rest = m_buffer.split('\n');
    m_buffer.clear();
    for (const QByteArray& chunk : rest) {
        QString line = QString::fromUtf8(chunk).trimmed();
        if (!line.isEmpty()) handleLine(line);
    }
}

void JobRunner::handleLine(const QString& line) {
    qCDebug(lcFfmpeg).noquote() << "ffmpeg:" << line;
    emit outputLine(line);

    if (m_duration <= 0.0) {
        double d = parseDurationLine(line);
        if (d > 0.0) m_duration = d;
    }

    double t = parseProgressLine(line);
    if (t >= 0.0) {
        if (m_duration > 0.0)
            emit progressChanged(std::min(t / m_duration, 1.0));
        return;
    }

    // Progress lines would push the actual error text out of the tail
    m_tail << line;
    while (m_tail.size() > TailLines)
        m_tail.removeFirst();
}

void JobRunner::onProcessFinished(int exitCode, QProcess::ExitStatus status) {
    flushBuffer();
    const QString name = QFileInfo(m_program).fileName();

    if (m_stopRequested) {
        finish(false, exitCode, QString("%1 was stopped").arg(name));
        return;
    }

    if (status == QProcess::CrashExit) {
        QString message = QString("%1 crashed").arg(name);
        if (!m_tail.isEmpty()) message += "\n" + m_tail.join('\n');
        finish(false, -1, message);
        return;
    }

    if (exitCode != 0) {
        QString message = QString("%1 exited with code %2").arg(name).arg(exitCode);
        if (!m_tail.isEmpty()) message += "\n" + m_tail.join('\n');
        finish(false, exitCode, message);
        return;
    }

    emit progressChanged(1.0);
    finish(true, 0, QString("%1 finished successfully").arg(name));
}

void JobRunner::onErrorOccurred(QProcess::ProcessError error) {
    // Crashes are reported through finished(); a failed start never reaches it
    if (error != QProcess::FailedToStart) return;
    finish(false, -1, QString("Failed to start %1: %2").arg(m_program, m_process->errorString()));
}

void JobRunner::finish(bool success, int exitCode, const QString& message) {
    if (m_finished) return;
    m_finished = true;

    if (success)
        qCInfo(lcFfmpeg) << message;
    else
        qCWarning(lcFfmpeg).noquote() << message;
    emit finished(success, exitCode, message);
}

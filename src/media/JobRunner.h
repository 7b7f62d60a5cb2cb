#pragma once

#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

// Runs one external ffmpeg process and reports progress parsed from its
// stderr. Exactly one finished() is emitted per successful start().
class JobRunner : public QObject {
    Q_OBJECT
public:
    explicit JobRunner(QObject* parent = nullptr);
    ~JobRunner();

    // durationSeconds seeds progress; 0 waits for ffmpeg's "Duration:" line.
    bool start(const QString& program, const QStringList& args, double durationSeconds = 0.0);
    void stop();
    bool isRunning() const;

    QStringList recentErrorLines() const { return m_tail; }

    // Both return -1 when the line carries no usable time.
    static double parseDurationLine(const QString& line);
    static double parseProgressLine(const QString& line);

signals:
    void progressChanged(double fraction);  // 0.0 to 1.0
    void outputLine(const QString& line);
    void finished(bool success, int exitCode, const QString& message);

private slots:
    void onReadyReadStandardError();
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void onErrorOccurred(QProcess::ProcessError error);

private:
    void handleLine(const QString& line);
    void flushBuffer();
    void finish(bool success, int exitCode, const QString& message);

    QProcess* m_process = nullptr;
    QString m_program;
    double m_duration = 0.0;
    QByteArray m_buffer;
    QStringList m_tail;
    bool m_stopRequested = false;
    bool m_finished = true;

    static constexpr int TailLines = 20;
    static constexpr int StopGraceMs = 3000;
};

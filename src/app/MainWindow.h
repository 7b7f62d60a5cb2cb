#pragma once

#include <QMainWindow>
#include <QAction>
#include <QLabel>
#include <QProgressBar>
#include <deque>
#include "JobBuilder.h"

class SettingsManager;
class DropArea;
class JobQueueWidget;
class JobRunner;
class PreviewWidget;
class OutputSettingsWidget;
class SubtitleStyleWidget;
class QTabWidget;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(SettingsManager* settings, QWidget* parent = nullptr);
    ~MainWindow();

    void addFiles(const QStringList& paths);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onAddFilesTriggered();
    void onStartTriggered();
    void onStopTriggered();
    void onVideoActivated(const QString& path);
    void onCsvActivated(const QString& path);
    void onStyleChanged(const SubtitleStyle& style);
    void onOutputSettingsEdited(const AppSettings& edited);
    void onJobProgress(double fraction);
    void onJobFinished(bool success, int exitCode, const QString& message);

private:
    struct QueuedJob {
        QString videoPath;
        QString subtitlePath;
    };

    void setupUi();
    void setupActions();
    void setupMenuBar();
    void setupToolBar();
    void startNextJob();
    void finishBatch();
    void setRunning(bool running);
    void saveSettings();
    bool isRunning() const { return m_running; }

    SettingsManager* m_settings;

    DropArea* m_dropArea = nullptr;
    JobQueueWidget* m_queueWidget = nullptr;
    QTabWidget* m_tabs = nullptr;
    PreviewWidget* m_previewWidget = nullptr;
    OutputSettingsWidget* m_outputWidget = nullptr;
    SubtitleStyleWidget* m_styleWidget = nullptr;
    QProgressBar* m_progressBar = nullptr;
    QLabel* m_statusLabel = nullptr;

    QAction* m_addAction = nullptr;
    QAction* m_startAction = nullptr;
    QAction* m_stopAction = nullptr;
    QAction* m_exitAction = nullptr;

    JobRunner* m_runner = nullptr;
    std::deque<QueuedJob> m_pending;
    QueuedJob m_current;
    PreparedJob m_currentJob;
    bool m_running = false;
    bool m_stopRequested = false;
    int m_succeeded = 0;
    int m_failed = 0;
};

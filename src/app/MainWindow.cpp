#include "MainWindow.h"
#include "AppConstants.h"
#include "AssWriter.h"
#include "CsvMappingDialog.h"
#include "CsvParser.h"
#include "DropArea.h"
#include "FrameGrabber.h"
#include "JobQueueWidget.h"
#include "JobRunner.h"
#include "Logger.h"
#include "MediaProbe.h"
#include "OutputSettingsWidget.h"
#include "PreviewWidget.h"
#include "SettingsManager.h"
#include "SubtitleStyleWidget.h"

#include <QCloseEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QMenuBar>
#include <QMessageBox>
#include <QSplitter>
#include <QStatusBar>
#include <QTabWidget>
#include <QToolBar>
#include <QVBoxLayout>
#include <algorithm>

MainWindow::MainWindow(SettingsManager* settings, QWidget* parent)
    : QMainWindow(parent)
    , m_settings(settings)
{
    setWindowTitle(QString("%1 v%2").arg(AppConstants::AppDisplayName, AppConstants::AppVersion));
    resize(AppConstants::DefaultWindowWidth, AppConstants::DefaultWindowHeight);

    m_runner = new JobRunner(this);

    setupUi();
    setupActions();
    setupMenuBar();
    setupToolBar();

    connect(m_dropArea, &DropArea::filesDropped, this, &MainWindow::addFiles);
    connect(m_queueWidget, &JobQueueWidget::addFilesRequested, this, &MainWindow::onAddFilesTriggered);
    connect(m_queueWidget, &JobQueueWidget::videoActivated, this, &MainWindow::onVideoActivated);
    connect(m_queueWidget, &JobQueueWidget::csvActivated, this, &MainWindow::onCsvActivated);
    connect(m_styleWidget, &SubtitleStyleWidget::styleChanged, this, &MainWindow::onStyleChanged);
    connect(m_outputWidget, &OutputSettingsWidget::settingsEdited, this, &MainWindow::onOutputSettingsEdited);
    connect(m_settings, &SettingsManager::settingsChanged, m_outputWidget, &OutputSettingsWidget::setSettings);
    connect(m_runner, &JobRunner::progressChanged, this, &MainWindow::onJobProgress);
    connect(m_runner, &JobRunner::finished, this, &MainWindow::onJobFinished);

    const AppSettings& s = m_settings->settings();
    m_outputWidget->setSettings(s);
    m_styleWidget->setStyle(s.style);
    m_previewWidget->setSubtitleStyle(s.style);

    setRunning(false);
    m_statusLabel->setText("Ready");
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    auto* splitter = new QSplitter(Qt::Horizontal, this);

    auto* left = new QWidget(splitter);
    auto* leftLayout = new QVBoxLayout(left);
    leftLayout->setContentsMargins(4, 4, 4, 4);
    m_dropArea = new DropArea(left);
    m_queueWidget = new JobQueueWidget(left);
    leftLayout->addWidget(m_dropArea);
    leftLayout->addWidget(m_queueWidget, 1);

    m_tabs = new QTabWidget(splitter);
    m_previewWidget = new PreviewWidget(m_tabs);
    m_outputWidget = new OutputSettingsWidget(m_tabs);
    m_styleWidget = new SubtitleStyleWidget(m_tabs);
    m_tabs->addTab(m_previewWidget, "Preview");
    m_tabs->addTab(m_outputWidget, "Output Settings");
    m_tabs->addTab(m_styleWidget, "Subtitle Style");

    splitter->addWidget(left);
    splitter->addWidget(m_tabs);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 2);
    setCentralWidget(splitter);

    m_statusLabel = new QLabel(this);
    m_progressBar = new QProgressBar(this);
    m_progressBar->setRange(0, 1000);
    m_progressBar->setMaximumWidth(240);
    m_progressBar->setTextVisible(false);
    statusBar()->addWidget(m_statusLabel, 1);
    statusBar()->addPermanentWidget(m_progressBar);
}

void MainWindow::setupActions() {
    m_addAction = new QAction("&Add Files...", this);
    m_addAction->setShortcut(QKeySequence::Open);
    connect(m_addAction, &QAction::triggered, this, &MainWindow::onAddFilesTriggered);

    m_startAction = new QAction("&Start", this);
    m_startAction->setShortcut(Qt::CTRL | Qt::Key_R);
    connect(m_startAction, &QAction::triggered, this, &MainWindow::onStartTriggered);

    m_stopAction = new QAction("S&top", this);
    connect(m_stopAction, &QAction::triggered, this, &MainWindow::onStopTriggered);

    m_exitAction = new QAction("E&xit", this);
    m_exitAction->setShortcut(QKeySequence::Quit);
    connect(m_exitAction, &QAction::triggered, this, &QWidget::close);
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");
    fileMenu->addAction(m_addAction);
    fileMenu->addSeparator();
    fileMenu->addAction(m_startAction);
    fileMenu->addAction(m_stopAction);
    fileMenu->addSeparator();
    fileMenu->addAction(m_exitAction);

    auto* helpMenu = menuBar()->addMenu("&Help");
    auto* aboutAction = helpMenu->addAction("&About");
    connect(aboutAction, &QAction::triggered, this, [this]() {
        QMessageBox::about(this, QString("About %1").arg(AppConstants::AppDisplayName),
            QString("<h3>%1 v%2</h3>"
                    "<p>Burns subtitles (SRT, ASS, CSV) into videos with ffmpeg.</p>"
                    "<p>Settings: %3</p>")
            .arg(AppConstants::AppDisplayName, AppConstants::AppVersion,
                 m_settings->filePath().toHtmlEscaped()));
    });
}

void MainWindow::setupToolBar() {
    auto* toolBar = addToolBar("Main");
    toolBar->setObjectName("MainToolBar");
    toolBar->setMovable(false);
    toolBar->addAction(m_addAction);
    toolBar->addSeparator();
    toolBar->addAction(m_startAction);
    toolBar->addAction(m_stopAction);
}

void MainWindow::addFiles(const QStringList& paths) {
    int added = m_queueWidget->addFiles(paths);
    if (added == 0) {
        m_statusLabel->setText("No supported files added");
        return;
    }

    // Show resolution and length next to each new video
    for (const QString& path : paths) {
        if (!JobQueueWidget::isVideoFile(path)) continue;
        const QString absPath = QFileInfo(path).absoluteFilePath();

        MediaProbe probe;
        if (!probe.probe(absPath)) {
            qCWarning(lcUi) << "Cannot probe" << absPath << probe.errorString();
            m_queueWidget->setVideoInfo(absPath, "unreadable media");
            continue;
        }
        m_queueWidget->setVideoInfo(absPath, probe.info().summary());
    }

    m_statusLabel->setText(QString("%1 file(s) added").arg(added));
}

void MainWindow::onAddFilesTriggered() {
    QStringList paths = QFileDialog::getOpenFileNames(this, "Add Files", {},
                                                      JobQueueWidget::fileDialogFilter());
    if (!paths.isEmpty()) addFiles(paths);
}

void MainWindow::saveSettings() {
    if (!m_settings->save()) {
        m_statusLabel->setText(QString("Settings not saved: %1").arg(m_settings->errorString()));
    }
}

void MainWindow::onStyleChanged(const SubtitleStyle& style) {
    m_settings->setStyle(style);
    m_previewWidget->setSubtitleStyle(style);
    saveSettings();
}

void MainWindow::onOutputSettingsEdited(const AppSettings& edited) {
    // The output tab only owns these fields
    AppSettings s = m_settings->settings();
    s.outputDir = edited.outputDir;
    s.ffmpegPath = edited.ffmpegPath;
    s.crf = edited.crf;
    s.preset = edited.preset;
    s.startOffset = edited.startOffset;
    s.fps = edited.fps;
    m_settings->setSettings(s);
    saveSettings();
}

void MainWindow::onVideoActivated(const QString& path) {
    m_tabs->setCurrentWidget(m_previewWidget);

    const QString subtitle = JobBuilder::matchSubtitle(path, m_queueWidget->subtitles());
    if (subtitle.isEmpty()) {
        m_previewWidget->clearPreview("Add a subtitle file to preview it on this video");
        return;
    }

    JobBuilder builder;
    SubtitleLines lines;
    if (!builder.loadSubtitles(subtitle, m_settings->settings(), lines)) {
        m_previewWidget->clearPreview(builder.errorString());
        return;
    }
    if (m_settings->settings().startOffset != 0.0)
        lines = AssWriter::shifted(lines, m_settings->settings().startOffset);

    FrameGrabber grabber;
    if (!grabber.open(path)) {
        m_previewWidget->clearPreview(grabber.errorString());
        return;
    }

    // A frame from under the first cue, kept inside the video
    double at = lines.empty() ? 0.0 : lines.front().start;
    if (grabber.duration() > 0.0)
        at = std::min(at, std::max(0.0, grabber.duration() - 1.0));

    QImage frame = grabber.grabFrameAt(at);
    if (frame.isNull()) {
        m_previewWidget->clearPreview(grabber.errorString());
        return;
    }

    m_previewWidget->showPreview(frame, lines);
    m_statusLabel->setText(QString("Previewing %1 with %2")
        .arg(QFileInfo(path).fileName(), QFileInfo(subtitle).fileName()));
}

void MainWindow::onCsvActivated(const QString& path) {
    QString error;
    QStringList header = CsvParser::readHeader(path, &error);
    if (header.isEmpty()) {
        QMessageBox::critical(this, "CSV Columns", error.isEmpty() ? "The file has no header row." : error);
        return;
    }

    CsvMapping current;
    if (!m_settings->csvMapping(path, current)) {
        current = CsvParser::guessMapping(header);
        current.fps = m_settings->settings().fps;
    }

    CsvMappingDialog dialog(path, header, current, this);
    if (dialog.exec() != QDialog::Accepted) return;

    m_settings->setCsvMapping(path, dialog.mapping());
    saveSettings();
    qCInfo(lcUi) << "Saved CSV mapping for" << path;
}

void MainWindow::setRunning(bool running) {
    m_running = running;
    m_startAction->setEnabled(!running);
    m_stopAction->setEnabled(running);
    m_addAction->setEnabled(!running);
    m_dropArea->setEnabled(!running);
    m_queueWidget->setBusy(running);
    m_outputWidget->setEnabled(!running);
    m_styleWidget->setEnabled(!running);
    m_progressBar->setVisible(running);
}

void MainWindow::onStartTriggered() {
    if (isRunning()) return;

    const QStringList videos = m_queueWidget->videos();
    const QStringList subtitles = m_queueWidget->subtitles();
    if (videos.isEmpty()) {
        QMessageBox::information(this, "Start", "Add at least one video file.");
        return;
    }
    if (subtitles.isEmpty()) {
        QMessageBox::information(this, "Start", "Add at least one subtitle file.");
        return;
    }

    m_pending.clear();
    for (const QString& video : videos) {
        m_pending.push_back({video, JobBuilder::matchSubtitle(video, subtitles)});
        m_queueWidget->setStatus(video, "Waiting");
    }

    m_succeeded = 0;
    m_failed = 0;
    m_stopRequested = false;
    setRunning(true);
    startNextJob();
}

void MainWindow::startNextJob() {
    while (!m_pending.empty()) {
        m_current = m_pending.front();
        m_pending.pop_front();

        BurnRequest request;
        request.videoPath = m_current.videoPath;
        request.subtitlePath = m_current.subtitlePath;
        request.settings = m_settings->settings();
        request.outputPath = JobBuilder::outputPathFor(m_current.videoPath, request.settings);

        JobBuilder builder;
        m_currentJob = PreparedJob{};
        if (!builder.prepare(request, m_currentJob)) {
            ++m_failed;
            m_queueWidget->setStatus(m_current.videoPath, "Failed");
            QMessageBox::critical(this, "Cannot Start Job",
                QString("%1\n\n%2").arg(QFileInfo(m_current.videoPath).fileName(), builder.errorString()));
            continue;
        }

        m_progressBar->setValue(0);
        m_queueWidget->setStatus(m_current.videoPath, "Processing...");
        m_statusLabel->setText(QString("Burning %1 into %2")
            .arg(QFileInfo(m_current.subtitlePath).fileName(), QFileInfo(m_current.videoPath).fileName()));

        if (m_runner->start(m_currentJob.program, m_currentJob.args, m_currentJob.duration))
            return;

        ++m_failed;
        m_queueWidget->setStatus(m_current.videoPath, "Failed");
    }

    finishBatch();
}

void MainWindow::onJobProgress(double fraction) {
    m_progressBar->setValue(static_cast<int>(fraction * m_progressBar->maximum()));
}

void MainWindow::onJobFinished(bool success, int exitCode, const QString& message) {
    Q_UNUSED(exitCode);
    m_currentJob = PreparedJob{};

    if (success) {
        ++m_succeeded;
        m_queueWidget->setStatus(m_current.videoPath, "Done");
    } else if (m_stopRequested) {
        m_queueWidget->setStatus(m_current.videoPath, "Stopped");
    } else {
        ++m_failed;
        m_queueWidget->setStatus(m_current.videoPath, "Failed");
        QMessageBox::critical(this, "Job Failed",
            QString("%1\n\n%2").arg(QFileInfo(m_current.videoPath).fileName(), message));
    }

    if (m_stopRequested) {
        finishBatch();
        return;
    }
    startNextJob();
}

void MainWindow::onStopTriggered() {
    if (!isRunning()) return;
    m_stopRequested = true;
    for (const QueuedJob& job : m_pending)
        m_queueWidget->setStatus(job.videoPath, QString());
    m_pending.clear();
    m_statusLabel->setText("Stopping...");
    m_runner->stop();
}

void MainWindow::finishBatch() {
    setRunning(false);
    QString summary = m_stopRequested
        ? QString("Stopped. %1 done, %2 failed").arg(m_succeeded).arg(m_failed)
        : QString("Finished. %1 done, %2 failed").arg(m_succeeded).arg(m_failed);
    m_statusLabel->setText(summary);
    qCInfo(lcUi).noquote() << summary;
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (isRunning()) {
        auto answer = QMessageBox::question(this, "Quit",
            "A job is still running. Stop it and quit?",
            QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        m_stopRequested = true;
        m_pending.clear();
        m_runner->stop();
    }
    event->accept();
}

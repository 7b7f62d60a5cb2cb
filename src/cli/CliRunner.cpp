#include "CliRunner.h"
#include "JobBuilder.h"
#include "JobRunner.h"
#include "Logger.h"
#include "SettingsManager.h"

#include <QEventLoop>
#include <cstdio>

namespace {

void printError(const QString& message) {
    std::fprintf(stderr, "error: %s\n", message.toLocal8Bit().constData());
    std::fflush(stderr);
}

} // namespace

CliRunner::CliRunner(QObject* parent) : QObject(parent) {}

int CliRunner::run(const CliOptions& options) {
    SettingsManager settings(options.configPath.isEmpty()
                                 ? SettingsManager::defaultConfigPath()
                                 : options.configPath);
    if (!settings.load())
        qCWarning(lcSettings) << "Using default settings:" << settings.errorString();

    BurnRequest request;
    request.videoPath = options.videoPath;
    request.subtitlePath = options.subtitlePath;
    request.outputPath = options.outputPath;
    request.settings = options.applyOverrides(settings.settings());
    request.codecCopy = !options.noCopy;

    JobBuilder builder;
    PreparedJob job;
    if (!builder.prepare(request, job)) {
        printError(builder.errorString());
        return ExitUsage;
    }

    qCInfo(lcApp) << "Burning" << job.lines.size() << "cues into" << job.outputPath;

    JobRunner runner;
    QEventLoop loop;
    bool done = false;
    int exitCode = ExitFailure;

    // ffmpeg's own output is passed through so the terminal shows its progress
    connect(&runner, &JobRunner::outputLine, this, [](const QString& line) {
        std::fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
    });
    connect(&runner, &JobRunner::finished, this,
            [&](bool success, int code, const QString& message) {
        done = true;
        if (success) {
            std::fprintf(stdout, "%s\n", job.outputPath.toLocal8Bit().constData());
            exitCode = ExitSuccess;
        } else {
            // The tail of stderr has already been echoed line by line
            printError(message.section('\n', 0, 0));
            exitCode = code > 0 ? code : ExitFailure;
        }
        loop.quit();
    });

    if (!runner.start(job.program, job.args, job.duration)) {
        printError("Could not start the job");
        return ExitFailure;
    }
    if (!done)
        loop.exec();

    return exitCode;
}

#include <QCoreApplication>
#include <cstdio>
#include "AppConstants.h"
#include "CliOptions.h"
#include "CliRunner.h"
#include "Logger.h"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    CliOptions options;
    QString error;
    QString help;
    if (!CliParser::parse(app.arguments(), options, &error, &help)) {
        std::fprintf(stderr, "%s: %s\n\n%s", AppConstants::CliName,
                     error.toLocal8Bit().constData(), help.toLocal8Bit().constData());
        return CliRunner::ExitUsage;
    }
    if (options.helpRequested) {
        std::fprintf(stdout, "%s", help.toLocal8Bit().constData());
        return CliRunner::ExitSuccess;
    }
    if (options.versionRequested) {
        std::fprintf(stdout, "%s %s\n", AppConstants::CliName, AppConstants::AppVersion);
        return CliRunner::ExitSuccess;
    }

    // Errors reach the user through stderr directly; the console only gets
    // log records in verbose mode
    const QString logDir = Logger::defaultLogDir();
    if (!Logger::setup(logDir, options.verbose ? QtDebugMsg : QtCriticalMsg))
        std::fprintf(stderr, "warning: cannot write logs to %s\n", logDir.toLocal8Bit().constData());

    CliRunner runner;
    int code = runner.run(options);

    Logger::shutdown();
    return code;
}

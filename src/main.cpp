#include <QApplication>
#include "MainWindow.h"
#include "AppConstants.h"
#include "Logger.h"
#include "SettingsManager.h"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationDisplayName(AppConstants::AppDisplayName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    if (!Logger::setup(Logger::defaultLogDir(), QtInfoMsg))
        qCWarning(lcApp) << "File logging disabled, cannot create" << Logger::defaultLogDir();
    qCInfo(lcApp) << AppConstants::AppName << AppConstants::AppVersion << "starting";

    SettingsManager settings;
    if (!settings.load())
        qCWarning(lcApp) << "Using default settings:" << settings.errorString();

    MainWindow window(&settings);
    window.show();

    // Files given on the command line are queued like dropped ones
    QStringList files = app.arguments().mid(1);
    if (!files.isEmpty())
        window.addFiles(files);

    int code = app.exec();
    Logger::shutdown();
    return code;
}

#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <map>
#include "SubtitleStyle.h"
#include "SubtitleData.h"
#include "AppConstants.h"

struct AppSettings {
    QString outputDir;                  // empty = "<video dir>/output"
    QString ffmpegPath = AppConstants::DefaultFfmpegProgram;
    SubtitleStyle style;
    double fps = AppConstants::DefaultCsvFps;
    double startOffset = 0.0;           // seconds added to every cue
    int crf = AppConstants::DefaultCrf;
    QString preset = AppConstants::DefaultPreset;
    std::map<QString, CsvMapping> csvMappings; // keyed by CSV file path
};

// Persistent settings stored as JSON in the user's config directory.
// Loading never fails hard: a missing or damaged file is replaced by defaults.
class SettingsManager : public QObject {
    Q_OBJECT
public:
    explicit SettingsManager(QObject* parent = nullptr);
    explicit SettingsManager(const QString& filePath, QObject* parent = nullptr);
    ~SettingsManager();

    bool load();
    bool save();

    const AppSettings& settings() const { return m_settings; }
    void setSettings(const AppSettings& settings);

    void setStyle(const SubtitleStyle& style);
    bool csvMapping(const QString& csvPath, CsvMapping& mapping) const;
    void setCsvMapping(const QString& csvPath, const CsvMapping& mapping);

    QString filePath() const { return m_filePath; }
    QString errorString() const { return m_error; }

    static QString defaultConfigPath();

    static QJsonObject toJson(const AppSettings& settings);
    static AppSettings fromJson(const QJsonObject& obj);
    static QJsonObject mappingToJson(const CsvMapping& mapping);
    static CsvMapping mappingFromJson(const QJsonObject& obj);

signals:
    void settingsChanged(const AppSettings& settings);

private:
    QString m_filePath;
    AppSettings m_settings;
    QString m_error;
};

#include "SettingsManager.h"
#include "AppConstants.h"
#include "Logger.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QStandardPaths>

SettingsManager::SettingsManager(QObject* parent)
    : SettingsManager(defaultConfigPath(), parent)
{
}

SettingsManager::SettingsManager(const QString& filePath, QObject* parent)
    : QObject(parent)
    , m_filePath(filePath)
{
}

SettingsManager::~SettingsManager() = default;

QString SettingsManager::defaultConfigPath() {
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return QDir(base).filePath(QString("%1/config.json").arg(AppConstants::AppName));
}

bool SettingsManager::load() {
    QFileInfo info(m_filePath);
    if (!info.exists()) {
        qCInfo(lcSettings) << "No settings file, writing defaults to" << m_filePath;
        m_settings = AppSettings{};
        return save();
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(m_filePath);
        m_settings = AppSettings{};
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        // Keep the damaged file next to the regenerated one
        QString backup = info.dir().filePath(info.completeBaseName() + ".bak");
        QFile::remove(backup);
        if (!QFile::rename(m_filePath, backup))
            qCWarning(lcSettings) << "Cannot back up damaged settings file" << m_filePath;
        qCWarning(lcSettings) << "Settings file is damaged (" << parseError.errorString()
                              << "), backed up to" << backup;
        m_settings = AppSettings{};
        return save();
    }

    m_settings = fromJson(doc.object());
    qCDebug(lcSettings) << "Loaded settings from" << m_filePath;
    return true;
}

bool SettingsManager::save() {
    QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        m_error = QString("Cannot create directory: %1").arg(info.absolutePath());
        return false;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        m_error = QString("Cannot write to: %1").arg(m_filePath);
        qCWarning(lcSettings) << m_error;
        return false;
    }

    file.write(QJsonDocument(toJson(m_settings)).toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

void SettingsManager::setSettings(const AppSettings& settings) {
    m_settings = settings;
    emit settingsChanged(m_settings);
}

void SettingsManager::setStyle(const SubtitleStyle& style) {
    m_settings.style = style;
    emit settingsChanged(m_settings);
}

bool SettingsManager::csvMapping(const QString& csvPath, CsvMapping& mapping) const {
    auto it = m_settings.csvMappings.find(csvPath);
    if (it == m_settings.csvMappings.end()) return false;
    mapping = it->second;
    return true;
}

void SettingsManager::setCsvMapping(const QString& csvPath, const CsvMapping& mapping) {
    m_settings.csvMappings[csvPath] = mapping;
    emit settingsChanged(m_settings);
}

QJsonObject SettingsManager::mappingToJson(const CsvMapping& mapping) {
    QJsonObject obj;
    obj["start_col"] = mapping.startColumn;
    obj["end_col"] = mapping.endColumn.isEmpty() ? QJsonValue() : QJsonValue(mapping.endColumn);
    obj["text_col"] = mapping.textColumn;
    obj["time_unit"] = QString(mapping.timeUnit == CsvTimeUnit::Frames ? "frames" : "seconds");
    obj["fps"] = mapping.fps;
    return obj;
}

CsvMapping SettingsManager::mappingFromJson(const QJsonObject& obj) {
    // Columns may have been stored as names or as plain numbers
    auto columnSpec = [](const QJsonValue& v, const QString& fallback) {
        if (v.isString()) return v.toString();
        if (v.isDouble()) return QString::number(v.toInt());
        return fallback;
    };

    CsvMapping mapping;
    mapping.startColumn = columnSpec(obj["start_col"], mapping.startColumn);
    mapping.endColumn = columnSpec(obj["end_col"], QString());
    mapping.textColumn = columnSpec(obj["text_col"], mapping.textColumn);
    mapping.timeUnit = obj["time_unit"].toString() == "frames" ? CsvTimeUnit::Frames : CsvTimeUnit::Seconds;
    mapping.fps = obj["fps"].toDouble(AppConstants::DefaultCsvFps);
    return mapping;
}

QJsonObject SettingsManager::toJson(const AppSettings& settings) {
    QJsonObject mappings;
    for (const auto& [path, mapping] : settings.csvMappings)
        mappings[path] = mappingToJson(mapping);

    QJsonObject root;
    root["output_dir"] = settings.outputDir;
    root["ffmpeg_path"] = settings.ffmpegPath;
    root["font"] = StyleUtil::toJson(settings.style);
    root["fps"] = settings.fps;
    root["start_offset"] = settings.startOffset;
    root["crf"] = settings.crf;
    root["preset"] = settings.preset;
    root["csv_mappings"] = mappings;
    return root;
}

AppSettings SettingsManager::fromJson(const QJsonObject& obj) {
    AppSettings defaults;
    AppSettings s;
    s.outputDir = obj["output_dir"].toString(defaults.outputDir);
    s.ffmpegPath = obj["ffmpeg_path"].toString(defaults.ffmpegPath);
    s.style = StyleUtil::fromJson(obj["font"].toObject());
    s.fps = obj["fps"].toDouble(defaults.fps);
    s.startOffset = obj["start_offset"].toDouble(defaults.startOffset);
    s.crf = obj["crf"].toInt(defaults.crf);
    s.preset = obj["preset"].toString(defaults.preset);
    if (s.ffmpegPath.isEmpty()) s.ffmpegPath = defaults.ffmpegPath;
    if (s.preset.isEmpty()) s.preset = defaults.preset;

    const QJsonObject mappings = obj["csv_mappings"].toObject();
    for (auto it = mappings.constBegin(); it != mappings.constEnd(); ++it)
        s.csvMappings[it.key()] = mappingFromJson(it.value().toObject());
    return s;
}

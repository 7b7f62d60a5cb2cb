#include <cassert>
#include <cstdio>
#include <cmath>
#include <QCoreApplication>
#include <QFile>
#include <QStandardPaths>
#include <QTemporaryDir>
#include "core/SettingsManager.h"

static QByteArray readAll(const QString& path) {
    QFile file(path);
    bool ok = file.open(QIODevice::ReadOnly);
    assert(ok);
    return file.readAll();
}

void test_default_config_path() {
    QString path = SettingsManager::defaultConfigPath();
    assert(path.endsWith("SubtitleInserter/config.json"));
    printf("PASS: test_default_config_path\n");
}

void test_missing_file_writes_defaults(const QTemporaryDir& dir) {
    QString path = dir.filePath("fresh/config.json");
    SettingsManager manager(path);
    assert(manager.load());
    assert(QFile::exists(path));

    const AppSettings& s = manager.settings();
    assert(s.crf == 23);
    assert(s.preset == "veryfast");
    assert(s.ffmpegPath == "ffmpeg");
    assert(s.outputDir.isEmpty());
    assert(s.style == SubtitleStyle{});
    assert(s.csvMappings.empty());
    printf("PASS: test_missing_file_writes_defaults\n");
}

void test_round_trip(const QTemporaryDir& dir) {
    QString path = dir.filePath("roundtrip.json");

    AppSettings s;
    s.outputDir = "/tmp/out";
    s.ffmpegPath = "/opt/ffmpeg/bin/ffmpeg";
    s.style.family = "Noto Sans";
    s.style.size = 40;
    s.style.bold = true;
    s.fps = 25.0;
    s.startOffset = -1.25;
    s.crf = 18;
    s.preset = "slow";

    CsvMapping frames;
    frames.startColumn = "frame";
    frames.textColumn = "caption";
    frames.timeUnit = CsvTimeUnit::Frames;
    frames.fps = 24.0;
    s.csvMappings["/data/cues.csv"] = frames;

    {
        SettingsManager writer(path);
        writer.setSettings(s);
        assert(writer.save());
    }

    SettingsManager reader(path);
    assert(reader.load());
    const AppSettings& r = reader.settings();
    assert(r.outputDir == s.outputDir);
    assert(r.ffmpegPath == s.ffmpegPath);
    assert(r.style == s.style);
    assert(std::fabs(r.startOffset + 1.25) < 1e-9);
    assert(r.crf == 18);
    assert(r.preset == "slow");

    CsvMapping loaded;
    assert(reader.csvMapping("/data/cues.csv", loaded));
    assert(loaded.startColumn == "frame");
    assert(loaded.endColumn.isEmpty());
    assert(loaded.textColumn == "caption");
    assert(loaded.timeUnit == CsvTimeUnit::Frames);
    assert(loaded.fps == 24.0);
    assert(!reader.csvMapping("/data/other.csv", loaded));

    QString text = QString::fromUtf8(readAll(path));
    assert(text.contains("\"end_col\": null"));
    printf("PASS: test_round_trip\n");
}

void test_damaged_file_is_backed_up(const QTemporaryDir& dir) {
    QString path = dir.filePath("damaged/config.json");
    QString backup = dir.filePath("damaged/config.bak");
    {
        SettingsManager seed(path);
        assert(seed.save());
    }
    QFile file(path);
    bool ok = file.open(QIODevice::WriteOnly | QIODevice::Truncate);
    assert(ok);
    file.write("{ not json");
    file.close();

    SettingsManager manager(path);
    assert(manager.load());
    assert(manager.settings().crf == 23);
    assert(QFile::exists(backup));
    assert(readAll(backup) == "{ not json");
    assert(readAll(path).contains("\"crf\""));
    printf("PASS: test_damaged_file_is_backed_up\n");
}

void test_partial_json_uses_defaults() {
    QJsonObject obj;
    obj["crf"] = 30;
    obj["preset"] = "";
    QJsonObject columns;
    columns["start_col"] = 3;
    QJsonObject mappings;
    mappings["a.csv"] = columns;
    obj["csv_mappings"] = mappings;

    AppSettings s = SettingsManager::fromJson(obj);
    assert(s.crf == 30);
    assert(s.preset == "veryfast");
    assert(s.style == SubtitleStyle{});
    assert(s.csvMappings["a.csv"].startColumn == "3");
    assert(s.csvMappings["a.csv"].textColumn == "2");
    printf("PASS: test_partial_json_uses_defaults\n");
}

void test_change_signal(const QTemporaryDir& dir) {
    SettingsManager manager(dir.filePath("signal.json"));
    int changes = 0;
    QObject::connect(&manager, &SettingsManager::settingsChanged,
                     [&changes](const AppSettings&) { ++changes; });

    SubtitleStyle style;
    style.size = 60;
    manager.setStyle(style);
    manager.setCsvMapping("x.csv", CsvMapping{});
    assert(changes == 2);
    assert(manager.settings().style.size == 60);
    printf("PASS: test_change_signal\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("SubtitleInserter");
    QStandardPaths::setTestModeEnabled(true);

    QTemporaryDir dir;
    assert(dir.isValid());

    test_default_config_path();
    test_missing_file_writes_defaults(dir);
    test_round_trip(dir);
    test_damaged_file_is_backed_up(dir);
    test_partial_json_uses_defaults();
    test_change_signal(dir);
    printf("All settings tests passed.\n");
    return 0;
}

#pragma once

#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <memory>
#include "SettingsManager.h"
#include "SubtitleData.h"

struct BurnRequest {
    QString videoPath;
    QString subtitlePath;
    QString outputPath;         // empty = <video dir>/<stem>_sub.<ext>
    AppSettings settings;       // effective settings, overrides already applied
    bool codecCopy = true;
};

// Everything needed to launch one burn. Owns the temporary directory that
// holds generated subtitle files, so keep it alive until the process exits.
struct PreparedJob {
    QString program;
    QStringList args;
    QString outputPath;
    QString subtitleFile;       // file handed to the subtitles filter
    SubtitleLines lines;
    double duration = 0.0;      // seconds, 0 if the probe failed
    std::unique_ptr<QTemporaryDir> tempDir;
};

class JobBuilder {
public:
    bool prepare(const BurnRequest& request, PreparedJob& job);
    QString errorString() const { return m_error; }

    // Parses any supported subtitle file. CSV files use the mapping stored
    // in settings for that path, else the one guessed from the header.
    bool loadSubtitles(const QString& subtitlePath, const AppSettings& settings,
                       SubtitleLines& lines, bool* isCsv = nullptr);

    static bool isValidPreset(const QString& preset);
    static QStringList presets();

    // Where the GUI writes a burned video: the configured output folder, or
    // "output" beside the video when none is set.
    static QString outputPathFor(const QString& videoPath, const AppSettings& settings);

    // Subtitle sharing the video's file stem (case-insensitive), else the
    // first one. Empty when there are no subtitles.
    static QString matchSubtitle(const QString& videoPath, const QStringList& subtitlePaths);

private:
    bool fail(const QString& message);
    bool checkInputFile(const QString& path, const QString& what);

    QString m_error;
};

#pragma once

#include <QString>
#include <QStringList>
#include "SubtitleStyle.h"

struct BurnCommand {
    QString program = "ffmpeg";
    QString videoPath;
    QString subtitlePath;        // empty = no subtitles filter
    QString outputPath;
    bool codecCopy = true;       // only honoured when no filter is applied
    int crf = -1;                // < 0 = default
    QString preset;              // empty = default
    bool forceStyle = false;     // apply `style` through force_style
    SubtitleStyle style;
    QStringList extraOptions;    // inserted before the output path
};

// Turns a BurnCommand into ffmpeg arguments:
//   -y -i <video> [-vf subtitles=...] <codec args> [extra] <output>
class FfmpegCommandBuilder {
public:
    static QStringList build(const BurnCommand& command, QString* error = nullptr);

    // subtitles='<path>'[:force_style='<style>']
    static QString filterExpression(const QString& subtitlePath,
                                    const SubtitleStyle* style = nullptr);

    // Escapes a path for use inside a single-quoted filter option value.
    static QString escapeFilterPath(const QString& path);

    // <dir>/<stem>_sub.<ext>
    static QString defaultOutputPath(const QString& videoPath);

    // "clip.mp4" -> "clip_sub.mp4". A leading dot does not start an
    // extension, so ".mp4" -> ".mp4_sub".
    static QString outputFileName(const QString& fileName);

    // Shell-style rendering for logs and error messages
    static QString commandLine(const QString& program, const QStringList& args);
};

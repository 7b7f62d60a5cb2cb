#include "FfmpegCommandBuilder.h"
#include "AppConstants.h"
#include "Logger.h"

#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>

QString FfmpegCommandBuilder::escapeFilterPath(const QString& path) {
    // The value passes through two unescaping levels: the filtergraph parser
    // (which keeps quoted text literally) and the filter's option parser.
    QString escaped = QDir::fromNativeSeparators(path);
    escaped.replace("\\", "\\\\");
    escaped.replace(":", "\\:");
    escaped.replace("'", "'\\\\\\''");
    return escaped;
}

QString FfmpegCommandBuilder::filterExpression(const QString& subtitlePath,
                                               const SubtitleStyle* style) {
    QString expr = QString("subtitles='%1'").arg(escapeFilterPath(subtitlePath));
    if (style) {
        QString forced = StyleUtil::toForceStyle(*style);
        if (!forced.isEmpty())
            expr += QString(":force_style='%1'").arg(forced);
    }
    return expr;
}

QStringList FfmpegCommandBuilder::build(const BurnCommand& command, QString* error) {
    if (command.videoPath.isEmpty() || command.outputPath.isEmpty()) {
        if (error) *error = "Both the input video and the output path are required";
        return {};
    }

    QStringList args;
    args << "-y" << "-i" << command.videoPath;

    bool filtered = false;
    if (!command.subtitlePath.isEmpty()) {
        args << "-vf" << filterExpression(command.subtitlePath,
                                          command.forceStyle ? &command.style : nullptr);
        filtered = true;
    }

    if (command.codecCopy && !filtered) {
        args << "-c:v" << "copy" << "-c:a" << "copy";
    } else {
        // Filtering needs a re-encode
        int crf = command.crf >= 0 ? command.crf : AppConstants::DefaultCrf;
        QString preset = command.preset.isEmpty() ? QString(AppConstants::DefaultPreset) : command.preset;
        args << "-c:v" << "libx264"
             << "-crf" << QString::number(crf)
             << "-preset" << preset
             << "-c:a" << "aac";
    }

    args << command.extraOptions;
    args << command.outputPath;

    qCDebug(lcFfmpeg) << "FFmpeg command:" << commandLine(command.program, args);
    return args;
}

QString FfmpegCommandBuilder::defaultOutputPath(const QString& videoPath) {
    const QString fileName = QFileInfo(videoPath).fileName();
    // Keep the directory part exactly as given
    return videoPath.left(videoPath.size() - fileName.size()) + outputFileName(fileName);
}

QString FfmpegCommandBuilder::outputFileName(const QString& fileName) {
    const int dot = fileName.lastIndexOf('.');
    if (dot <= 0 || dot == fileName.size() - 1)
        return fileName + AppConstants::OutputSuffix;
    return fileName.left(dot) + AppConstants::OutputSuffix + fileName.mid(dot);
}

QString FfmpegCommandBuilder::commandLine(const QString& program, const QStringList& args) {
    static const QRegularExpression safe(R"(^[A-Za-z0-9_@%+=:,./-]+$)");

    QStringList parts;
    for (const QString& a : QStringList{program} + args) {
        if (!a.isEmpty() && safe.match(a).hasMatch()) {
            parts << a;
        } else {
            QString quoted = a;
            quoted.replace("'", "'\"'\"'");
            parts << "'" + quoted + "'";
        }
    }
    return parts.join(' ');
}

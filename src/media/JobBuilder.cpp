#include "JobBuilder.h"
#include "AssWriter.h"
#include "CsvParser.h"
#include "FfmpegCommandBuilder.h"
#include "Logger.h"
#include "MediaProbe.h"
#include "SubtitleParserFactory.h"

#include <QDir>
#include <QFileInfo>

QStringList JobBuilder::presets() {
    return {"ultrafast", "superfast", "veryfast", "faster", "fast",
            "medium", "slow", "slower", "veryslow"};
}

bool JobBuilder::isValidPreset(const QString& preset) {
    return presets().contains(preset);
}

QString JobBuilder::outputPathFor(const QString& videoPath, const AppSettings& settings) {
    QFileInfo info(videoPath);
    QString dir = settings.outputDir;
    if (dir.isEmpty())
        dir = info.absoluteDir().filePath(AppConstants::DefaultOutputDirName);

    return QDir(dir).filePath(FfmpegCommandBuilder::outputFileName(info.fileName()));
}

QString JobBuilder::matchSubtitle(const QString& videoPath, const QStringList& subtitlePaths) {
    if (subtitlePaths.isEmpty()) return {};

    const QString stem = QFileInfo(videoPath).completeBaseName();
    for (const QString& sub : subtitlePaths) {
        if (QFileInfo(sub).completeBaseName().compare(stem, Qt::CaseInsensitive) == 0)
            return sub;
    }
    return subtitlePaths.constFirst();
}

bool JobBuilder::fail(const QString& message) {
    m_error = message;
    qCWarning(lcApp).noquote() << message;
    return false;
}

bool JobBuilder::checkInputFile(const QString& path, const QString& what) {
    if (path.isEmpty())
        return fail(QString("No %1 given").arg(what));

    QFileInfo info(path);
    if (!info.exists())
        return fail(QString("%1 not found: %2").arg(what, path));
    if (!info.isFile())
        return fail(QString("%1 is not a file: %2").arg(what, path));
    if (!info.isReadable())
        return fail(QString("%1 is not readable: %2").arg(what, path));
    return true;
}

bool JobBuilder::loadSubtitles(const QString& path, const AppSettings& settings,
                               SubtitleLines& lines, bool* isCsv) {
    SubtitleFormat format = SubtitleParserFactory::formatForPath(path);
    if (format == SubtitleFormat::Unknown) {
        return fail(QString("Unsupported subtitle format: %1 (expected one of: %2)")
                        .arg(path, SubtitleParserFactory::supportedSuffixes().join(", ")));
    }
    const bool csv = format == SubtitleFormat::Csv;
    if (isCsv) *isCsv = csv;

    std::unique_ptr<SubtitleParser> parser = SubtitleParserFactory::createForFile(path);
    if (!parser)
        return fail(QString("Cannot read subtitles: %1").arg(path));

    if (csv) {
        const auto& mappings = settings.csvMappings;
        auto it = mappings.find(path);
        if (it == mappings.end())
            it = mappings.find(QFileInfo(path).absoluteFilePath());
        if (it != mappings.end()) {
            static_cast<CsvParser*>(parser.get())->setMapping(it->second);
            qCDebug(lcSubtitle) << "Using stored CSV mapping for" << path;
        }
    }

    if (!parser->parse(path))
        return fail(parser->errorString());

    lines = parser->lines();
    qCInfo(lcSubtitle) << "Loaded" << lines.size() << parser->formatName() << "cues from" << path;
    return true;
}

bool JobBuilder::prepare(const BurnRequest& request, PreparedJob& job) {
    m_error.clear();
    const AppSettings& settings = request.settings;

    if (!checkInputFile(request.videoPath, "Video file")) return false;
    if (!checkInputFile(request.subtitlePath, "Subtitle file")) return false;

    QString styleError;
    if (!StyleUtil::validate(settings.style, &styleError))
        return fail(styleError);
    if (settings.crf < 0 || settings.crf > 51)
        return fail(QString("CRF must be between 0 and 51, got %1").arg(settings.crf));
    if (!isValidPreset(settings.preset))
        return fail(QString("Unknown preset \"%1\" (expected one of: %2)")
                        .arg(settings.preset, presets().join(", ")));

    SubtitleLines lines;
    bool isCsv = false;
    if (!loadSubtitles(request.subtitlePath, settings, lines, &isCsv)) return false;

    QString outputPath = request.outputPath.isEmpty()
        ? FfmpegCommandBuilder::defaultOutputPath(request.videoPath)
        : request.outputPath;

    QFileInfo outInfo(outputPath);
    if (outInfo.absoluteFilePath() == QFileInfo(request.videoPath).absoluteFilePath())
        return fail(QString("Output would overwrite the input video: %1").arg(outputPath));

    double duration = 0.0;
    MediaProbe probe;
    if (probe.probe(request.videoPath)) {
        if (!probe.info().canBurn())
            return fail(QString("No video stream in: %1").arg(request.videoPath));
        duration = probe.info().duration;
    } else {
        qCWarning(lcFfmpeg) << "Probe failed, progress will follow ffmpeg output:" << probe.errorString();
    }

    // ffmpeg cannot read CSV, and a time shift needs rewritten cue times
    QString subtitleFile = request.subtitlePath;
    std::unique_ptr<QTemporaryDir> tempDir;
    if (isCsv || settings.startOffset != 0.0) {
        tempDir = std::make_unique<QTemporaryDir>();
        if (!tempDir->isValid())
            return fail(QString("Cannot create temporary directory: %1").arg(tempDir->errorString()));

        if (settings.startOffset != 0.0) {
            lines = AssWriter::shifted(lines, settings.startOffset);
            qCInfo(lcSubtitle) << "Shifted cues by" << settings.startOffset << "s," << lines.size() << "remain";
        }

        subtitleFile = tempDir->filePath("subtitles.ass");
        QString writeError;
        if (!AssWriter::write(subtitleFile, lines, settings.style, &writeError))
            return fail(writeError);
    }

    BurnCommand command;
    command.program = settings.ffmpegPath.isEmpty()
        ? QString(AppConstants::DefaultFfmpegProgram) : settings.ffmpegPath;
    command.videoPath = request.videoPath;
    command.subtitlePath = subtitleFile;
    command.outputPath = outputPath;
    command.codecCopy = request.codecCopy;
    command.crf = settings.crf;
    command.preset = settings.preset;
    command.forceStyle = true;
    command.style = settings.style;

    QString buildError;
    QStringList args = FfmpegCommandBuilder::build(command, &buildError);
    if (args.isEmpty())
        return fail(buildError);

    if (!QDir().mkpath(outInfo.absolutePath()))
        return fail(QString("Cannot create output directory: %1").arg(outInfo.absolutePath()));

    job.program = command.program;
    job.args = args;
    job.outputPath = outputPath;
    job.subtitleFile = subtitleFile;
    job.lines = std::move(lines);
    job.duration = duration;
    job.tempDir = std::move(tempDir);
    return true;
}

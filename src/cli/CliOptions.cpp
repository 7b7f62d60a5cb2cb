#include "CliOptions.h"
#include "AppConstants.h"

#include <QCommandLineOption>
#include <QCommandLineParser>

AppSettings CliOptions::applyOverrides(const AppSettings& base) const {
    AppSettings s = base;
    if (crf) s.crf = *crf;
    if (preset) s.preset = *preset;
    if (fontFamily) s.style.family = *fontFamily;
    if (fontSize) s.style.size = *fontSize;
    if (fontColor) s.style.color = *fontColor;
    if (outlineColor) s.style.outlineColor = *outlineColor;
    if (outlineWidth) s.style.outlineWidth = *outlineWidth;
    if (bold) s.style.bold = true;
    if (shadow) s.style.shadow = *shadow;
    return s;
}

namespace {

bool setError(QString* error, const QString& message) {
    if (error) *error = message;
    return false;
}

bool readInt(const QCommandLineParser& parser, const QCommandLineOption& option,
             std::optional<int>& target, QString* error) {
    if (!parser.isSet(option)) return true;
    const QString text = parser.value(option);
    bool ok = false;
    int value = text.toInt(&ok);
    if (!ok)
        return setError(error, QString("--%1 expects an integer, got \"%2\"")
                                   .arg(option.names().constFirst(), text));
    target = value;
    return true;
}

bool readColour(const QCommandLineParser& parser, const QCommandLineOption& option,
                std::optional<QString>& target, QString* error) {
    if (!parser.isSet(option)) return true;
    const QString text = parser.value(option);
    if (!StyleUtil::isValidHexColour(text))
        return setError(error, QString("--%1 expects a hex colour like #ffcc00, got \"%2\"")
                                   .arg(option.names().constFirst(), text));
    target = text.startsWith('#') ? text : "#" + text;
    return true;
}

} // namespace

bool CliParser::parse(const QStringList& arguments, CliOptions& options,
                      QString* error, QString* helpText) {
    options = CliOptions{};

    QCommandLineParser parser;
    parser.setApplicationDescription("Burns subtitles permanently into a video using ffmpeg.");
    parser.addPositionalArgument("video", "Input video file.");

    QCommandLineOption helpOpt({"h", "help"}, "Show this help.");
    QCommandLineOption versionOpt("version", "Show the version.");
    QCommandLineOption subtitleOpt({"s", "subtitle"}, "Subtitle file (.srt, .ass, .ssa, .csv).", "file");
    QCommandLineOption outputOpt({"o", "output"}, "Output video. Defaults to <video>_sub.<ext>.", "file");
    QCommandLineOption configOpt("config", "Settings file to read instead of the default.", "file");
    QCommandLineOption noCopyOpt("no-copy", "Always re-encode the streams.");
    QCommandLineOption crfOpt("crf", "x264 quality, 0-51.", "n");
    QCommandLineOption presetOpt("preset", "x264 preset.", "name");
    QCommandLineOption familyOpt("font-family", "Font family.", "name");
    QCommandLineOption sizeOpt("font-size", "Font size in pixels.", "px");
    QCommandLineOption colorOpt("font-color", "Text colour, #RRGGBB.", "hex");
    QCommandLineOption outlineColorOpt("outline-color", "Outline colour, #RRGGBB.", "hex");
    QCommandLineOption outlineWidthOpt("outline-width", "Outline width in pixels, 0 for none.", "px");
    QCommandLineOption boldOpt("bold", "Bold text.");
    QCommandLineOption shadowOpt("shadow", "Draw a drop shadow.");
    QCommandLineOption noShadowOpt("no-shadow", "Do not draw a drop shadow.");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Print debug output.");

    parser.addOptions({helpOpt, versionOpt, subtitleOpt, outputOpt, configOpt, noCopyOpt,
                       crfOpt, presetOpt, familyOpt, sizeOpt, colorOpt, outlineColorOpt,
                       outlineWidthOpt, boldOpt, shadowOpt, noShadowOpt, verboseOpt});

    if (helpText)
        *helpText = parser.helpText();

    if (!parser.parse(arguments))
        return setError(error, parser.errorText());

    if (parser.isSet(helpOpt)) {
        options.helpRequested = true;
        return true;
    }
    if (parser.isSet(versionOpt)) {
        options.versionRequested = true;
        return true;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty())
        return setError(error, "Missing input video");
    if (positional.size() > 1)
        return setError(error, QString("Unexpected argument: %1").arg(positional.at(1)));
    options.videoPath = positional.constFirst();

    if (!parser.isSet(subtitleOpt))
        return setError(error, "Missing required option --subtitle");
    options.subtitlePath = parser.value(subtitleOpt);
    options.outputPath = parser.value(outputOpt);
    options.configPath = parser.value(configOpt);
    options.noCopy = parser.isSet(noCopyOpt);
    options.verbose = parser.isSet(verboseOpt);

    if (!readInt(parser, crfOpt, options.crf, error)) return false;
    if (!readInt(parser, sizeOpt, options.fontSize, error)) return false;
    if (!readInt(parser, outlineWidthOpt, options.outlineWidth, error)) return false;
    if (!readColour(parser, colorOpt, options.fontColor, error)) return false;
    if (!readColour(parser, outlineColorOpt, options.outlineColor, error)) return false;

    if (parser.isSet(presetOpt)) options.preset = parser.value(presetOpt);
    if (parser.isSet(familyOpt)) options.fontFamily = parser.value(familyOpt);
    options.bold = parser.isSet(boldOpt);

    if (parser.isSet(shadowOpt) && parser.isSet(noShadowOpt))
        return setError(error, "--shadow and --no-shadow cannot be used together");
    if (parser.isSet(shadowOpt)) options.shadow = true;
    if (parser.isSet(noShadowOpt)) options.shadow = false;

    return true;
}

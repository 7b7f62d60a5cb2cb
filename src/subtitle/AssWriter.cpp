#include "AssWriter.h"
#include "AppConstants.h"
#include "Logger.h"

#include <QFile>
#include <QStringList>
#include <algorithm>

namespace AssWriter {

QString render(const SubtitleLines& lines, const SubtitleStyle& style) {
    QString primary = StyleUtil::hexToAssColour(style.color);
    if (primary.isEmpty()) primary = "&H00FFFFFF";
    QString outline = StyleUtil::hexToAssColour(style.outlineColor);
    if (outline.isEmpty()) outline = "&H00000000";

    QStringList out;
    out << "[Script Info]"
        << "ScriptType: v4.00+"
        << "Collisions: Normal"
        << QString("PlayResX: %1").arg(AppConstants::AssPlayResX)
        << QString("PlayResY: %1").arg(AppConstants::AssPlayResY)
        << "Timer: 100.0000"
        << ""
        << "[V4+ Styles]"
        << "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour, "
           "Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, "
           "Alignment, MarginL, MarginR, MarginV, Encoding";

    // Bold is -1/0 in ASS; alignment 2 is bottom centre
    out << QString("Style: Default,%1,%2,%3,&H000000FF,%4,&H64000000,%5,0,0,0,100,100,0,0,1,%6,%7,2,10,10,%8,1")
        .arg(style.family)
        .arg(style.size)
        .arg(primary, outline)
        .arg(style.bold ? -1 : 0)
        .arg(qMax(0, style.outlineWidth))
        .arg(style.shadow ? 3 : 0)
        .arg(qMax(0, style.marginV));

    out << ""
        << "[Events]"
        << "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text";

    for (const auto& line : lines)
        out << line.toAssDialogue();

    return out.join('\n') + '\n';
}

bool write(const QString& filePath, const SubtitleLines& lines,
           const SubtitleStyle& style, QString* error) {
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error) *error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    file.write(render(lines, style).toUtf8());
    file.close();
    qCDebug(lcSubtitle) << "Wrote ASS script" << filePath << "with" << lines.size() << "events";
    return true;
}

SubtitleLines shifted(const SubtitleLines& lines, double offsetSeconds) {
    SubtitleLines result;
    result.reserve(lines.size());
    for (const auto& line : lines) {
        SubtitleLine moved = line;
        moved.start += offsetSeconds;
        moved.end += offsetSeconds;
        if (moved.end <= 0.0) continue;
        moved.start = std::max(0.0, moved.start);
        result.push_back(moved);
    }
    return result;
}

} // namespace AssWriter

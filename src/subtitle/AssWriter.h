#pragma once

#include <QString>
#include "SubtitleData.h"
#include "SubtitleStyle.h"

namespace AssWriter {

// Complete script: [Script Info], a single "Default" style, [Events].
QString render(const SubtitleLines& lines, const SubtitleStyle& style);

bool write(const QString& filePath, const SubtitleLines& lines,
           const SubtitleStyle& style, QString* error = nullptr);

// Moves every cue by offsetSeconds. Cues that end at or before zero are
// dropped and starts are clamped to zero.
SubtitleLines shifted(const SubtitleLines& lines, double offsetSeconds);

} // namespace AssWriter

#pragma once

#include <QStringList>
#include <memory>
#include "SubtitleParser.h"

enum class SubtitleFormat {
    Unknown,
    Srt,
    Ass,
    Csv
};

class SubtitleParserFactory {
public:
    static SubtitleFormat formatForPath(const QString& filePath);
    static bool isSubtitleFile(const QString& filePath);
    static QStringList supportedSuffixes();

    // CSV parsers are created with the guessed mapping; set another with
    // CsvParser::setMapping() before parsing.
    static std::unique_ptr<SubtitleParser> create(SubtitleFormat format);
    static std::unique_ptr<SubtitleParser> createForFile(const QString& filePath);
};

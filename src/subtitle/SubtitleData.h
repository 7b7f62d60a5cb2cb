#pragma once

#include <QRegularExpression>
#include <QString>
#include <vector>
#include "TimeUtil.h"

struct SubtitleLine {
    double start = 0.0;   // seconds
    double end = 0.0;     // seconds
    QString text;         // line breaks as ASS "\N"

    QString toAssDialogue() const {
        return QString("Dialogue: 0,%1,%2,Default,,0,0,0,,%3")
            .arg(TimeUtil::secondsToAssTime(start),
                 TimeUtil::secondsToAssTime(end),
                 text);
    }

    // Text as it reads on screen: override blocks removed, "\N" and "\n" as newlines
    QString plainText() const {
        static const QRegularExpression overrides(R"(\{[^}]*\})");
        QString plain = text;
        plain.remove(overrides);
        plain.replace("\\N", "\n");
        plain.replace("\\n", "\n");
        plain.replace("\\h", " ");
        return plain;
    }
};

using SubtitleLines = std::vector<SubtitleLine>;

enum class CsvTimeUnit {
    Seconds,
    Frames
};

// Columns are given as header names or zero-based indices written as text.
struct CsvMapping {
    QString startColumn = "0";
    QString endColumn;          // empty = no end column
    QString textColumn = "2";
    CsvTimeUnit timeUnit = CsvTimeUnit::Seconds;
    double fps = 30.0;
};

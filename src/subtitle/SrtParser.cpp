#include "SrtParser.h"
#include "TimeUtil.h"

#include <QRegularExpression>
#include <QStringList>

bool SrtParser::parseText(const QString& text) {
    static const QRegularExpression timingRe(R"(^\s*(\S+)\s*-->\s*(\S+))");
    static const QRegularExpression indexRe(R"(^\s*\d+\s*$)");

    QString normalized = text;
    normalized.replace("\r\n", "\n");
    normalized.replace('\r', '\n');
    const QStringList rows = normalized.split('\n');

    int i = 0;
    while (i < rows.size()) {
        // Skip blank lines between cues
        if (rows[i].trimmed().isEmpty()) {
            ++i;
            continue;
        }

        int blockLine = i + 1;
        // A block opens with an optional index; the timing must follow it
        if (indexRe.match(rows[i]).hasMatch() && i + 1 < rows.size()
            && !rows[i + 1].trimmed().isEmpty()) {
            ++i;
        }

        QRegularExpressionMatch m = timingRe.match(rows[i]);
        if (!m.hasMatch()) {
            return fail(QString("line %1: expected a timing line (\"00:00:01,000 --> 00:00:02,000\"), got \"%2\"")
                .arg(i + 1).arg(rows[i].trimmed()));
        }

        double start = TimeUtil::parseClockTime(m.captured(1));
        double end = TimeUtil::parseClockTime(m.captured(2));
        if (start < 0 || end < 0) {
            return fail(QString("line %1: malformed timestamp in \"%2\"")
                .arg(i + 1).arg(rows[i].trimmed()));
        }
        ++i;

        QStringList textLines;
        while (i < rows.size() && !rows[i].trimmed().isEmpty()) {
            textLines << rows[i].trimmed();
            ++i;
        }

        if (textLines.isEmpty()) continue;
        if (end < start) {
            return fail(QString("line %1: cue ends before it starts").arg(blockLine));
        }

        SubtitleLine line;
        line.start = start;
        line.end = end;
        line.text = textLines.join("\\N");
        m_lines.push_back(line);
    }
    return true;
}

#include "AssParser.h"
#include "TimeUtil.h"

#include <QStringList>

namespace {

const QStringList DefaultEventFormat = {
    "Layer", "Start", "End", "Style", "Name",
    "MarginL", "MarginR", "MarginV", "Effect", "Text"
};

QStringList splitFields(const QString& value, int count) {
    QStringList fields;
    int pos = 0;
    for (int f = 0; f < count - 1; ++f) {
        int comma = value.indexOf(',', pos);
        if (comma < 0) break;
        fields << value.mid(pos, comma - pos).trimmed();
        pos = comma + 1;
    }
    fields << value.mid(pos);
    return fields;
}

} // namespace

bool AssParser::parseText(const QString& text) {
    QString normalized = text;
    normalized.replace("\r\n", "\n");
    normalized.replace('\r', '\n');
    const QStringList rows = normalized.split('\n');

    bool inEvents = false;
    bool sawEvents = false;
    QStringList format = DefaultEventFormat;

    for (int i = 0; i < rows.size(); ++i) {
        const QString row = rows[i].trimmed();
        if (row.isEmpty() || row.startsWith(';')) continue;

        if (row.startsWith('[')) {
            inEvents = row.compare("[Events]", Qt::CaseInsensitive) == 0;
            sawEvents = sawEvents || inEvents;
            continue;
        }
        if (!inEvents) continue;

        int colon = row.indexOf(':');
        if (colon < 0) continue;
        const QString key = row.left(colon).trimmed();
        const QString value = row.mid(colon + 1);

        if (key.compare("Format", Qt::CaseInsensitive) == 0) {
            format.clear();
            for (const QString& name : value.split(','))
                format << name.trimmed();
            if (!format.contains("Start") || !format.contains("End") || !format.contains("Text"))
                return fail(QString("line %1: event format lacks Start/End/Text").arg(i + 1));
            continue;
        }
        if (key.compare("Dialogue", Qt::CaseInsensitive) != 0) continue;

        const QStringList fields = splitFields(value.trimmed(), format.size());
        if (fields.size() != format.size())
            return fail(QString("line %1: expected %2 fields in Dialogue").arg(i + 1).arg(format.size()));

        double start = TimeUtil::parseClockTime(fields[format.indexOf("Start")]);
        double end = TimeUtil::parseClockTime(fields[format.indexOf("End")]);
        if (start < 0 || end < 0)
            return fail(QString("line %1: malformed event time").arg(i + 1));

        SubtitleLine line;
        line.start = start;
        line.end = end;
        line.text = fields[format.indexOf("Text")];
        m_lines.push_back(line);
    }

    if (!sawEvents)
        return fail("no [Events] section");
    return true;
}

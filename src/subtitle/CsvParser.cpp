#include "CsvParser.h"
#include "AppConstants.h"

#include <QFile>
#include <QtNumeric>

std::vector<QStringList> CsvParser::splitRecords(const QString& text) {
    std::vector<QStringList> records;
    QStringList fields;
    QString field;
    bool inQuotes = false;
    bool fieldStarted = false;

    auto endField = [&]() {
        fields << field;
        field.clear();
        fieldStarted = false;
    };
    auto endRecord = [&]() {
        endField();
        // A record made only of one empty field is a blank line
        if (!(fields.size() == 1 && fields.first().isEmpty()))
            records.push_back(fields);
        fields.clear();
    };

    const int n = text.size();
    for (int i = 0; i < n; ++i) {
        const QChar c = text[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < n && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"' && !fieldStarted) {
            inQuotes = true;
            fieldStarted = true;
        } else if (c == ',') {
            endField();
        } else if (c == '\r') {
            if (i + 1 < n && text[i + 1] == '\n') ++i;
            endRecord();
        } else if (c == '\n') {
            endRecord();
        } else {
            field += c;
            fieldStarted = true;
        }
    }

    if (fieldStarted || !fields.isEmpty() || !field.isEmpty())
        endRecord();
    return records;
}

QStringList CsvParser::readHeader(const QString& filePath, QString* error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) *error = QString("Cannot read: %1").arg(filePath);
        return {};
    }

    auto records = splitRecords(decodeText(file.readAll()));
    if (records.empty()) {
        if (error) *error = QString("CSV file is empty: %1").arg(filePath);
        return {};
    }

    QStringList header;
    for (const QString& name : records.front())
        header << name.trimmed();
    return header;
}

CsvMapping CsvParser::guessMapping(const QStringList& header) {
    auto pick = [&header](const QString& name, int fallback) {
        return header.contains(name) ? name : QString::number(fallback);
    };

    CsvMapping mapping;
    mapping.startColumn = pick("start_time", 0);
    mapping.endColumn = pick("end_time", 1);
    mapping.textColumn = pick("text", 2);
    mapping.timeUnit = CsvTimeUnit::Seconds;
    mapping.fps = AppConstants::DefaultCsvFps;
    return mapping;
}

int CsvParser::resolveColumn(const QStringList& header, const QString& column) {
    const QString name = column.trimmed();
    if (name.isEmpty()) return -1;

    int byName = header.indexOf(name);
    if (byName >= 0) return byName;

    bool ok = false;
    int index = name.toInt(&ok);
    if (ok && index >= 0 && index < header.size()) return index;
    return -1;
}

bool CsvParser::toSeconds(const QString& value, double& seconds) const {
    bool ok = false;
    double v = value.trimmed().toDouble(&ok);
    if (!ok || !qIsFinite(v)) return false;

    if (m_mapping.timeUnit == CsvTimeUnit::Frames) {
        double fps = m_mapping.fps > 0 ? m_mapping.fps : AppConstants::DefaultCsvFps;
        v /= fps;
    }
    seconds = v;
    return true;
}

bool CsvParser::isBlankRecord(const QStringList& record) {
    for (const QString& field : record) {
        if (!field.trimmed().isEmpty()) return false;
    }
    return true;
}

bool CsvParser::parseText(const QString& text) {
    auto records = splitRecords(text);
    if (records.empty())
        return fail("CSV file is empty");

    QStringList header;
    for (const QString& name : records.front())
        header << name.trimmed();

    const int startCol = resolveColumn(header, m_mapping.startColumn);
    const int textCol = resolveColumn(header, m_mapping.textColumn);
    const int endCol = resolveColumn(header, m_mapping.endColumn);

    if (startCol < 0)
        return fail(QString("start column \"%1\" not found").arg(m_mapping.startColumn));
    if (textCol < 0)
        return fail(QString("text column \"%1\" not found").arg(m_mapping.textColumn));

    for (size_t r = 1; r < records.size(); ++r) {
        const QStringList& row = records[r];
        const int recordNo = static_cast<int>(r) + 1;
        if (isBlankRecord(row)) continue;

        double start = 0.0;
        if (startCol >= row.size() || !toSeconds(row[startCol], start))
            return fail(QString("row %1: start time \"%2\" is not a number")
                .arg(recordNo).arg(startCol < row.size() ? row[startCol] : QString()));

        double end = -1.0;
        if (endCol >= 0 && endCol < row.size() && !row[endCol].trimmed().isEmpty()) {
            if (!toSeconds(row[endCol], end))
                end = -1.0;
        }
        if (end <= start)
            end = start + AppConstants::DefaultCueDuration;

        QString cueText = textCol < row.size() ? row[textCol] : QString();
        cueText.replace("\r\n", "\n");
        cueText.replace('\n', "\\N");

        SubtitleLine line;
        line.start = start;
        line.end = end;
        line.text = cueText;
        m_lines.push_back(line);
    }
    return true;
}

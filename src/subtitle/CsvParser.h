#pragma once

#include <QStringList>
#include <vector>
#include "SubtitleParser.h"

// Reads cues from a CSV table whose first row is a header. Which columns
// hold the start, end and text is given by a CsvMapping.
class CsvParser : public SubtitleParser {
public:
    CsvParser() = default;
    explicit CsvParser(const CsvMapping& mapping) : m_mapping(mapping) {}

    QString formatName() const override { return "CSV"; }

    void setMapping(const CsvMapping& mapping) { m_mapping = mapping; }
    const CsvMapping& mapping() const { return m_mapping; }

    // First record of the file; empty with *error set on failure.
    static QStringList readHeader(const QString& filePath, QString* error = nullptr);

    // Picks start_time/end_time/text by name, else columns 0/1/2.
    static CsvMapping guessMapping(const QStringList& header);

    // Index of a column given by header name or numeric index; -1 if none.
    static int resolveColumn(const QStringList& header, const QString& column);

    static std::vector<QStringList> splitRecords(const QString& text);

    // True when every field is empty or whitespace, as in ",," rows.
    static bool isBlankRecord(const QStringList& record);

protected:
    bool parseText(const QString& text) override;

private:
    bool toSeconds(const QString& value, double& seconds) const;

    CsvMapping m_mapping;
};

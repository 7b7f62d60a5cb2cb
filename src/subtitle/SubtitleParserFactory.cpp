#include "SubtitleParserFactory.h"
#include "SrtParser.h"
#include "AssParser.h"
#include "CsvParser.h"

#include <QFileInfo>

SubtitleFormat SubtitleParserFactory::formatForPath(const QString& filePath) {
    QString s = QFileInfo(filePath).suffix().toLower();
    if (s == "srt") return SubtitleFormat::Srt;
    if (s == "ass" || s == "ssa") return SubtitleFormat::Ass;
    if (s == "csv") return SubtitleFormat::Csv;
    return SubtitleFormat::Unknown;
}

bool SubtitleParserFactory::isSubtitleFile(const QString& filePath) {
    return formatForPath(filePath) != SubtitleFormat::Unknown;
}

QStringList SubtitleParserFactory::supportedSuffixes() {
    return {"srt", "ass", "ssa", "csv"};
}

std::unique_ptr<SubtitleParser> SubtitleParserFactory::create(SubtitleFormat format) {
    switch (format) {
        case SubtitleFormat::Srt:     return std::make_unique<SrtParser>();
        case SubtitleFormat::Ass:     return std::make_unique<AssParser>();
        case SubtitleFormat::Csv:     return std::make_unique<CsvParser>();
        case SubtitleFormat::Unknown: break;
    }
    return nullptr;
}

std::unique_ptr<SubtitleParser> SubtitleParserFactory::createForFile(const QString& filePath) {
    auto parser = create(formatForPath(filePath));
    if (auto* csv = dynamic_cast<CsvParser*>(parser.get())) {
        QString error;
        QStringList header = CsvParser::readHeader(filePath, &error);
        if (!header.isEmpty())
            csv->setMapping(CsvParser::guessMapping(header));
    }
    return parser;
}

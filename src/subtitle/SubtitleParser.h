#pragma once

#include <QString>
#include "SubtitleData.h"

class SubtitleParser {
public:
    virtual ~SubtitleParser();

    bool parse(const QString& filePath);

    const SubtitleLines& lines() const { return m_lines; }
    QString errorString() const { return m_error; }

    virtual QString formatName() const = 0;

    // Decodes subtitle text: BOM if present, else UTF-8, else Latin-1.
    static QString decodeText(const QByteArray& data);

protected:
    virtual bool parseText(const QString& text) = 0;

    bool fail(const QString& message);

    SubtitleLines m_lines;
    QString m_error;
    QString m_filePath;
};

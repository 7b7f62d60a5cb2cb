#include "SubtitleParser.h"
#include "Logger.h"

#include <QFile>
#include <QFileInfo>
#include <QStringDecoder>

SubtitleParser::~SubtitleParser() = default;

bool SubtitleParser::parse(const QString& filePath) {
    m_lines.clear();
    m_error.clear();
    m_filePath.clear();

    QFile file(filePath);
    if (!file.exists())
        return fail(QString("File not found: %1").arg(filePath));
    if (!file.open(QIODevice::ReadOnly))
        return fail(QString("Cannot read: %1 (%2)").arg(filePath, file.errorString()));

    // Syntax errors from here on are prefixed with the file name
    m_filePath = filePath;

    QString text = decodeText(file.readAll());
    file.close();

    if (!parseText(text)) {
        m_lines.clear();
        return false;
    }

    qCDebug(lcSubtitle) << formatName() << "parsed" << m_lines.size() << "lines from"
                        << QFileInfo(filePath).fileName();
    return true;
}

QString SubtitleParser::decodeText(const QByteArray& data) {
    auto bomEncoding = QStringConverter::encodingForData(data);
    if (bomEncoding) {
        QStringDecoder decoder(*bomEncoding);
        return decoder.decode(data);
    }

    QStringDecoder utf8(QStringConverter::Utf8, QStringConverter::Flag::Stateless);
    QString text = utf8.decode(data);
    if (!utf8.hasError())
        return text;

    QStringDecoder latin1(QStringConverter::Latin1);
    return latin1.decode(data);
}

bool SubtitleParser::fail(const QString& message) {
    m_error = m_filePath.isEmpty()
        ? message
        : QString("%1: %2").arg(QFileInfo(m_filePath).fileName(), message);
    return false;
}

#pragma once

#include <QString>
#include <QRegularExpression>
#include <cmath>

namespace TimeUtil {

// ASS event time: H:MM:SS.cc, centiseconds truncated
inline QString secondsToAssTime(double totalSeconds) {
    if (totalSeconds < 0) totalSeconds = 0;
    qint64 centis = static_cast<qint64>(std::floor(totalSeconds * 100.0 + 1e-6));
    qint64 hours = centis / 360000;
    int minutes = static_cast<int>((centis % 360000) / 6000);
    int seconds = static_cast<int>((centis % 6000) / 100);
    int cs = static_cast<int>(centis % 100);

    return QString("%1:%2:%3.%4")
        .arg(hours)
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(cs, 2, 10, QChar('0'));
}

inline QString secondsToHMSms(double totalSeconds) {
    int hours = static_cast<int>(totalSeconds) / 3600;
    int minutes = (static_cast<int>(totalSeconds) % 3600) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    int millis = static_cast<int>((totalSeconds - static_cast<int>(totalSeconds)) * 1000);

    return QString("%1:%2:%3.%4")
        .arg(hours, 2, 10, QChar('0'))
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

// Parses H:MM:SS followed by a ',' or '.' fraction of 1-3 digits.
// The fraction is read as a decimal fraction, so "1,5" is 500 ms and
// "0.25" (ASS centiseconds) is 250 ms. Returns -1 on malformed input.
inline double parseClockTime(const QString& text) {
    static const QRegularExpression re(R"(^\s*(\d+):(\d{1,2}):(\d{1,2})(?:[,.](\d{1,3}))?\s*$)");
    QRegularExpressionMatch m = re.match(text);
    if (!m.hasMatch()) return -1.0;

    int minutes = m.captured(2).toInt();
    int seconds = m.captured(3).toInt();
    if (minutes > 59 || seconds > 59) return -1.0;

    QString frac = m.captured(4);
    int millis = frac.isEmpty() ? 0 : frac.leftJustified(3, QChar('0')).toInt();

    return m.captured(1).toLongLong() * 3600.0 + minutes * 60.0 + seconds + millis / 1000.0;
}

// ffmpeg progress/duration stamps ("00:01:23.45"). Returns -1 for "N/A" and
// anything else that does not parse.
inline double parseFfmpegTime(const QString& text) {
    const QStringList parts = text.trimmed().split(':');
    if (parts.size() != 3) return -1.0;

    bool okH = false, okM = false, okS = false;
    int hours = parts[0].toInt(&okH);
    int minutes = parts[1].toInt(&okM);
    double seconds = parts[2].toDouble(&okS);
    if (!okH || !okM || !okS || hours < 0 || minutes < 0 || seconds < 0) return -1.0;

    return hours * 3600.0 + minutes * 60.0 + seconds;
}

} // namespace TimeUtil

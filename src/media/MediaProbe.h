#pragma once

#include <QString>

// What a burn job needs to know about an input video before ffmpeg runs.
struct MediaInfo {
    QString filePath;
    QString containerFormat;
    double duration = 0.0;      // seconds, 0 if unknown
    bool hasVideo = false;
    int videoWidth = 0;
    int videoHeight = 0;
    double videoFps = 0.0;
    QString videoCodec;
    bool hasAudio = false;
    QString audioCodec;
    bool hasSubtitles = false;  // embedded subtitle stream present

    bool canBurn() const { return hasVideo && videoWidth > 0 && videoHeight > 0; }

    // "1920x1080, 00:01:23.000, h264", or the reason nothing can be burned
    QString summary() const;
};

class MediaProbe {
public:
    MediaProbe() = default;

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    MediaInfo m_info;
    QString m_error;
};

#pragma once

#include <QImage>
#include <QString>
#include <memory>

// Decodes single still frames from a video for the subtitle preview.
class FrameGrabber {
public:
    FrameGrabber();
    ~FrameGrabber();

    FrameGrabber(const FrameGrabber&) = delete;
    FrameGrabber& operator=(const FrameGrabber&) = delete;

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_ctx != nullptr; }

    // First frame at or after the given time; null image on failure.
    QImage grabFrameAt(double seconds);

    double duration() const { return m_duration; }
    QString errorString() const { return m_error; }

private:
    QImage decodeUntil(double seconds);

    struct FFmpegContext;
    std::unique_ptr<FFmpegContext> m_ctx;
    double m_duration = 0.0;
    QString m_error;
};

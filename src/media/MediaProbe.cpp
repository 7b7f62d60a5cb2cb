#include "MediaProbe.h"
#include "Logger.h"
#include "TimeUtil.h"

#include <memory>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

namespace {

struct FormatCloser {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
using FormatPtr = std::unique_ptr<AVFormatContext, FormatCloser>;

QString codecName(const AVCodecParameters* par) {
    const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
    return desc ? QString(desc->name) : QString("unknown");
}

QString averror(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(code, buf, sizeof(buf));
    return QString::fromUtf8(buf);
}

double frameRate(const AVStream* stream) {
    if (stream->avg_frame_rate.num > 0 && stream->avg_frame_rate.den > 0)
        return av_q2d(stream->avg_frame_rate);
    if (stream->r_frame_rate.num > 0 && stream->r_frame_rate.den > 0)
        return av_q2d(stream->r_frame_rate);
    return 0.0;
}

} // namespace

QString MediaInfo::summary() const {
    if (!canBurn())
        return "no video stream";

    QString text = QString("%1x%2").arg(videoWidth).arg(videoHeight);
    if (duration > 0.0)
        text += ", " + TimeUtil::secondsToHMSms(duration);
    if (!videoCodec.isEmpty())
        text += ", " + videoCodec;
    return text;
}

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    AVFormatContext* raw = nullptr;
    int ret = avformat_open_input(&raw, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, averror(ret));
        return false;
    }
    FormatPtr fmt(raw);

    ret = avformat_find_stream_info(fmt.get(), nullptr);
    if (ret < 0) {
        m_error = QString("Cannot find stream info: %1 (%2)").arg(filePath, averror(ret));
        return false;
    }

    m_info.containerFormat = QString(fmt->iformat->long_name);
    if (fmt->duration > 0)
        m_info.duration = static_cast<double>(fmt->duration) / AV_TIME_BASE;

    for (unsigned i = 0; i < fmt->nb_streams; ++i) {
        const AVStream* stream = fmt->streams[i];
        const AVCodecParameters* par = stream->codecpar;

        switch (par->codec_type) {
        case AVMEDIA_TYPE_VIDEO:
            // Cover art is a one-frame video stream, not a picture to burn into
            if (m_info.hasVideo || (stream->disposition & AV_DISPOSITION_ATTACHED_PIC))
                break;
            m_info.hasVideo = true;
            m_info.videoWidth = par->width;
            m_info.videoHeight = par->height;
            m_info.videoCodec = codecName(par);
            m_info.videoFps = frameRate(stream);
            if (m_info.duration <= 0.0 && stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
                m_info.duration = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
            break;
        case AVMEDIA_TYPE_AUDIO:
            if (!m_info.hasAudio) {
                m_info.hasAudio = true;
                m_info.audioCodec = codecName(par);
            }
            break;
        case AVMEDIA_TYPE_SUBTITLE:
            m_info.hasSubtitles = true;
            break;
        default:
            break;
        }
    }

    qCDebug(lcFfmpeg) << "Probed" << filePath << m_info.containerFormat << m_info.summary();
    return true;
}

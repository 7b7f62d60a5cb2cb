#include "FrameGrabber.h"
#include "Logger.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
#include <libavutil/imgutils.h>
}

struct FrameGrabber::FFmpegContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwsContext* swsCtx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    int videoStreamIdx = -1;
    double timeBase = 0.0;
    int swsWidth = 0;
    int swsHeight = 0;
    int swsFormat = -1;

    ~FFmpegContext() {
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        if (swsCtx) sws_freeContext(swsCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};

FrameGrabber::FrameGrabber() = default;

FrameGrabber::~FrameGrabber() {
    close();
}

bool FrameGrabber::open(const QString& filePath) {
    close();
    auto ctx = std::make_unique<FFmpegContext>();

    if (avformat_open_input(&ctx->fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr) < 0) {
        m_error = QString("Cannot open file: %1").arg(filePath);
        return false;
    }
    if (avformat_find_stream_info(ctx->fmtCtx, nullptr) < 0) {
        m_error = QString("Cannot find stream info: %1").arg(filePath);
        return false;
    }

    ctx->videoStreamIdx = av_find_best_stream(ctx->fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (ctx->videoStreamIdx < 0) {
        m_error = QString("No video stream: %1").arg(filePath);
        return false;
    }

    AVStream* stream = ctx->fmtCtx->streams[ctx->videoStreamIdx];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec) {
        m_error = QString("No decoder for video stream: %1").arg(filePath);
        return false;
    }

    ctx->codecCtx = avcodec_alloc_context3(codec);
    if (!ctx->codecCtx || avcodec_parameters_to_context(ctx->codecCtx, stream->codecpar) < 0
        || avcodec_open2(ctx->codecCtx, codec, nullptr) < 0) {
        m_error = QString("Cannot open decoder: %1").arg(filePath);
        return false;
    }

    ctx->timeBase = av_q2d(stream->time_base);
    ctx->frame = av_frame_alloc();
    ctx->packet = av_packet_alloc();
    if (!ctx->frame || !ctx->packet) {
        m_error = "Out of memory";
        return false;
    }

    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
        m_duration = static_cast<double>(stream->duration) * ctx->timeBase;
    else if (ctx->fmtCtx->duration > 0)
        m_duration = static_cast<double>(ctx->fmtCtx->duration) / AV_TIME_BASE;

    m_ctx = std::move(ctx);
    return true;
}

void FrameGrabber::close() {
    m_ctx.reset();
    m_duration = 0.0;
}

QImage FrameGrabber::grabFrameAt(double seconds) {
    if (!m_ctx) return QImage();

    int64_t timestamp = static_cast<int64_t>(qMax(0.0, seconds) * AV_TIME_BASE);
    if (av_seek_frame(m_ctx->fmtCtx, -1, timestamp, AVSEEK_FLAG_BACKWARD) < 0) {
        qCDebug(lcFfmpeg) << "Seek failed, decoding from the current position";
    }
    avcodec_flush_buffers(m_ctx->codecCtx);

    return decodeUntil(seconds);
}

QImage FrameGrabber::decodeUntil(double seconds) {
    bool draining = false;

    while (true) {
        int ret = avcodec_receive_frame(m_ctx->codecCtx, m_ctx->frame);
        if (ret == 0) {
            double pts = (m_ctx->frame->pts != AV_NOPTS_VALUE)
                ? static_cast<double>(m_ctx->frame->pts) * m_ctx->timeBase
                : seconds;
            // Keep decoding towards the target unless the stream is ending
            if (pts + 1e-3 < seconds && !draining) {
                av_frame_unref(m_ctx->frame);
                continue;
            }

            const int w = m_ctx->frame->width;
            const int h = m_ctx->frame->height;
            if (!m_ctx->swsCtx || m_ctx->swsWidth != w || m_ctx->swsHeight != h
                || m_ctx->swsFormat != m_ctx->frame->format) {
                if (m_ctx->swsCtx) sws_freeContext(m_ctx->swsCtx);
                m_ctx->swsCtx = sws_getContext(
                    w, h, static_cast<AVPixelFormat>(m_ctx->frame->format),
                    w, h, AV_PIX_FMT_RGB32,
                    SWS_BILINEAR, nullptr, nullptr, nullptr);
                m_ctx->swsWidth = w;
                m_ctx->swsHeight = h;
                m_ctx->swsFormat = m_ctx->frame->format;
            }
            if (!m_ctx->swsCtx) {
                m_error = "Cannot create pixel format converter";
                av_frame_unref(m_ctx->frame);
                return QImage();
            }

            QImage image(w, h, QImage::Format_RGB32);
            uint8_t* dst[4] = { image.bits(), nullptr, nullptr, nullptr };
            int dstStride[4] = { static_cast<int>(image.bytesPerLine()), 0, 0, 0 };
            sws_scale(m_ctx->swsCtx, m_ctx->frame->data, m_ctx->frame->linesize,
                      0, h, dst, dstStride);
            av_frame_unref(m_ctx->frame);
            return image;
        }

        if (ret != AVERROR(EAGAIN)) {
            m_error = "No frame decoded";
            return QImage();
        }

        ret = av_read_frame(m_ctx->fmtCtx, m_ctx->packet);
        if (ret < 0) {
            // End of file: drain whatever the decoder still buffers
            draining = true;
            avcodec_send_packet(m_ctx->codecCtx, nullptr);
            continue;
        }

        if (m_ctx->packet->stream_index == m_ctx->videoStreamIdx)
            avcodec_send_packet(m_ctx->codecCtx, m_ctx->packet);
        av_packet_unref(m_ctx->packet);
    }
}

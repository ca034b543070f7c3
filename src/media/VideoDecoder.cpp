#include "VideoDecoder.h"
#include "Logging.h"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
#include <libavutil/imgutils.h>
}

struct VideoDecoder::FFmpegContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwsContext* swsCtx = nullptr;
    AVFrame* frame = nullptr;
    AVFrame* rgbFrame = nullptr;
    AVPacket* packet = nullptr;
    int videoStreamIdx = -1;
    AVRational timeBase{0, 1};
    uint8_t* rgbBuffer = nullptr;
    bool eofReached = false;   // av_read_frame returned EOF
    bool flushed = false;      // flush packet sent to codec

    ~FFmpegContext() {
        if (rgbBuffer) av_free(rgbBuffer);
        if (packet) av_packet_free(&packet);
        if (rgbFrame) av_frame_free(&rgbFrame);
        if (frame) av_frame_free(&frame);
        if (swsCtx) sws_freeContext(swsCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};

VideoDecoder::VideoDecoder(QObject* parent) : QObject(parent) {}

VideoDecoder::~VideoDecoder() {
    close();
}

bool VideoDecoder::fail(const QString& message) {
    m_error = message;
    m_ctx.reset();
    qCWarning(lcVideo) << message;
    return false;
}

bool VideoDecoder::open(const QString& filePath) {
    close();
    m_error.clear();

    m_ctx = std::make_unique<FFmpegContext>();

    int ret = avformat_open_input(&m_ctx->fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        return fail(QString("Cannot open video: %1 (%2)").arg(filePath, errBuf));
    }

    ret = avformat_find_stream_info(m_ctx->fmtCtx, nullptr);
    if (ret < 0) return fail(QString("Cannot find stream info: %1").arg(filePath));

    m_ctx->videoStreamIdx = av_find_best_stream(m_ctx->fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (m_ctx->videoStreamIdx < 0) return fail(QString("No video stream in %1").arg(filePath));

    AVStream* stream = m_ctx->fmtCtx->streams[m_ctx->videoStreamIdx];
    AVCodecParameters* par = stream->codecpar;

    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec) return fail(QString("No decoder for %1").arg(avcodec_get_name(par->codec_id)));

    m_ctx->codecCtx = avcodec_alloc_context3(codec);
    if (!m_ctx->codecCtx) return fail("Cannot allocate codec context");
    if (avcodec_parameters_to_context(m_ctx->codecCtx, par) < 0)
        return fail("Cannot copy codec parameters");

    ret = avcodec_open2(m_ctx->codecCtx, codec, nullptr);
    if (ret < 0) return fail(QString("Cannot open decoder %1").arg(codec->name));

    m_ctx->timeBase = stream->time_base;

    m_info.width = m_ctx->codecCtx->width;
    m_info.height = m_ctx->codecCtx->height;
    m_info.codecName = QString(codec->name);

    if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0)
        m_info.fps = av_q2d(stream->avg_frame_rate);
    else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0)
        m_info.fps = av_q2d(stream->r_frame_rate);

    // Prefer video stream duration over container duration
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        m_info.durationMs = av_rescale_q(stream->duration, stream->time_base, AVRational{1, 1000});
    } else if (m_ctx->fmtCtx->duration > 0) {
        m_info.durationMs = av_rescale(m_ctx->fmtCtx->duration, 1000, AV_TIME_BASE);
    }

    m_ctx->frame = av_frame_alloc();
    m_ctx->rgbFrame = av_frame_alloc();
    m_ctx->packet = av_packet_alloc();
    if (!m_ctx->frame || !m_ctx->rgbFrame || !m_ctx->packet) return fail("Cannot allocate frames");

    int numBytes = av_image_get_buffer_size(AV_PIX_FMT_RGB32, m_info.width, m_info.height, 1);
    if (numBytes <= 0) return fail("Invalid frame size");
    m_ctx->rgbBuffer = static_cast<uint8_t*>(av_malloc(numBytes));
    av_image_fill_arrays(m_ctx->rgbFrame->data, m_ctx->rgbFrame->linesize,
                         m_ctx->rgbBuffer, AV_PIX_FMT_RGB32,
                         m_info.width, m_info.height, 1);

    m_ctx->swsCtx = sws_getContext(
        m_info.width, m_info.height,
        m_ctx->codecCtx->pix_fmt,
        m_info.width, m_info.height,
        AV_PIX_FMT_RGB32,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_ctx->swsCtx) return fail("Cannot create scaler");

    m_isOpen = true;
    m_atEnd = false;
    m_currentTimeMs = 0;
    qCInfo(lcVideo) << "Opened" << filePath << m_info.width << "x" << m_info.height
                    << m_info.codecName << m_info.durationMs << "ms";
    return true;
}

void VideoDecoder::close() {
    m_ctx.reset();
    m_isOpen = false;
    m_atEnd = false;
    m_currentTimeMs = 0;
    m_lastFrame = QImage();
    m_info = VideoInfo{};
}

QImage VideoDecoder::decodeNextFrame() {
    if (!m_isOpen || !m_ctx) return QImage();

    while (true) {
        // Buffered frames first (B-frames)
        int ret = avcodec_receive_frame(m_ctx->codecCtx, m_ctx->frame);
        if (ret == 0) {
            sws_scale(m_ctx->swsCtx,
                      m_ctx->frame->data, m_ctx->frame->linesize,
                      0, m_info.height,
                      m_ctx->rgbFrame->data, m_ctx->rgbFrame->linesize);

            if (m_ctx->frame->pts != AV_NOPTS_VALUE)
                m_currentTimeMs = av_rescale_q(m_ctx->frame->pts, m_ctx->timeBase, AVRational{1, 1000});

            QImage img(m_ctx->rgbFrame->data[0],
                       m_info.width, m_info.height,
                       m_ctx->rgbFrame->linesize[0],
                       QImage::Format_RGB32);
            m_lastFrame = img.copy();
            return m_lastFrame;
        }

        if (ret != AVERROR(EAGAIN)) {
            // AVERROR_EOF or real error
            m_atEnd = true;
            return QImage();
        }

        if (m_ctx->eofReached) {
            if (!m_ctx->flushed) {
                m_ctx->flushed = true;
                avcodec_send_packet(m_ctx->codecCtx, nullptr);
                continue;
            }
            m_atEnd = true;
            return QImage();
        }

        ret = av_read_frame(m_ctx->fmtCtx, m_ctx->packet);
        if (ret < 0) {
            // Drain the codec
            m_ctx->eofReached = true;
            m_ctx->flushed = true;
            avcodec_send_packet(m_ctx->codecCtx, nullptr);
            continue;
        }

        if (m_ctx->packet->stream_index != m_ctx->videoStreamIdx) {
            av_packet_unref(m_ctx->packet);
            continue;
        }

        avcodec_send_packet(m_ctx->codecCtx, m_ctx->packet);
        av_packet_unref(m_ctx->packet);
    }
}

bool VideoDecoder::seek(qint64 positionMs) {
    if (!m_isOpen || !m_ctx) {
        m_error = "Decoder is not open";
        return false;
    }

    const int64_t timestamp = av_rescale_q(positionMs, AVRational{1, 1000}, m_ctx->timeBase);
    int ret = av_seek_frame(m_ctx->fmtCtx, m_ctx->videoStreamIdx, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        m_error = QString("Seek to %1 ms failed").arg(positionMs);
        qCWarning(lcVideo) << m_error;
        return false;
    }

    avcodec_flush_buffers(m_ctx->codecCtx);
    m_ctx->eofReached = false;
    m_ctx->flushed = false;
    m_atEnd = false;

    // From the keyframe, decode forward to the requested position
    while (true) {
        QImage frame = decodeNextFrame();
        if (frame.isNull()) break;
        if (m_currentTimeMs >= positionMs) break;
    }
    m_currentTimeMs = qMin(positionMs, m_info.durationMs);
    return true;
}

#include "MediaProbe.h"
#include "Logging.h"
#include "TimeUtil.h"
#include <QFileInfo>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/dict.h>
#include <libavutil/spherical.h>
}

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

    if (!QFileInfo::exists(filePath)) {
        m_error = QString("Video file not found: %1").arg(filePath);
        qCWarning(lcVideo) << m_error;
        return false;
    }

    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, errBuf);
        qCWarning(lcVideo) << m_error;
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = "Cannot find stream info";
        qCWarning(lcVideo) << m_error << filePath;
        avformat_close_input(&fmtCtx);
        return false;
    }

    m_info.containerFormat = QString(fmtCtx->iformat->long_name);
    if (fmtCtx->duration > 0)
        m_info.durationMs = av_rescale(fmtCtx->duration, 1000, AV_TIME_BASE);

    AVDictionaryEntry* tag = av_dict_get(fmtCtx->metadata, "creation_time", nullptr, 0);
    if (tag) {
        qint64 ms = TimeUtil::parseIsoUtcMs(QString(tag->value));
        if (ms > 0) m_info.creationTimeMs = ms;
    }

    int videoIdx = av_find_best_stream(fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (videoIdx >= 0) {
        AVStream* stream = fmtCtx->streams[videoIdx];
        AVCodecParameters* par = stream->codecpar;

        m_info.hasVideo = true;
        m_info.videoWidth = par->width;
        m_info.videoHeight = par->height;

        const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
        m_info.videoCodec = desc ? QString(desc->name) : "unknown";

        if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0) {
            m_info.videoFps = av_q2d(stream->avg_frame_rate);
        } else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0) {
            m_info.videoFps = av_q2d(stream->r_frame_rate);
        }

        // Stream duration is more reliable than the container's
        if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
            m_info.durationMs = av_rescale_q(stream->duration, stream->time_base, AVRational{1, 1000});

        const AVPacketSideData* sd = av_packet_side_data_get(
            par->coded_side_data, par->nb_coded_side_data, AV_PKT_DATA_SPHERICAL);
        if (sd && sd->size >= sizeof(AVSphericalMapping)) {
            const auto* mapping = reinterpret_cast<const AVSphericalMapping*>(sd->data);
            m_info.isSpherical = true;
            m_info.projection = QString(av_spherical_projection_name(mapping->projection));
        }
    }

    avformat_close_input(&fmtCtx);

    if (!m_info.hasVideo) {
        m_error = QString("No video stream in %1").arg(filePath);
        qCWarning(lcVideo) << m_error;
        return false;
    }
    if (m_info.durationMs <= 0) {
        m_error = QString("Video has no duration: %1").arg(filePath);
        qCWarning(lcVideo) << m_error;
        return false;
    }

    qCInfo(lcVideo).nospace() << "Probed " << filePath << ": " << m_info.videoWidth << "x"
                              << m_info.videoHeight << " " << m_info.videoCodec << " @ "
                              << m_info.videoFps << "fps, " << m_info.durationMs << "ms"
                              << (m_info.isSpherical ? ", spherical " + m_info.projection : QString());
    return true;
}

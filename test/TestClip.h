#pragma once

#include <QString>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
}

// Encodes a small MPEG-4 clip of drifting gray bars, every frame a keyframe.
// Returns false if the encoder or the muxer cannot be set up.
inline bool writeTestClip(const QString& path, int frameCount, int fps = 25,
                          int width = 64, int height = 48) {
    const QByteArray fileName = path.toUtf8();

    AVFormatContext* out = nullptr;
    if (avformat_alloc_output_context2(&out, nullptr, "mp4", fileName.constData()) < 0 || !out)
        return false;

    const AVCodec* encoder = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    AVCodecContext* enc = encoder ? avcodec_alloc_context3(encoder) : nullptr;
    AVStream* stream = avformat_new_stream(out, nullptr);
    AVFrame* frame = av_frame_alloc();
    AVPacket* packet = av_packet_alloc();

    bool ok = enc && stream && frame && packet;
    if (ok) {
        enc->width = width;
        enc->height = height;
        enc->pix_fmt = AV_PIX_FMT_YUV420P;
        enc->time_base = AVRational{1, fps};
        enc->framerate = AVRational{fps, 1};
        enc->gop_size = 1;
        enc->max_b_frames = 0;
        enc->bit_rate = 400000;
        if (out->oformat->flags & AVFMT_GLOBALHEADER)
            enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        ok = avcodec_open2(enc, encoder, nullptr) >= 0
            && avcodec_parameters_from_context(stream->codecpar, enc) >= 0;
    }
    if (ok) {
        stream->time_base = enc->time_base;
        stream->avg_frame_rate = enc->framerate;
        ok = avio_open(&out->pb, fileName.constData(), AVIO_FLAG_WRITE) >= 0
            && avformat_write_header(out, nullptr) >= 0;
    }
    if (ok) {
        frame->format = enc->pix_fmt;
        frame->width = width;
        frame->height = height;
        ok = av_frame_get_buffer(frame, 0) >= 0;
    }

    auto writePackets = [&]() {
        while (avcodec_receive_packet(enc, packet) >= 0) {
            // The muxer may have changed the stream time base in write_header
            av_packet_rescale_ts(packet, enc->time_base, stream->time_base);
            packet->stream_index = stream->index;
            if (av_interleaved_write_frame(out, packet) < 0) ok = false;
        }
    };

    for (int i = 0; ok && i < frameCount; ++i) {
        if (av_frame_make_writable(frame) < 0) {
            ok = false;
            break;
        }
        for (int y = 0; y < height; ++y)
            for (int x = 0; x < width; ++x)
                frame->data[0][y * frame->linesize[0] + x] = static_cast<uint8_t>((x + i * 4) * 3);
        for (int y = 0; y < height / 2; ++y) {
            for (int x = 0; x < width / 2; ++x) {
                frame->data[1][y * frame->linesize[1] + x] = 128;
                frame->data[2][y * frame->linesize[2] + x] = 128;
            }
        }
        frame->pts = i;
        ok = avcodec_send_frame(enc, frame) >= 0;
        if (ok) writePackets();
    }

    if (ok) {
        // Flush the encoder
        avcodec_send_frame(enc, nullptr);
        writePackets();
        ok = ok && av_write_trailer(out) >= 0;
    }

    if (packet) av_packet_free(&packet);
    if (frame) av_frame_free(&frame);
    if (enc) avcodec_free_context(&enc);
    if (out->pb) avio_closep(&out->pb);
    avformat_free_context(out);
    return ok;
}

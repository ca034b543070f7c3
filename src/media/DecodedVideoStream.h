#pragma once

#include <QTimer>
#include <QElapsedTimer>
#include <QImage>
#include <memory>
#include "VideoStreamProvider.h"
#include "VideoDecoder.h"

// Video stream backed by an FFmpeg decoder. Frames are decoded on the
// owning thread as the play clock advances and published via frameReady().
class DecodedVideoStream : public VideoStreamProvider {
    Q_OBJECT
public:
    explicit DecodedVideoStream(QObject* parent = nullptr);
    ~DecodedVideoStream() override;

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_decoder->isOpen(); }

    void play() override;
    void pause() override;
    void stop() override;

    bool seekTo(qint64 positionMs) override;
    void seekWithCallback(qint64 positionMs, std::function<void()> onComplete) override;
    void seekToAndPlay(qint64 positionMs) override;

    qint64 getCurrentPosition() const override;
    qint64 getDuration() const override { return m_decoder->info().durationMs; }
    bool isPlaying() const override { return m_playing; }

    const VideoInfo& info() const { return m_decoder->info(); }
    QString errorString() const { return m_error; }

signals:
    void frameReady(const QImage& frame, qint64 positionMs);

private slots:
    void onTick();

private:
    void finish();

    std::unique_ptr<VideoDecoder> m_decoder;
    QTimer m_tick;
    QElapsedTimer m_clock;

    // m_clock reading that corresponds to video position 0
    qint64 m_playOriginMs = 0;
    qint64 m_positionMs = 0;
    bool m_playing = false;
    bool m_completed = false;
    QString m_error;
};

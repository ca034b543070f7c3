#include "DecodedVideoStream.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QMetaObject>
#include <algorithm>

DecodedVideoStream::DecodedVideoStream(QObject* parent)
    : VideoStreamProvider(parent)
    , m_decoder(std::make_unique<VideoDecoder>()) {
    m_tick.setTimerType(Qt::PreciseTimer);
    m_tick.setInterval(AppConstants::DefaultVideoTickIntervalMs);
    connect(&m_tick, &QTimer::timeout, this, &DecodedVideoStream::onTick);
    m_clock.start();
}

DecodedVideoStream::~DecodedVideoStream() {
    close();
}

bool DecodedVideoStream::open(const QString& filePath) {
    close();
    if (!m_decoder->open(filePath)) {
        m_error = m_decoder->errorString();
        return false;
    }

    const double fps = m_decoder->info().fps;
    if (fps > 0)
        m_tick.setInterval(std::max(1, static_cast<int>(1000.0 / fps)));

    // Present the first frame
    QImage first = m_decoder->decodeNextFrame();
    if (!first.isNull()) emit frameReady(first, 0);

    emit streamEvent(StreamEvent::video(StreamEventType::Prepared, getDuration()));
    return true;
}

void DecodedVideoStream::close() {
    m_tick.stop();
    m_playing = false;
    m_completed = false;
    m_positionMs = 0;
    m_decoder->close();
}

qint64 DecodedVideoStream::getCurrentPosition() const {
    if (!m_playing) return m_positionMs;
    return std::clamp<qint64>(m_clock.elapsed() - m_playOriginMs, 0, getDuration());
}

void DecodedVideoStream::play() {
    if (!isOpen() || m_playing) return;
    if (m_completed) {
        qCDebug(lcVideo) << "Play requested at end of video";
        return;
    }

    m_playOriginMs = m_clock.elapsed() - m_positionMs;
    m_playing = true;
    m_tick.start();
    qCInfo(lcVideo) << "Play from" << m_positionMs << "ms";
    emit streamEvent(StreamEvent::video(StreamEventType::Started, m_positionMs));
}

void DecodedVideoStream::pause() {
    if (!m_playing) return;
    m_positionMs = getCurrentPosition();
    m_playing = false;
    m_tick.stop();
    qCInfo(lcVideo) << "Paused at" << m_positionMs << "ms";
}

void DecodedVideoStream::stop() {
    m_tick.stop();
    m_playing = false;
    m_completed = false;
    m_positionMs = 0;
    if (isOpen() && !m_decoder->seek(0))
        qCWarning(lcVideo) << "Cannot rewind video:" << m_decoder->errorString();
}

bool DecodedVideoStream::seekTo(qint64 positionMs) {
    if (!isOpen()) {
        m_error = "Video is not open";
        return false;
    }

    const qint64 target = std::clamp<qint64>(positionMs, 0, getDuration());
    if (!m_decoder->seek(target)) {
        m_error = m_decoder->errorString();
        return false;
    }

    m_positionMs = target;
    m_completed = false;
    if (m_playing) m_playOriginMs = m_clock.elapsed() - target;

    if (!m_decoder->lastFrame().isNull()) emit frameReady(m_decoder->lastFrame(), target);
    emit streamEvent(StreamEvent::video(StreamEventType::SeekComplete, target));
    return true;
}

void DecodedVideoStream::seekWithCallback(qint64 positionMs, std::function<void()> onComplete) {
    QMetaObject::invokeMethod(this, [this, positionMs, onComplete]() {
        if (!seekTo(positionMs)) {
            qCWarning(lcVideo) << "Seek to" << positionMs << "failed:" << m_error;
            return;
        }
        if (onComplete) onComplete();
    }, Qt::QueuedConnection);
}

void DecodedVideoStream::seekToAndPlay(qint64 positionMs) {
    if (!seekTo(positionMs)) {
        qCWarning(lcVideo) << "Seek to" << positionMs << "failed:" << m_error;
        return;
    }
    play();
}

void DecodedVideoStream::onTick() {
    if (!m_playing) return;

    const qint64 position = getCurrentPosition();
    QImage frame;
    while (!m_decoder->atEnd() && m_decoder->currentTimeMs() < position) {
        QImage next = m_decoder->decodeNextFrame();
        if (next.isNull()) break;
        frame = next;
    }
    if (!frame.isNull()) emit frameReady(frame, m_decoder->currentTimeMs());

    if (m_decoder->atEnd() || position >= getDuration()) finish();
}

void DecodedVideoStream::finish() {
    m_positionMs = getDuration();
    m_playing = false;
    m_completed = true;
    m_tick.stop();
    qCInfo(lcVideo) << "Video completed";
    emit streamEvent(StreamEvent::video(StreamEventType::Completed, m_positionMs));
}

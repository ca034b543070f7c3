#include "TrackGpsStream.h"
#include "GpsTrack.h"
#include "AppConstants.h"
#include "Logging.h"
#include "TimeUtil.h"
#include <algorithm>

TrackGpsStream::TrackGpsStream(const GpsTrack* track, QObject* parent)
    : GpsStreamProvider(parent), m_track(track) {
    m_tick.setTimerType(Qt::PreciseTimer);
    m_tick.setInterval(AppConstants::GpsTickIntervalMs);
    connect(&m_tick, &QTimer::timeout, this, &TrackGpsStream::onTick);
    m_clock.start();
    m_currentGpsTimeMs = getTrackStartTime();
}

TrackGpsStream::~TrackGpsStream() {
    m_tick.stop();
}

qint64 TrackGpsStream::getTrackStartTime() const {
    return m_track ? m_track->startTime() : 0;
}

qint64 TrackGpsStream::getTrackDuration() const {
    return m_track ? m_track->duration() : 0;
}

qint64 TrackGpsStream::replayTimeMs() const {
    return getTrackStartTime() + (m_clock.elapsed() - m_originMs);
}

void TrackGpsStream::begin(qint64 originMs) {
    m_originMs = originMs;
    m_nextIndex = 0;
    m_currentGpsTimeMs = getTrackStartTime();
    m_started = true;
    m_paused = false;
    m_completed = false;
    m_tick.start();
}

void TrackGpsStream::start() {
    if (!m_track || m_track->isEmpty()) {
        qCWarning(lcGpsStream) << "Cannot start: track is empty";
        return;
    }

    begin(m_clock.elapsed());
    qCInfo(lcGpsStream) << "Replay started at" << TimeUtil::gpsTimeToUtcStr(getTrackStartTime())
                        << "with" << m_track->size() << "fixes";

    // First fix goes out immediately
    emit fixEmitted(m_track->at(0));
    m_nextIndex = 1;
    emit streamEvent(StreamEvent::gps(StreamEventType::Started));
}

void TrackGpsStream::startWithDelay(qint64 delayMs) {
    if (!m_track || m_track->isEmpty()) {
        qCWarning(lcGpsStream) << "Cannot start: track is empty";
        return;
    }

    begin(m_clock.elapsed() + std::max<qint64>(0, delayMs));
    qCInfo(lcGpsStream) << "Replay starts in" << delayMs << "ms";
    emit streamEvent(StreamEvent::gps(StreamEventType::Started));
}

void TrackGpsStream::pause() {
    if (!m_started || m_paused) return;
    m_paused = true;
    m_pausedAtMs = m_clock.elapsed();
    m_tick.stop();
    qCInfo(lcGpsStream) << "Paused at" << TimeUtil::gpsTimeToUtcStr(m_currentGpsTimeMs);
}

void TrackGpsStream::resume() {
    if (!m_started || !m_paused) return;
    m_originMs += m_clock.elapsed() - m_pausedAtMs;
    m_paused = false;
    if (!m_completed) m_tick.start();
    qCInfo(lcGpsStream) << "Resumed at" << TimeUtil::gpsTimeToUtcStr(m_currentGpsTimeMs);
}

void TrackGpsStream::stop() {
    m_tick.stop();
    if (m_started) qCInfo(lcGpsStream) << "Stopped";
    m_started = false;
    m_paused = false;
    m_completed = false;
    m_nextIndex = 0;
    m_currentGpsTimeMs = getTrackStartTime();
}

bool TrackGpsStream::seek(qint64 gpsTimeMs, bool resumeAfter) {
    if (!m_track || m_track->isEmpty()) {
        qCWarning(lcGpsStream) << "Cannot seek: track is empty";
        return false;
    }

    const qint64 target = std::clamp(gpsTimeMs, m_track->startTime(), m_track->endTime());
    const qint64 now = m_clock.elapsed();

    m_originMs = now - (target - m_track->startTime());
    m_nextIndex = m_track->indexAtTime(target) + 1;
    m_currentGpsTimeMs = target;
    m_completed = false;

    qCInfo(lcGpsStream) << "Seek to" << TimeUtil::gpsTimeToUtcStr(target) << "resume" << resumeAfter;
    emit fixEmitted(m_track->fixAtTime(target));
    emit streamEvent(StreamEvent::gps(StreamEventType::SeekComplete, target));

    if (resumeAfter) {
        m_started = true;
        m_paused = false;
        m_tick.start();
        emit streamEvent(StreamEvent::gps(StreamEventType::Started));
    } else if (m_started) {
        // Hold at the target until resumed
        m_paused = true;
        m_pausedAtMs = now;
        m_tick.stop();
    }
    return true;
}

void TrackGpsStream::onTick() {
    if (!m_started || m_paused || m_completed || !m_track) return;

    const qint64 replayTime = replayTimeMs();
    if (replayTime < m_track->startTime()) return;

    while (m_nextIndex < m_track->size() && m_track->at(m_nextIndex).millis <= replayTime) {
        const GpsFix& fix = m_track->at(m_nextIndex);
        qCDebug(lcGpsStream) << "Fix" << m_nextIndex << fix.latitude << fix.longitude << fix.altitude;
        emit fixEmitted(fix);
        ++m_nextIndex;
    }
    m_currentGpsTimeMs = std::min(replayTime, m_track->endTime());

    if (m_nextIndex >= m_track->size()) {
        m_completed = true;
        m_tick.stop();
        qCInfo(lcGpsStream) << "Replay completed at" << TimeUtil::gpsTimeToUtcStr(m_currentGpsTimeMs);
        emit streamEvent(StreamEvent::gps(StreamEventType::Completed));
    }
}

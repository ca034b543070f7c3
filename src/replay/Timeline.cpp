#include "Timeline.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QString>
#include <algorithm>

void Timeline::initialize(qint64 gpsTrackStartMs, qint64 gpsTrackEndMs,
                          qint64 videoDurationMs, qint64 videoGpsOffsetMs) {
    if (gpsTrackEndMs <= gpsTrackStartMs) {
        qCWarning(lcTimeline) << "Invalid GPS bounds" << gpsTrackStartMs << "-" << gpsTrackEndMs
                              << "- timeline stays inert";
        clear();
        return;
    }

    m_gpsStartMs = gpsTrackStartMs;
    m_gpsEndMs = gpsTrackEndMs;
    m_videoGpsOffsetMs = videoGpsOffsetMs;
    m_videoDurationMs = std::max<qint64>(0, videoDurationMs);
    m_hasVideo = m_videoDurationMs > 0;

    if (m_hasVideo) {
        // Video frame 0 sits at gpsStart - offset on the GPS axis
        m_videoStartGpsMs = m_gpsStartMs - m_videoGpsOffsetMs;
        m_videoEndGpsMs = m_videoStartGpsMs + m_videoDurationMs;
        m_timelineStartMs = std::min(m_gpsStartMs, m_videoStartGpsMs);
        m_timelineEndMs = std::max(m_gpsEndMs, m_videoEndGpsMs);
    } else {
        m_videoStartGpsMs = 0;
        m_videoEndGpsMs = 0;
        m_timelineStartMs = m_gpsStartMs;
        m_timelineEndMs = m_gpsEndMs;
    }

    m_currentGpsTimeMs = m_gpsStartMs;
    m_pausedGpsTimeMs = 0;
    m_initialized = true;

    qCInfo(lcTimeline).nospace()
        << "Timeline initialized: timeline=" << m_timelineStartMs << "-" << m_timelineEndMs
        << " (" << timelineDurationMs() / 1000 << "s), gps=" << m_gpsStartMs << "-" << m_gpsEndMs
        << " (" << gpsDurationMs() / 1000 << "s), video="
        << (m_hasVideo ? QString("%1-%2").arg(m_videoStartGpsMs).arg(m_videoEndGpsMs) : QString("none"))
        << ", offset=" << m_videoGpsOffsetMs << "ms";
}

void Timeline::reset() {
    m_currentGpsTimeMs = m_gpsStartMs;
    m_pausedGpsTimeMs = 0;
    qCDebug(lcTimeline) << "Timeline reset to start";
}

void Timeline::clear() {
    *this = Timeline{};
    qCDebug(lcTimeline) << "Timeline cleared";
}

std::optional<qint64> Timeline::getCurrentVideoTimeMs() const {
    return gpsTimeToVideoTime(m_currentGpsTimeMs);
}

std::optional<qint64> Timeline::gpsTimeToVideoTime(qint64 gpsTimeMs) const {
    if (!m_hasVideo) return std::nullopt;

    const qint64 videoTimeMs = gpsTimeMs - m_gpsStartMs + m_videoGpsOffsetMs;
    if (videoTimeMs < -AppConstants::VideoBoundsToleranceMs) return std::nullopt;
    if (videoTimeMs > m_videoDurationMs + AppConstants::VideoBoundsToleranceMs) return std::nullopt;
    return std::clamp<qint64>(videoTimeMs, 0, m_videoDurationMs);
}

qint64 Timeline::videoTimeToGpsTime(qint64 videoTimeMs) const {
    return m_gpsStartMs + videoTimeMs - m_videoGpsOffsetMs;
}

TimelineZone Timeline::zoneOf(qint64 gpsTimeMs) const {
    if (m_hasVideo && gpsTimeMs < m_gpsStartMs) return TimelineZone::BeforeGps;
    if (m_hasVideo && gpsTimeMs > m_gpsEndMs) return TimelineZone::AfterGps;
    return TimelineZone::WithinGps;
}

std::pair<qint64, std::optional<qint64>> Timeline::calculateSeekTargets(qint64 targetGpsTimeMs) const {
    const qint64 clamped = std::clamp(targetGpsTimeMs, m_gpsStartMs, m_gpsEndMs);
    return {clamped, gpsTimeToVideoTime(clamped)};
}

void Timeline::onPause() {
    m_pausedGpsTimeMs = m_currentGpsTimeMs;
    qCInfo(lcTimeline) << "Paused at GPS time" << m_pausedGpsTimeMs
                       << "(elapsed" << getElapsedMs() << "ms)";
}

qint64 Timeline::getGpsStartDelayMs() const {
    if (!m_hasVideo) return 0;
    return std::max<qint64>(0, m_gpsStartMs - m_timelineStartMs);
}

qint64 Timeline::getVideoStartDelayMs() const {
    if (!m_hasVideo) return 0;
    return std::max<qint64>(0, m_videoStartGpsMs - m_timelineStartMs);
}

qint64 Timeline::getInitialVideoPositionMs() const {
    if (!m_hasVideo) return 0;
    // Distance from the first fix to the first video frame
    return std::max<qint64>(0, m_videoStartGpsMs - m_gpsStartMs);
}

bool Timeline::videoStartsFirst() const {
    if (!m_hasVideo) return false;
    return m_videoStartGpsMs < m_gpsStartMs;
}

bool Timeline::gpsStartsFirst() const {
    if (!m_hasVideo) return true;
    return m_gpsStartMs <= m_videoStartGpsMs;
}

#pragma once

#include <QtGlobal>
#include <optional>
#include <utility>

enum class TimelineZone {
    BeforeGps,   // video-only, before the first GPS fix
    WithinGps,
    AfterGps     // video-only, after the last GPS fix
};

// Unified playback timeline for a GPS track and an optional video.
//
// The canonical axis is GPS time (ms since epoch, as recorded in the track).
// Video time (ms from the first frame) maps onto it through the configured
// offset:
//   videoTime = gpsTime - gpsStart + videoGpsOffset
//   gpsTime   = gpsStart + videoTime - videoGpsOffset
// A positive offset means the video lags GPS: its first frame sits before
// the first fix on the timeline.
class Timeline {
public:
    Timeline() = default;

    // Leaves the timeline uninitialized if gpsTrackEndMs <= gpsTrackStartMs.
    // videoDurationMs == 0 means no video.
    void initialize(qint64 gpsTrackStartMs, qint64 gpsTrackEndMs,
                    qint64 videoDurationMs, qint64 videoGpsOffsetMs = 0);
    void reset();
    void clear();

    bool isInitialized() const { return m_initialized; }
    bool hasVideo() const { return m_hasVideo; }

    qint64 timelineStartMs() const { return m_timelineStartMs; }
    qint64 timelineEndMs() const { return m_timelineEndMs; }
    qint64 timelineDurationMs() const { return m_timelineEndMs - m_timelineStartMs; }
    qint64 gpsStartMs() const { return m_gpsStartMs; }
    qint64 gpsEndMs() const { return m_gpsEndMs; }
    qint64 gpsDurationMs() const { return m_gpsEndMs - m_gpsStartMs; }
    qint64 videoStartGpsMs() const { return m_videoStartGpsMs; }
    qint64 videoEndGpsMs() const { return m_videoEndGpsMs; }
    qint64 videoDurationMs() const { return m_videoDurationMs; }
    qint64 videoGpsOffsetMs() const { return m_videoGpsOffsetMs; }

    // Position
    void updatePosition(qint64 gpsTimeMs) { m_currentGpsTimeMs = gpsTimeMs; }
    qint64 getCurrentGpsTimeMs() const { return m_currentGpsTimeMs; }
    std::optional<qint64> getCurrentVideoTimeMs() const;
    qint64 getElapsedMs() const { return m_currentGpsTimeMs - m_timelineStartMs; }

    // Conversions
    std::optional<qint64> gpsTimeToVideoTime(qint64 gpsTimeMs) const;
    qint64 videoTimeToGpsTime(qint64 videoTimeMs) const;
    qint64 elapsedToGpsTime(qint64 elapsedMs) const { return m_timelineStartMs + elapsedMs; }
    qint64 gpsTimeToElapsed(qint64 gpsTimeMs) const { return gpsTimeMs - m_timelineStartMs; }

    TimelineZone zoneOf(qint64 gpsTimeMs) const;

    // Clamp a target into the GPS track and pair it with its video time
    std::pair<qint64, std::optional<qint64>> calculateSeekTargets(qint64 targetGpsTimeMs) const;

    // Pause / resume
    void onPause();
    qint64 getPausedGpsTimeMs() const { return m_pausedGpsTimeMs; }
    std::optional<qint64> getPausedVideoTimeMs() const { return gpsTimeToVideoTime(m_pausedGpsTimeMs); }

    // Initial start timing
    qint64 getGpsStartDelayMs() const;
    qint64 getVideoStartDelayMs() const;
    qint64 getInitialVideoPositionMs() const;
    bool videoStartsFirst() const;
    bool gpsStartsFirst() const;

private:
    qint64 m_timelineStartMs = 0;
    qint64 m_timelineEndMs = 0;
    qint64 m_gpsStartMs = 0;
    qint64 m_gpsEndMs = 0;
    qint64 m_videoStartGpsMs = 0;
    qint64 m_videoEndGpsMs = 0;
    qint64 m_videoDurationMs = 0;
    qint64 m_videoGpsOffsetMs = 0;
    bool m_hasVideo = false;
    bool m_initialized = false;

    qint64 m_currentGpsTimeMs = 0;
    qint64 m_pausedGpsTimeMs = 0;
};

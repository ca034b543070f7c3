#pragma once

#include <QObject>
#include <QElapsedTimer>
#include <optional>
#include "Timeline.h"
#include "CompletionTracker.h"
#include "CancellableTimer.h"
#include "StreamEvent.h"
#include "GpsFix.h"

class GpsStreamProvider;
class VideoStreamProvider;
class MotionEstimator;

enum class PlaybackState {
    Stopped,
    Playing,
    Paused,
    Completed
};

const char* toString(PlaybackState state);

// Drives a GPS replay and an optional 360 video along one Timeline.
//
// All commands and stream events are handled on the thread that owns the
// controller. Streams report through StreamEvent on queued connections;
// delayed stream starts go through one CancellableTimer per stream and are
// dropped if the controller is no longer Playing when they fire.
class PlaybackController : public QObject {
    Q_OBJECT
public:
    // The estimator is not owned and must outlive the controller
    explicit PlaybackController(MotionEstimator* estimator, QObject* parent = nullptr);
    ~PlaybackController();

    // Streams are not owned. Replacing a stream invalidates the timeline.
    void setGpsStream(GpsStreamProvider* gps);
    void setVideoStream(VideoStreamProvider* video);
    void setVideoGpsOffsetMs(qint64 offsetMs);
    qint64 videoGpsOffsetMs() const { return m_videoGpsOffsetMs; }

    void play();
    void pause();
    void stop();
    void togglePlayPause();
    void resume();

    void seekTo(qint64 targetGpsTimeMs, std::optional<qint64> targetVideoTimeMs, bool resumeAfter);
    // Scrubbing: moves both streams without resuming, leaves motion and
    // completion state untouched
    void seekPreview(qint64 targetGpsTimeMs, std::optional<qint64> targetVideoTimeMs);

    void onSleep();
    void onWake();

    void initializeTimeline();

    // Bounds of the GPS track itself; timeline() has the unified bounds
    qint64 getTrackStartTimeMs() const;
    qint64 getTrackEndTimeMs() const;
    qint64 getTrackDurationMs() const;
    qint64 getCurrentGpsTimeMs() const;

    PlaybackState state() const { return m_state; }
    const Timeline& timeline() const { return m_timeline; }
    const CompletionTracker& completion() const { return m_tracker; }

public slots:
    void handleEvent(const StreamEvent& event);

signals:
    void stateChanged(PlaybackState state);
    void seekPerformed(qint64 gpsTimeMs);

private slots:
    void onGpsPosition(const GpsFix& fix);
    void onPlaybackCompleted();

private:
    void setState(PlaybackState state);
    void startFresh();
    void haltStreams();
    void finishPlayback();
    void updatePositionFromVideo();
    void markGpsFinished();
    void scheduleGpsStart(qint64 delayMs);
    void scheduleVideoStart(qint64 delayMs);
    void cancelScheduledStarts();
    void startGpsFromVideoPosition();
    void syncVideoToGps(qint64 gpsTimeMs);
    bool videoActive() const;

    MotionEstimator* m_estimator = nullptr;
    GpsStreamProvider* m_gps = nullptr;
    VideoStreamProvider* m_video = nullptr;

    Timeline m_timeline;
    CompletionTracker m_tracker;
    CancellableTimer m_gpsStartTimer;
    CancellableTimer m_videoStartTimer;

    PlaybackState m_state = PlaybackState::Stopped;
    qint64 m_videoGpsOffsetMs = 0;
    qint64 m_videoDurationMs = 0;

    // Drift correction bookkeeping, in m_clock milliseconds
    QElapsedTimer m_clock;
    qint64 m_syncDisabledUntilMs = 0;
    qint64 m_lastDriftSeekMs = -1;
};

Q_DECLARE_METATYPE(PlaybackState)

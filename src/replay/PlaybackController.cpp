#include "PlaybackController.h"
#include "GpsStreamProvider.h"
#include "VideoStreamProvider.h"
#include "MotionEstimator.h"
#include "AppConstants.h"
#include "Logging.h"
#include <algorithm>

const char* toString(PlaybackState state) {
    switch (state) {
    case PlaybackState::Stopped: return "Stopped";
    case PlaybackState::Playing: return "Playing";
    case PlaybackState::Paused: return "Paused";
    case PlaybackState::Completed: return "Completed";
    }
    return "?";
}

PlaybackController::PlaybackController(MotionEstimator* estimator, QObject* parent)
    : QObject(parent)
    , m_estimator(estimator)
    , m_tracker(estimator) {
    qRegisterMetaType<StreamEvent>();
    qRegisterMetaType<GpsFix>();
    qRegisterMetaType<PlaybackState>();

    connect(&m_tracker, &CompletionTracker::readyToRestart,
            this, &PlaybackController::onPlaybackCompleted);
    m_clock.start();
}

PlaybackController::~PlaybackController() {
    cancelScheduledStarts();
}

void PlaybackController::setGpsStream(GpsStreamProvider* gps) {
    if (m_gps == gps) return;
    if (m_gps) disconnect(m_gps, nullptr, this, nullptr);

    m_gps = gps;
    m_timeline.clear();

    if (m_gps) {
        connect(m_gps, &GpsStreamProvider::streamEvent,
                this, &PlaybackController::handleEvent, Qt::QueuedConnection);
        connect(m_gps, &GpsStreamProvider::fixEmitted,
                this, &PlaybackController::onGpsPosition);
    }
}

void PlaybackController::setVideoStream(VideoStreamProvider* video) {
    if (m_video == video) return;
    if (m_video) disconnect(m_video, nullptr, this, nullptr);

    m_video = video;
    m_videoDurationMs = 0;
    m_timeline.clear();

    if (m_video) {
        connect(m_video, &VideoStreamProvider::streamEvent,
                this, &PlaybackController::handleEvent, Qt::QueuedConnection);
    }
}

void PlaybackController::setVideoGpsOffsetMs(qint64 offsetMs) {
    if (m_videoGpsOffsetMs == offsetMs) return;
    m_videoGpsOffsetMs = offsetMs;
    m_timeline.clear();
}

void PlaybackController::initializeTimeline() {
    if (!m_gps) {
        qCWarning(lcPlayback) << "Cannot initialize timeline: no GPS stream";
        return;
    }

    const qint64 start = m_gps->getTrackStartTime();
    const qint64 end = start + m_gps->getTrackDuration();
    qint64 videoDuration = 0;
    if (m_video) {
        videoDuration = m_videoDurationMs > 0 ? m_videoDurationMs : m_video->getDuration();
    }

    m_timeline.initialize(start, end, videoDuration, m_videoGpsOffsetMs);
    m_tracker.setHasVideo(m_timeline.hasVideo());
}

bool PlaybackController::videoActive() const {
    return m_video && m_timeline.hasVideo();
}

void PlaybackController::setState(PlaybackState state) {
    if (m_state == state) return;
    qCInfo(lcPlayback) << "State" << toString(m_state) << "->" << toString(state);
    m_state = state;
    emit stateChanged(m_state);
}

void PlaybackController::play() {
    switch (m_state) {
    case PlaybackState::Playing:
        return;
    case PlaybackState::Paused:
        resume();
        return;
    case PlaybackState::Stopped:
    case PlaybackState::Completed:
        startFresh();
        return;
    }
}

void PlaybackController::pause() {
    if (m_state != PlaybackState::Playing) return;

    cancelScheduledStarts();
    if (m_estimator) m_estimator->freeze();
    updatePositionFromVideo();
    m_timeline.onPause();
    if (m_gps) m_gps->pause();
    if (m_video) m_video->pause();
    setState(PlaybackState::Paused);
}

void PlaybackController::stop() {
    cancelScheduledStarts();
    if (m_estimator) m_estimator->freeze();
    haltStreams();
    m_timeline.reset();
    setState(PlaybackState::Stopped);
}

void PlaybackController::togglePlayPause() {
    if (m_state == PlaybackState::Playing) {
        pause();
    } else {
        play();
    }
}

void PlaybackController::haltStreams() {
    if (m_video) m_video->stop();
    if (m_gps) m_gps->stop();
}

void PlaybackController::startFresh() {
    if (!m_gps) {
        qCWarning(lcPlayback) << "Cannot start playback: no GPS stream";
        return;
    }

    m_tracker.prepareForRestart();
    if (m_estimator) m_estimator->reset();
    m_timeline.reset();

    if (!m_timeline.isInitialized()) initializeTimeline();
    if (!m_timeline.isInitialized()) {
        qCWarning(lcPlayback) << "Cannot start playback: timeline has no valid bounds";
        return;
    }

    // Playing before any stream starts: scheduled starts check it when they fire
    setState(PlaybackState::Playing);

    if (!videoActive()) {
        qCInfo(lcPlayback) << "Starting GPS-only playback";
        m_gps->start();
        return;
    }

    if (!m_video->seekTo(0))
        qCWarning(lcPlayback) << "Video failed to seek to start";

    if (m_timeline.videoStartsFirst()) {
        const qint64 gpsDelay = m_timeline.getGpsStartDelayMs();
        qCInfo(lcPlayback) << "Video starts first, GPS follows in" << gpsDelay << "ms";
        m_video->play();
        if (gpsDelay > 0) {
            if (m_estimator) m_estimator->freeze();
            scheduleGpsStart(gpsDelay);
        } else {
            m_gps->start();
        }
    } else {
        const qint64 videoDelay = m_timeline.getVideoStartDelayMs();
        qCInfo(lcPlayback) << "GPS starts first, video follows in" << videoDelay << "ms";
        m_gps->start();
        if (videoDelay > 0) {
            scheduleVideoStart(videoDelay);
        } else {
            m_video->play();
        }
    }
}

void PlaybackController::scheduleGpsStart(qint64 delayMs) {
    m_gpsStartTimer.schedule(delayMs, [this]() {
        if (m_state != PlaybackState::Playing || !m_gps) {
            qCDebug(lcPlayback) << "Dropping stale GPS start in state" << toString(m_state);
            return;
        }
        startGpsFromVideoPosition();
    });
}

void PlaybackController::scheduleVideoStart(qint64 delayMs) {
    m_videoStartTimer.schedule(delayMs, [this]() {
        if (m_state != PlaybackState::Playing || !m_video) {
            qCDebug(lcPlayback) << "Dropping stale video start in state" << toString(m_state);
            return;
        }
        qCInfo(lcPlayback) << "Scheduled video start";
        m_video->play();
    });
}

void PlaybackController::cancelScheduledStarts() {
    if (m_gpsStartTimer.cancel()) qCDebug(lcPlayback) << "Cancelled scheduled GPS start";
    if (m_videoStartTimer.cancel()) qCDebug(lcPlayback) << "Cancelled scheduled video start";
}

// Before the first fix only the video moves the replay position
void PlaybackController::updatePositionFromVideo() {
    if (!m_gps || m_gps->isStarted() || !videoActive()) return;
    m_timeline.updatePosition(m_timeline.videoTimeToGpsTime(m_video->getCurrentPosition()));
}

// Past the last fix the GPS stream has nothing left to replay
void PlaybackController::markGpsFinished() {
    m_tracker.markStarted();
    m_tracker.onGpsCompleted();
}

void PlaybackController::startGpsFromVideoPosition() {
    // The video seek that lands us in the track would otherwise fight the sync
    m_syncDisabledUntilMs = m_clock.elapsed() + AppConstants::SyncHoldAfterGpsStartMs;

    if (m_video) {
        const qint64 gpsTime = m_timeline.videoTimeToGpsTime(m_video->getCurrentPosition());
        if (gpsTime >= m_timeline.gpsStartMs() && gpsTime <= m_timeline.gpsEndMs()) {
            qCInfo(lcPlayback) << "Scheduled GPS start at" << gpsTime;
            if (m_gps->seek(gpsTime, true)) return;
            qCWarning(lcPlayback) << "GPS seek to" << gpsTime << "failed, starting from the beginning";
        }
    }

    qCInfo(lcPlayback) << "Scheduled GPS start from track beginning";
    m_gps->start();
}

void PlaybackController::resume() {
    if (m_state == PlaybackState::Playing) return;
    if (m_state != PlaybackState::Paused) {
        startFresh();
        return;
    }
    if (!m_gps || !m_timeline.isInitialized()) {
        qCWarning(lcPlayback) << "Cannot resume: no GPS stream or timeline";
        return;
    }

    if (m_tracker.isReadyToRestart()) {
        qCInfo(lcPlayback) << "Streams finished while paused";
        finishPlayback();
        return;
    }

    if (m_estimator) m_estimator->unfreeze();
    updatePositionFromVideo();
    const qint64 current = m_timeline.getCurrentGpsTimeMs();
    setState(PlaybackState::Playing);

    if (!m_gps->isStarted()) {
        switch (m_timeline.zoneOf(current)) {
        case TimelineZone::BeforeGps: {
            if (m_estimator) m_estimator->freeze();
            const qint64 videoPos = m_video ? m_video->getCurrentPosition() : 0;
            scheduleGpsStart(std::max<qint64>(0, m_timeline.videoGpsOffsetMs() - videoPos));
            break;
        }
        case TimelineZone::AfterGps:
            markGpsFinished();
            break;
        case TimelineZone::WithinGps:
            if (!m_gps->seek(current, true))
                qCWarning(lcPlayback) << "GPS seek to" << current << "failed on resume";
            break;
        }
    } else {
        m_gps->resume();
    }
    if (m_state != PlaybackState::Playing) return;

    if (videoActive()) {
        if (current < m_timeline.videoStartGpsMs()) {
            scheduleVideoStart(m_timeline.videoStartGpsMs() - current);
        } else {
            m_video->play();
        }
    }
}

void PlaybackController::seekTo(qint64 targetGpsTimeMs, std::optional<qint64> targetVideoTimeMs,
                                bool resumeAfter) {
    if (!m_gps || !m_timeline.isInitialized()) {
        qCWarning(lcPlayback) << "Cannot seek: no GPS stream or timeline";
        return;
    }

    const TimelineZone zone = m_timeline.zoneOf(targetGpsTimeMs);
    qCInfo(lcPlayback) << "Seek to" << targetGpsTimeMs << "video" << targetVideoTimeMs.value_or(-1)
                       << "resume" << resumeAfter;

    // Nothing has changed yet if the GPS cannot get there
    if (zone == TimelineZone::WithinGps && !m_gps->seek(targetGpsTimeMs, resumeAfter)) {
        qCWarning(lcPlayback) << "GPS seek to" << targetGpsTimeMs << "failed";
        return;
    }

    cancelScheduledStarts();
    if (m_estimator) {
        m_estimator->freeze();
        m_estimator->softReset();
    }
    m_timeline.updatePosition(targetGpsTimeMs);

    switch (zone) {
    case TimelineZone::BeforeGps:
        if (m_gps->isStarted()) m_gps->stop();
        if (resumeAfter) {
            const qint64 videoPos = targetVideoTimeMs.value_or(0);
            scheduleGpsStart(std::max<qint64>(0, m_timeline.videoGpsOffsetMs() - videoPos));
        }
        break;
    case TimelineZone::AfterGps:
        if (m_gps->isStarted()) m_gps->stop();
        break;
    case TimelineZone::WithinGps:
        break;
    }

    if (m_video && targetVideoTimeMs) {
        if (resumeAfter) {
            m_video->seekToAndPlay(*targetVideoTimeMs);
        } else if (!m_video->seekTo(*targetVideoTimeMs)) {
            qCWarning(lcPlayback) << "Video seek to" << *targetVideoTimeMs << "failed";
        }
    }

    if (m_tracker.gpsCompleted() || m_tracker.videoCompleted())
        m_tracker.prepareForRestart();
    if (zone == TimelineZone::AfterGps) markGpsFinished();

    if (resumeAfter) setState(PlaybackState::Playing);
    emit seekPerformed(targetGpsTimeMs);
}

void PlaybackController::seekPreview(qint64 targetGpsTimeMs, std::optional<qint64> targetVideoTimeMs) {
    if (!m_gps || !m_timeline.isInitialized()) return;

    m_timeline.updatePosition(targetGpsTimeMs);

    if (!m_timeline.hasVideo() || m_timeline.zoneOf(targetGpsTimeMs) == TimelineZone::WithinGps) {
        if (!m_gps->seek(targetGpsTimeMs, false))
            qCDebug(lcPlayback) << "Preview GPS seek to" << targetGpsTimeMs << "failed";
    }
    if (m_video && targetVideoTimeMs) {
        if (!m_video->seekTo(*targetVideoTimeMs))
            qCDebug(lcPlayback) << "Preview video seek to" << *targetVideoTimeMs << "failed";
    }
}

void PlaybackController::onSleep() {
    if (m_state != PlaybackState::Playing) return;
    qCInfo(lcPlayback) << "Sleep: pausing GPS";
    if (m_estimator) m_estimator->freeze();
    updatePositionFromVideo();
    m_timeline.onPause();
    if (m_gps) m_gps->pause();
    setState(PlaybackState::Paused);
}

void PlaybackController::onWake() {
    qCInfo(lcPlayback) << "Wake in state" << toString(m_state);
}

void PlaybackController::handleEvent(const StreamEvent& event) {
    qCDebug(lcPlayback) << "Event" << toString(event.source) << toString(event.type) << event.valueMs;

    if (event.source == StreamSource::Gps) {
        switch (event.type) {
        case StreamEventType::Started:
            if (!m_gps || !m_gps->isStarted()) {
                qCDebug(lcPlayback) << "Ignoring stale GPS start";
                return;
            }
            m_tracker.onGpsStarted();
            if (m_state != PlaybackState::Playing && m_estimator) m_estimator->freeze();
            break;
        case StreamEventType::SeekComplete:
            m_timeline.updatePosition(event.valueMs);
            break;
        case StreamEventType::Completed:
            m_tracker.onGpsCompleted();
            break;
        case StreamEventType::Prepared:
            break;
        }
        return;
    }

    switch (event.type) {
    case StreamEventType::Prepared:
        m_videoDurationMs = event.valueMs;
        if (!m_timeline.isInitialized() && m_gps) initializeTimeline();
        break;
    case StreamEventType::Started:
        m_tracker.onVideoStarted();
        break;
    case StreamEventType::SeekComplete:
        break;
    case StreamEventType::Completed:
        m_tracker.onVideoCompleted();
        break;
    }
}

void PlaybackController::onGpsPosition(const GpsFix& fix) {
    m_timeline.updatePosition(fix.millis);
    syncVideoToGps(fix.millis);
}

void PlaybackController::syncVideoToGps(qint64 gpsTimeMs) {
    if (m_state != PlaybackState::Playing || !videoActive() || !m_video->isPlaying()) return;

    const qint64 now = m_clock.elapsed();
    if (now < m_syncDisabledUntilMs) return;

    const std::optional<qint64> expected = m_timeline.gpsTimeToVideoTime(gpsTimeMs);
    if (!expected) return;

    const qint64 drift = qAbs(m_video->getCurrentPosition() - *expected);
    if (drift <= AppConstants::MaxVideoDriftMs) return;
    if (m_lastDriftSeekMs >= 0 && now - m_lastDriftSeekMs < AppConstants::DriftSeekCooldownMs) return;

    qCInfo(lcPlayback) << "Video drift" << drift << "ms, seeking to" << *expected;
    m_lastDriftSeekMs = now;
    if (!m_video->seekTo(*expected))
        qCWarning(lcPlayback) << "Drift correction seek failed";
}

void PlaybackController::onPlaybackCompleted() {
    if (m_state != PlaybackState::Playing) {
        qCDebug(lcPlayback) << "Ignoring completion in state" << toString(m_state);
        return;
    }
    finishPlayback();
}

void PlaybackController::finishPlayback() {
    qCInfo(lcPlayback) << "Playback completed";
    cancelScheduledStarts();
    if (m_estimator) m_estimator->freeze();
    haltStreams();
    m_timeline.reset();
    setState(PlaybackState::Completed);
}

qint64 PlaybackController::getTrackStartTimeMs() const {
    return m_gps ? m_gps->getTrackStartTime() : 0;
}

qint64 PlaybackController::getTrackEndTimeMs() const {
    return getTrackStartTimeMs() + getTrackDurationMs();
}

qint64 PlaybackController::getTrackDurationMs() const {
    return m_gps ? m_gps->getTrackDuration() : 0;
}

qint64 PlaybackController::getCurrentGpsTimeMs() const {
    return m_timeline.getCurrentGpsTimeMs();
}

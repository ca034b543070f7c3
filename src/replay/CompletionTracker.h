#pragma once

#include <QObject>

class MotionEstimator;

// Aggregates "stream finished" signals from the GPS and video streams into a
// single restart decision. Also freezes the motion estimator when the GPS
// feed ends and unfreezes it when fixes start flowing again.
class CompletionTracker : public QObject {
    Q_OBJECT
public:
    explicit CompletionTracker(MotionEstimator* estimator, QObject* parent = nullptr);
    ~CompletionTracker();

    void setHasVideo(bool hasVideo) { m_hasVideo = hasVideo; }
    bool hasVideo() const { return m_hasVideo; }

    // Playback began without a GPS start, e.g. resumed past the last fix
    void markStarted() { m_hasStarted = true; }
    void onGpsStarted();
    void onGpsCompleted();
    void onVideoStarted();
    void onVideoCompleted();

    bool isReadyToRestart() const;
    void prepareForRestart();
    void reset();

    bool gpsCompleted() const { return m_gpsCompleted; }
    bool videoCompleted() const { return m_videoCompleted; }
    bool hasStarted() const { return m_hasStarted; }

signals:
    void readyToRestart();

private:
    void checkReadyToRestart();

    MotionEstimator* m_estimator = nullptr;
    bool m_hasVideo = false;
    bool m_gpsCompleted = false;
    bool m_videoCompleted = false;
    bool m_hasStarted = false;
};

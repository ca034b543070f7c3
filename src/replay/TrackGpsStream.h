#pragma once

#include <QTimer>
#include <QElapsedTimer>
#include "GpsStreamProvider.h"

class GpsTrack;

// Replays a recorded track in real time. Each fix is emitted when the
// replay clock reaches its timestamp; the clock is a monotonic timer whose
// origin moves on pause, seek and delayed start.
class TrackGpsStream : public GpsStreamProvider {
    Q_OBJECT
public:
    // The track is not owned and must outlive the stream
    explicit TrackGpsStream(const GpsTrack* track, QObject* parent = nullptr);
    ~TrackGpsStream() override;

    void start() override;
    void startWithDelay(qint64 delayMs) override;
    void pause() override;
    void resume() override;
    void stop() override;
    bool seek(qint64 gpsTimeMs, bool resumeAfter) override;

    qint64 getTrackStartTime() const override;
    qint64 getTrackDuration() const override;
    bool isStarted() const override { return m_started; }
    qint64 getCurrentGpsTimeMs() const override { return m_currentGpsTimeMs; }

    bool isPaused() const { return m_paused; }
    bool isCompleted() const { return m_completed; }
    int nextIndex() const { return m_nextIndex; }

private slots:
    void onTick();

private:
    void begin(qint64 originMs);
    qint64 replayTimeMs() const;

    const GpsTrack* m_track = nullptr;
    QTimer m_tick;
    QElapsedTimer m_clock;

    // m_clock reading at which the first fix is due
    qint64 m_originMs = 0;
    qint64 m_pausedAtMs = 0;
    qint64 m_currentGpsTimeMs = 0;
    int m_nextIndex = 0;

    bool m_started = false;
    bool m_paused = false;
    bool m_completed = false;
};

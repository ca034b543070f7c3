#pragma once

#include <QObject>
#include "GpsFix.h"
#include "StreamEvent.h"

// Replayed GPS feed driven by the playback controller.
// Implementations report Started / SeekComplete / Completed through
// streamEvent() and every replayed fix through fixEmitted().
class GpsStreamProvider : public QObject {
    Q_OBJECT
public:
    explicit GpsStreamProvider(QObject* parent = nullptr) : QObject(parent) {}
    ~GpsStreamProvider() override = default;

    virtual void start() = 0;
    virtual void startWithDelay(qint64 delayMs) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void stop() = 0;

    // Returns false if the seek could not be performed (e.g. no track).
    virtual bool seek(qint64 gpsTimeMs, bool resumeAfter) = 0;

    virtual qint64 getTrackStartTime() const = 0;
    virtual qint64 getTrackDuration() const = 0;
    virtual bool isStarted() const = 0;
    virtual qint64 getCurrentGpsTimeMs() const = 0;

signals:
    void streamEvent(const StreamEvent& event);
    void fixEmitted(const GpsFix& fix);
};

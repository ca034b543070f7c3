#pragma once

#include <QObject>
#include <functional>
#include "StreamEvent.h"

// Video playback driven by the playback controller. Positions are
// milliseconds from the first frame.
class VideoStreamProvider : public QObject {
    Q_OBJECT
public:
    explicit VideoStreamProvider(QObject* parent = nullptr) : QObject(parent) {}
    ~VideoStreamProvider() override = default;

    virtual void play() = 0;
    virtual void pause() = 0;
    // Stop playback and return to the first frame
    virtual void stop() = 0;

    virtual bool seekTo(qint64 positionMs) = 0;
    // onComplete runs on the provider's thread once the seek has landed
    virtual void seekWithCallback(qint64 positionMs, std::function<void()> onComplete) = 0;
    virtual void seekToAndPlay(qint64 positionMs) = 0;

    virtual qint64 getCurrentPosition() const = 0;
    virtual qint64 getDuration() const = 0;
    virtual bool isPlaying() const = 0;

signals:
    void streamEvent(const StreamEvent& event);
};

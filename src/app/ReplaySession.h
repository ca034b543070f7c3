#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include "ReplayConfig.h"
#include "MotionEstimator.h"
#include "MediaProbe.h"

class GpsTrack;
class TrackGpsStream;
class DecodedVideoStream;
class PlaybackController;

// Everything one replay needs, owned together: the loaded track, both
// streams, the motion estimator and the playback controller. Closing or
// destroying the session tears all of it down; nothing is shared between
// sessions.
class ReplaySession : public QObject {
    Q_OBJECT
public:
    explicit ReplaySession(QObject* parent = nullptr);
    ~ReplaySession();

    bool open(const ReplayOptions& options);
    void close();
    bool isOpen() const { return m_controller != nullptr; }

    // Host lifecycle (e.g. system suspend)
    void onSleep();
    void onWake();

    PlaybackController* controller() const { return m_controller.get(); }
    const GpsTrack* track() const { return m_track.get(); }
    DecodedVideoStream* video() const { return m_video.get(); }
    const MotionEstimator& estimator() const { return m_estimator; }
    const MediaInfo& videoInfo() const { return m_videoInfo; }
    const ReplayOptions& options() const { return m_options; }

    QString errorString() const { return m_error; }

signals:
    void opened();
    void closed();

private:
    bool fail(const QString& message);

    ReplayOptions m_options;
    MotionEstimator m_estimator;
    MediaInfo m_videoInfo;

    // Destroyed in reverse order: controller before the streams it drives
    std::unique_ptr<GpsTrack> m_track;
    std::unique_ptr<TrackGpsStream> m_gps;
    std::unique_ptr<DecodedVideoStream> m_video;
    std::unique_ptr<PlaybackController> m_controller;

    QString m_error;
};

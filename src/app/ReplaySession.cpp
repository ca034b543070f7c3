#include "ReplaySession.h"
#include "GpsTrack.h"
#include "TrackParser.h"
#include "TrackGpsStream.h"
#include "DecodedVideoStream.h"
#include "PlaybackController.h"
#include "Logging.h"
#include "TimeUtil.h"

ReplaySession::ReplaySession(QObject* parent) : QObject(parent) {}

ReplaySession::~ReplaySession() {
    close();
}

bool ReplaySession::fail(const QString& message) {
    m_error = message;
    qCWarning(lcSession) << message;
    close();
    return false;
}

bool ReplaySession::open(const ReplayOptions& options) {
    close();
    m_error.clear();
    m_options = options;

    TrackParser parser;
    if (!parser.parse(options.trackFile)) return fail(parser.errorString());

    m_track = std::make_unique<GpsTrack>();
    m_track->load(parser.data());
    m_track->trim(options.trackStartSec, options.trackEndSec);
    if (m_track->size() < 2)
        return fail(QString("Track has too few fixes after trimming: %1").arg(options.trackFile));

    m_gps = std::make_unique<TrackGpsStream>(m_track.get());
    m_controller = std::make_unique<PlaybackController>(&m_estimator);
    m_controller->setGpsStream(m_gps.get());
    m_controller->setVideoGpsOffsetMs(options.videoGpsOffsetMs);

    connect(m_gps.get(), &GpsStreamProvider::fixEmitted, this, [this](const GpsFix& fix) {
        m_estimator.update(fix);
    });

    if (options.hasVideo()) {
        MediaProbe probe;
        if (!probe.probe(options.videoFile)) return fail(probe.errorString());
        m_videoInfo = probe.info();
        if (!m_videoInfo.isSpherical)
            qCInfo(lcSession) << "Video has no spherical metadata, replaying as flat video";

        m_video = std::make_unique<DecodedVideoStream>();
        m_controller->setVideoStream(m_video.get());
        if (!m_video->open(options.videoFile)) return fail(m_video->errorString());
    }

    m_controller->initializeTimeline();
    if (!m_controller->timeline().isInitialized())
        return fail("Track has no valid time range");

    qCInfo(lcSession) << "Session opened:" << m_track->size() << "fixes from"
                      << TimeUtil::gpsTimeToUtcStr(m_track->startTime()) << "to"
                      << TimeUtil::gpsTimeToUtcStr(m_track->endTime())
                      << (m_video ? "with video" : "GPS only");
    emit opened();
    return true;
}

void ReplaySession::close() {
    if (!m_controller && !m_track) return;

    if (m_controller) m_controller->stop();
    m_controller.reset();
    m_video.reset();
    m_gps.reset();
    m_track.reset();
    m_estimator.reset();
    m_videoInfo = MediaInfo{};

    qCInfo(lcSession) << "Session closed";
    emit closed();
}

void ReplaySession::onSleep() {
    if (m_controller) m_controller->onSleep();
}

void ReplaySession::onWake() {
    if (m_controller) m_controller->onWake();
}

#include "CompletionTracker.h"
#include "MotionEstimator.h"
#include "Logging.h"

CompletionTracker::CompletionTracker(MotionEstimator* estimator, QObject* parent)
    : QObject(parent), m_estimator(estimator) {}

CompletionTracker::~CompletionTracker() = default;

void CompletionTracker::onGpsStarted() {
    qCInfo(lcCompletion) << "GPS playback started";
    m_hasStarted = true;
    m_gpsCompleted = false;
    if (m_estimator) m_estimator->unfreeze();
}

void CompletionTracker::onGpsCompleted() {
    qCInfo(lcCompletion) << "GPS playback completed, videoCompleted =" << m_videoCompleted
                         << "hasVideo =" << m_hasVideo;
    m_gpsCompleted = true;
    // No more fixes: extrapolating from the last one would run away
    if (m_estimator) m_estimator->freeze();
    checkReadyToRestart();
}

void CompletionTracker::onVideoStarted() {
    qCInfo(lcCompletion) << "Video playback started";
    m_videoCompleted = false;
}

void CompletionTracker::onVideoCompleted() {
    qCInfo(lcCompletion) << "Video playback completed, gpsCompleted =" << m_gpsCompleted;
    m_videoCompleted = true;
    checkReadyToRestart();
}

bool CompletionTracker::isReadyToRestart() const {
    if (!m_hasStarted) return false;
    return m_gpsCompleted && (m_videoCompleted || !m_hasVideo);
}

void CompletionTracker::checkReadyToRestart() {
    if (!isReadyToRestart()) return;
    qCInfo(lcCompletion) << "All streams completed - ready to restart";
    emit readyToRestart();
}

void CompletionTracker::prepareForRestart() {
    qCDebug(lcCompletion) << "Preparing for restart";
    m_gpsCompleted = false;
    m_videoCompleted = false;
}

void CompletionTracker::reset() {
    qCDebug(lcCompletion) << "Completion tracker reset";
    m_gpsCompleted = false;
    m_videoCompleted = false;
    m_hasStarted = false;
}

#include "MotionEstimator.h"
#include "Logging.h"
#include <cmath>

namespace {
constexpr double EarthRadiusMeters = 6371000.0;
constexpr double DegToRad = 3.14159265358979323846 / 180.0;
}

QVector3D MotionEstimator::gpsToEnu(const GpsFix& fix) const {
    if (!m_origin) return QVector3D();

    double originLat = m_origin->latitude * DegToRad;
    double dLat = fix.latitude * DegToRad - originLat;
    double dLon = (fix.longitude - m_origin->longitude) * DegToRad;

    double north = dLat * EarthRadiusMeters;
    double east = dLon * EarthRadiusMeters * std::cos(originLat);
    double up = fix.altitude - m_origin->altitude;
    return QVector3D(static_cast<float>(east), static_cast<float>(up), static_cast<float>(north));
}

void MotionEstimator::update(const GpsFix& fix) {
    const QVector3D vNew(static_cast<float>(fix.velE), static_cast<float>(fix.climb),
                         static_cast<float>(fix.velN));

    if (!m_lastUpdate) {
        // First fix sets the origin
        m_origin = fix;
        m_position = QVector3D();
        m_velocity = vNew;
        m_acceleration = QVector3D();
        m_positionDelta = QVector3D();
        m_lastUpdate = fix;
        return;
    }

    float dt = static_cast<float>(fix.millis - m_lastUpdate->millis) * 1e-3f;
    if (dt <= 0.0f) {
        // Duplicate or rewound fix (seek): restart integration from here
        m_velocity = vNew;
        m_lastUpdate = fix;
        return;
    }

    QVector3D aRaw = (vNew - m_velocity) / dt;
    m_acceleration = m_acceleration * (1.0f - Alpha) + aRaw * Alpha;

    const QVector3D measured = gpsToEnu(fix);
    const QVector3D predicted = m_position + m_velocity * dt + m_acceleration * (0.5f * dt * dt);

    m_position = predicted * (1.0f - Alpha) + measured * Alpha;
    m_velocity = vNew;
    m_positionDelta = m_position - measured;
    m_lastUpdate = fix;
}

QVector3D MotionEstimator::predictDelta(qint64 queryTimeMs) const {
    if (!m_lastUpdate) return QVector3D();
    if (m_frozen) return m_positionDelta;

    float dt = static_cast<float>(queryTimeMs - m_lastUpdate->millis) * 1e-3f;
    if (dt < 0.0f) dt = 0.0f;
    return m_positionDelta + m_velocity * dt + m_acceleration * (0.5f * dt * dt);
}

void MotionEstimator::freeze() {
    if (!m_frozen) qCDebug(lcMotion) << "Motion estimator frozen";
    m_frozen = true;
}

void MotionEstimator::unfreeze() {
    if (m_frozen) qCDebug(lcMotion) << "Motion estimator unfrozen";
    m_frozen = false;
}

void MotionEstimator::reset() {
    m_position = QVector3D();
    m_velocity = QVector3D();
    m_acceleration = QVector3D();
    m_positionDelta = QVector3D();
    m_origin.reset();
    m_lastUpdate.reset();
}

void MotionEstimator::softReset() {
    m_positionDelta = QVector3D();
}

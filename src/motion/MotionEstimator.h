#pragma once

#include <QVector3D>
#include <optional>
#include "GpsFix.h"

// Dead-reckoning between GPS fixes with a constant-acceleration model and a
// complementary position filter. Vectors are ENU meters relative to the
// first fix (x = east, y = up, z = north).
//
// While frozen the estimator stops extrapolating: predictDelta() returns the
// last filtered offset without advancing it in time. The replay freezes it
// whenever no fixes are flowing (paused, seeking, before or after the track).
class MotionEstimator {
public:
    MotionEstimator() = default;

    void update(const GpsFix& fix);
    QVector3D predictDelta(qint64 queryTimeMs) const;

    void freeze();
    void unfreeze();
    bool isFrozen() const { return m_frozen; }

    // Drops all filter state, origin included
    void reset();
    // Keeps the filter state, drops the cached position correction
    void softReset();

    bool hasFix() const { return m_lastUpdate.has_value(); }
    const QVector3D& position() const { return m_position; }
    const QVector3D& velocity() const { return m_velocity; }
    const QVector3D& acceleration() const { return m_acceleration; }

private:
    QVector3D gpsToEnu(const GpsFix& fix) const;

    static constexpr float Alpha = 0.1f;

    QVector3D m_position;
    QVector3D m_velocity;
    QVector3D m_acceleration;
    QVector3D m_positionDelta;
    std::optional<GpsFix> m_origin;
    std::optional<GpsFix> m_lastUpdate;
    bool m_frozen = false;
};

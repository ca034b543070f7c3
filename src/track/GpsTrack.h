#pragma once

#include <QObject>
#include <vector>
#include "GpsFix.h"

// Time-ordered recorded GPS track
class GpsTrack : public QObject {
    Q_OBJECT
public:
    explicit GpsTrack(QObject* parent = nullptr);
    ~GpsTrack();

    void load(const GpsTrackData& data);
    void clear();

    // Keep only fixes within [startSec, endSec] of the first fix.
    // A bound of 0 (or less) leaves that side untrimmed.
    void trim(double startSec, double endSec);

    GpsFix fixAtTime(qint64 gpsTimeMs) const;
    int indexAtTime(qint64 gpsTimeMs) const;

    qint64 startTime() const;
    qint64 endTime() const;
    qint64 duration() const;
    bool isEmpty() const { return m_fixes.empty(); }
    int size() const { return static_cast<int>(m_fixes.size()); }

    const GpsFix& at(int index) const { return m_fixes[index]; }
    const std::vector<GpsFix>& fixes() const { return m_fixes; }
    const GpsTrackData& data() const { return m_data; }

private:
    GpsFix interpolate(const GpsFix& a, const GpsFix& b, double t) const;

    std::vector<GpsFix> m_fixes;
    GpsTrackData m_data;
};

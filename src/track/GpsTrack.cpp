#include "GpsTrack.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>

GpsTrack::GpsTrack(QObject* parent) : QObject(parent) {}
GpsTrack::~GpsTrack() = default;

void GpsTrack::load(const GpsTrackData& data) {
    m_data = data;
    m_fixes = data.fixes;

    std::stable_sort(m_fixes.begin(), m_fixes.end(),
        [](const GpsFix& a, const GpsFix& b) { return a.millis < b.millis; });
}

void GpsTrack::clear() {
    m_fixes.clear();
    m_data = GpsTrackData{};
}

void GpsTrack::trim(double startSec, double endSec) {
    if (m_fixes.empty()) return;
    if (startSec <= 0.0 && endSec <= 0.0) return;

    const qint64 origin = m_fixes.front().millis;
    const qint64 lo = startSec > 0.0 ? origin + static_cast<qint64>(startSec * 1000.0) : origin;
    const qint64 hi = endSec > 0.0 ? origin + static_cast<qint64>(endSec * 1000.0)
                                   : m_fixes.back().millis;

    auto out = std::remove_if(m_fixes.begin(), m_fixes.end(),
        [lo, hi](const GpsFix& f) { return f.millis < lo || f.millis > hi; });
    size_t removed = static_cast<size_t>(std::distance(out, m_fixes.end()));
    m_fixes.erase(out, m_fixes.end());

    qCInfo(lcTrack) << "Trimmed track to" << startSec << "-" << endSec << "s,"
                    << removed << "fixes removed," << m_fixes.size() << "remain";
}

qint64 GpsTrack::startTime() const {
    return m_fixes.empty() ? 0 : m_fixes.front().millis;
}

qint64 GpsTrack::endTime() const {
    return m_fixes.empty() ? 0 : m_fixes.back().millis;
}

qint64 GpsTrack::duration() const {
    return endTime() - startTime();
}

int GpsTrack::indexAtTime(qint64 gpsTimeMs) const {
    if (m_fixes.empty()) return 0;

    // Last fix at or before the requested time
    auto it = std::upper_bound(m_fixes.begin(), m_fixes.end(), gpsTimeMs,
        [](qint64 t, const GpsFix& f) { return t < f.millis; });
    if (it == m_fixes.begin()) return 0;
    return static_cast<int>(std::distance(m_fixes.begin(), it)) - 1;
}

GpsFix GpsTrack::fixAtTime(qint64 gpsTimeMs) const {
    if (m_fixes.empty()) return GpsFix{};
    if (gpsTimeMs <= m_fixes.front().millis) return m_fixes.front();
    if (gpsTimeMs >= m_fixes.back().millis) return m_fixes.back();

    int i = indexAtTime(gpsTimeMs);
    const auto& a = m_fixes[i];
    const auto& b = m_fixes[i + 1];

    qint64 range = b.millis - a.millis;
    if (range <= 0) return a;

    double t = static_cast<double>(gpsTimeMs - a.millis) / static_cast<double>(range);
    return interpolate(a, b, t);
}

GpsFix GpsTrack::interpolate(const GpsFix& a, const GpsFix& b, double t) const {
    GpsFix r;
    r.millis = a.millis + static_cast<qint64>(std::llround(t * static_cast<double>(b.millis - a.millis)));
    r.latitude = a.latitude + t * (b.latitude - a.latitude);
    r.longitude = a.longitude + t * (b.longitude - a.longitude);
    r.altitude = a.altitude + t * (b.altitude - a.altitude);
    r.climb = a.climb + t * (b.climb - a.climb);
    r.velN = a.velN + t * (b.velN - a.velN);
    r.velE = a.velE + t * (b.velE - a.velE);
    return r;
}

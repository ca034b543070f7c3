#pragma once

#include <QtGlobal>
#include <QMetaType>
#include <QString>
#include <cmath>
#include <vector>

struct GpsFix {
    qint64 millis = 0;            // GPS time (ms since Unix epoch)
    double latitude = 0.0;        // degrees
    double longitude = 0.0;       // degrees
    double altitude = 0.0;        // meters above mean sea level
    double climb = 0.0;           // m/s, positive up
    double velN = 0.0;            // m/s
    double velE = 0.0;            // m/s

    double groundSpeed() const { return std::hypot(velN, velE); }
};

Q_DECLARE_METATYPE(GpsFix)

struct GpsTrackData {
    QString sourcePath;
    std::vector<GpsFix> fixes;

    // Bounding box
    double minLat = 90.0, maxLat = -90.0;
    double minLon = 180.0, maxLon = -180.0;

    void updateBounds() {
        for (const auto& f : fixes) {
            if (f.latitude < minLat) minLat = f.latitude;
            if (f.latitude > maxLat) maxLat = f.latitude;
            if (f.longitude < minLon) minLon = f.longitude;
            if (f.longitude > maxLon) maxLon = f.longitude;
        }
    }
};

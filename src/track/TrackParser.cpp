#include "TrackParser.h"
#include "TimeUtil.h"
#include "Logging.h"
#include <QFile>
#include <QTextStream>
#include <cmath>
#include <limits>

namespace {

// Header aliases for files written before the FlySight column names were adopted
const QHash<QString, QString>& columnAliases() {
    static const QHash<QString, QString> aliases = {
        {"timeMillis", "millis"},
        {"latitude", "lat"},
        {"longitude", "lon"},
        {"altitude_gps", "hMSL"},
    };
    return aliases;
}

} // namespace

TrackParser::TrackParser(QObject* parent) : QObject(parent) {}
TrackParser::~TrackParser() = default;

bool TrackParser::parse(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        m_error = QString("Cannot read track: %1").arg(filePath);
        qCWarning(lcTrack) << m_error;
        emit error(m_error);
        return false;
    }

    QTextStream stream(&file);
    bool ok = parse(stream);
    m_data.sourcePath = filePath;
    if (ok) {
        qCInfo(lcTrack) << "Loaded" << m_data.fixes.size() << "GPS fixes from" << filePath;
    }
    return ok;
}

bool TrackParser::parse(QTextStream& stream) {
    m_data = GpsTrackData{};
    m_columns.clear();
    m_skippedRows = 0;
    m_error.clear();

    if (stream.atEnd()) {
        m_error = "Track file is empty";
        emit error(m_error);
        return false;
    }
    parseHeader(stream.readLine());

    const bool hasSensorColumn = column("sensor") >= 0;
    if (column("lat") < 0 || column("lon") < 0
        || (column("time") < 0 && column("millis") < 0)) {
        m_error = "Track header has no time/lat/lon columns";
        emit error(m_error);
        return false;
    }

    qint64 lastGpsMillis = -1;
    double lastAltitude = 0.0;

    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        if (line.trimmed().isEmpty()) continue;
        const QStringList row = line.split(',');

        int sensorIdx = column("sensor");
        bool baselineRow = hasSensorColumn && sensorIdx < row.size();
        if (baselineRow && row[sensorIdx].trimmed() != "gps") {
            continue;  // baro, imu, ...
        }

        GpsFix fix;
        if (baselineRow) {
            double millis = columnDouble(row, "millis");
            if (std::isnan(millis) || millis <= 0) {
                ++m_skippedRows;
                continue;
            }
            fix.millis = static_cast<qint64>(millis);
        } else {
            int timeIdx = column("time");
            fix.millis = timeIdx >= 0 && timeIdx < row.size()
                ? TimeUtil::parseIsoUtcMs(row[timeIdx]) : -1;
            if (fix.millis <= 0) {
                ++m_skippedRows;  // units row or corrupt line
                continue;
            }
        }

        fix.latitude = columnDouble(row, "lat");
        fix.longitude = columnDouble(row, "lon");
        if (std::isnan(fix.latitude) || std::isnan(fix.longitude)) {
            ++m_skippedRows;
            continue;
        }

        fix.altitude = columnDouble(row, "hMSL");
        fix.velN = columnDouble(row, "velN");
        fix.velE = columnDouble(row, "velE");
        if (std::isnan(fix.velN)) fix.velN = 0.0;
        if (std::isnan(fix.velE)) fix.velE = 0.0;

        double velD = columnDouble(row, "velD");
        if (!std::isnan(velD)) {
            fix.climb = -velD;
        } else if (lastGpsMillis > 0 && fix.millis > lastGpsMillis && !std::isnan(fix.altitude)) {
            // No vertical speed column: differentiate altitude
            double dt = (fix.millis - lastGpsMillis) * 1e-3;
            fix.climb = (fix.altitude - lastAltitude) / dt;
        }
        if (std::isnan(fix.altitude)) fix.altitude = lastAltitude;

        lastGpsMillis = fix.millis;
        lastAltitude = fix.altitude;
        m_data.fixes.push_back(fix);
    }

    if (m_data.fixes.empty()) {
        m_error = "Track contains no GPS fixes";
        emit error(m_error);
        return false;
    }

    m_data.updateBounds();
    emit parsed(m_data);
    return true;
}

void TrackParser::parseHeader(const QString& line) {
    const QStringList names = line.split(',');
    for (int i = 0; i < names.size(); ++i) {
        QString name = names[i].trimmed();
        m_columns.insert(name, i);
        auto alias = columnAliases().constFind(name);
        if (alias != columnAliases().constEnd() && !m_columns.contains(alias.value())) {
            m_columns.insert(alias.value(), i);
        }
    }
}

int TrackParser::column(const QString& name) const {
    return m_columns.value(name, -1);
}

double TrackParser::columnDouble(const QStringList& row, const QString& name) const {
    int idx = column(name);
    if (idx < 0 || idx >= row.size()) return std::numeric_limits<double>::quiet_NaN();
    bool ok = false;
    double value = row[idx].trimmed().toDouble(&ok);
    return ok ? value : std::numeric_limits<double>::quiet_NaN();
}

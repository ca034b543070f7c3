#pragma once

#include <QString>
#include <QDateTime>
#include <QTimeZone>
#include <QtGlobal>

namespace TimeUtil {

// Parse a FlySight / ISO-8601 UTC time ("2019-04-20T20:00:00.40Z").
// Returns -1 if the text is not a valid timestamp.
inline qint64 parseIsoUtcMs(const QString& text) {
    const QString trimmed = text.trimmed();
    QDateTime dt = QDateTime::fromString(trimmed, Qt::ISODateWithMs);
    if (!dt.isValid()) return -1;

    // No zone designator: the recorder writes UTC, not local time
    bool hasZone = trimmed.endsWith('Z') || trimmed.indexOf('+', 10) > 0
        || trimmed.indexOf('-', 10) > 0;
    if (!hasZone) {
        dt = QDateTime(dt.date(), dt.time(), QTimeZone::utc());
    }
    return dt.toMSecsSinceEpoch();
}

inline QString msToHMS(qint64 totalMs) {
    bool negative = totalMs < 0;
    qint64 ms = negative ? -totalMs : totalMs;
    int hours = static_cast<int>(ms / 3600000);
    int minutes = static_cast<int>((ms % 3600000) / 60000);
    int seconds = static_cast<int>((ms % 60000) / 1000);
    int millis = static_cast<int>(ms % 1000);

    QString sign = negative ? QStringLiteral("-") : QString();
    if (hours > 0) {
        return QString("%1%2:%3:%4.%5")
            .arg(sign)
            .arg(hours)
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'))
            .arg(millis, 3, 10, QChar('0'));
    }
    return QString("%1%2:%3.%4")
        .arg(sign)
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

// UTC wall-clock string for log lines about absolute GPS times
inline QString gpsTimeToUtcStr(qint64 gpsTimeMs) {
    return QDateTime::fromMSecsSinceEpoch(gpsTimeMs, QTimeZone::utc())
        .toString("HH:mm:ss.zzz");
}

} // namespace TimeUtil

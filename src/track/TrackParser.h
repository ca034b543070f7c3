#pragma once

#include <QObject>
#include <QString>
#include <QHash>
#include <QStringList>
#include "GpsFix.h"

class QTextStream;

// Reads FlySight TRACK.CSV and BASEline CSV recordings
class TrackParser : public QObject {
    Q_OBJECT
public:
    explicit TrackParser(QObject* parent = nullptr);
    ~TrackParser();

    bool parse(const QString& filePath);
    bool parse(QTextStream& stream);

    const GpsTrackData& data() const { return m_data; }
    int skippedRows() const { return m_skippedRows; }
    QString errorString() const { return m_error; }

signals:
    void parsed(const GpsTrackData& data);
    void error(const QString& message);

private:
    void parseHeader(const QString& line);
    int column(const QString& name) const;
    double columnDouble(const QStringList& row, const QString& name) const;

    GpsTrackData m_data;
    QHash<QString, int> m_columns;
    int m_skippedRows = 0;
    QString m_error;
};

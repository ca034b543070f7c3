#pragma once

#include <QObject>
#include <QString>

struct MediaInfo {
    QString filePath;
    QString containerFormat;
    qint64 durationMs = 0;
    int videoWidth = 0;
    int videoHeight = 0;
    double videoFps = 0.0;
    QString videoCodec;
    bool hasVideo = false;

    // Spherical (360) video metadata
    bool isSpherical = false;
    QString projection;

    // creation_time as ms since epoch, 0 if absent
    qint64 creationTimeMs = 0;
};

// Validates a replay video and reads the properties the replay needs
class MediaProbe : public QObject {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe();

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    MediaInfo m_info;
    QString m_error;
};

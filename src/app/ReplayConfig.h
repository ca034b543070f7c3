#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>

struct ReplayOptions {
    QString trackFile;
    QString videoFile;          // empty: GPS-only replay
    qint64 videoGpsOffsetMs = 0;
    double trackStartSec = 0.0; // 0 = from the first fix
    double trackEndSec = 0.0;   // 0 = to the last fix

    bool hasVideo() const { return !videoFile.isEmpty(); }
};

// Reads and writes replay configuration files (JSON). Paths are stored
// relative to the configuration file when possible.
class ReplayConfig : public QObject {
    Q_OBJECT
public:
    explicit ReplayConfig(QObject* parent = nullptr);
    ~ReplayConfig();

    bool load(const QString& filePath, ReplayOptions& options);
    bool save(const QString& filePath, const ReplayOptions& options);

    static QJsonObject toJson(const ReplayOptions& options, const QString& configDir);
    bool fromJson(const QJsonObject& root, const QString& configDir, ReplayOptions& options);

    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message);

    static QString makeRelativePath(const QString& absolutePath, const QString& configDir);
    static QString resolvePath(const QString& savedPath, const QString& configDir);

    QString m_error;
};

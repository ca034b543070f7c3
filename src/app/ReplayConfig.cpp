#include "ReplayConfig.h"
#include "AppConstants.h"
#include "Logging.h"

#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QJsonValue>

ReplayConfig::ReplayConfig(QObject* parent) : QObject(parent) {}
ReplayConfig::~ReplayConfig() = default;

bool ReplayConfig::fail(const QString& message) {
    m_error = message;
    qCWarning(lcConfig) << message;
    return false;
}

bool ReplayConfig::load(const QString& filePath, ReplayOptions& options) {
    m_error.clear();

    QFileInfo fileInfo(filePath);
    if (!fileInfo.exists())
        return fail(QString("File not found: %1").arg(filePath));

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly))
        return fail(QString("Cannot read: %1").arg(filePath));

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError)
        return fail(QString("Invalid replay config: %1").arg(parseError.errorString()));
    if (!doc.isObject())
        return fail("Invalid replay config format");

    if (!fromJson(doc.object(), fileInfo.absolutePath(), options)) return false;

    qCInfo(lcConfig) << "Loaded" << filePath << "track" << options.trackFile
                     << "video" << (options.hasVideo() ? options.videoFile : QString("none"))
                     << "offset" << options.videoGpsOffsetMs << "ms";
    return true;
}

bool ReplayConfig::save(const QString& filePath, const ReplayOptions& options) {
    m_error.clear();

    QFileInfo fileInfo(filePath);
    QJsonObject root = toJson(options, fileInfo.absolutePath());

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly))
        return fail(QString("Cannot write to: %1").arg(filePath));

    QJsonDocument doc(root);
    file.write(doc.toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

QJsonObject ReplayConfig::toJson(const ReplayOptions& options, const QString& configDir) {
    QJsonObject root;
    root["version"] = AppConstants::ConfigVersion;
    root["track"] = makeRelativePath(options.trackFile, configDir);
    if (options.trackStartSec > 0) root["trackStartSec"] = options.trackStartSec;
    if (options.trackEndSec > 0) root["trackEndSec"] = options.trackEndSec;
    if (options.hasVideo()) {
        root["video"] = makeRelativePath(options.videoFile, configDir);
        root["videoGpsOffsetMs"] = static_cast<double>(options.videoGpsOffsetMs);
    }
    return root;
}

bool ReplayConfig::fromJson(const QJsonObject& root, const QString& configDir, ReplayOptions& options) {
    int version = root["version"].toInt(0);
    if (version < 1 || version > AppConstants::ConfigVersion)
        return fail(QString("Unsupported replay config version %1").arg(version));

    ReplayOptions loaded;
    loaded.trackFile = resolvePath(root["track"].toString(), configDir);
    if (loaded.trackFile.isEmpty())
        return fail("Replay config has no track");

    loaded.videoFile = resolvePath(root["video"].toString(), configDir);
    loaded.videoGpsOffsetMs = static_cast<qint64>(root["videoGpsOffsetMs"].toDouble(0.0));
    loaded.trackStartSec = root["trackStartSec"].toDouble(0.0);
    loaded.trackEndSec = root["trackEndSec"].toDouble(0.0);

    if (loaded.trackStartSec < 0 || loaded.trackEndSec < 0)
        return fail("Track trim bounds must not be negative");
    if (loaded.trackEndSec > 0 && loaded.trackEndSec <= loaded.trackStartSec)
        return fail("trackEndSec must be greater than trackStartSec");

    options = loaded;
    return true;
}

QString ReplayConfig::makeRelativePath(const QString& absolutePath, const QString& configDir) {
    if (absolutePath.isEmpty()) return QString();
    return QDir(configDir).relativeFilePath(absolutePath);
}

QString ReplayConfig::resolvePath(const QString& savedPath, const QString& configDir) {
    if (savedPath.isEmpty()) return QString();
    if (QDir::isAbsolutePath(savedPath)) return QDir::cleanPath(savedPath);
    return QDir::cleanPath(QDir(configDir).absoluteFilePath(savedPath));
}

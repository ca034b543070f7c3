#include <cassert>
#include <cstdio>
#include <QDir>
#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>
#include "app/ReplayConfig.h"
#include "app/AppConstants.h"

static QString writeConfig(const QTemporaryDir& dir, const QString& name, const QByteArray& json) {
    const QString path = dir.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return QString();
    file.write(json);
    return path;
}

void test_load_resolves_relative_paths() {
    QTemporaryDir dir;
    assert(dir.isValid());
    const QString path = writeConfig(dir, "replay.json", R"({
        "version": 1,
        "track": "jumps/TRACK.CSV",
        "video": "/media/360/jump.mp4",
        "videoGpsOffsetMs": -1500,
        "trackStartSec": 12.5,
        "trackEndSec": 90
    })");

    ReplayConfig config;
    ReplayOptions options;
    assert(config.load(path, options));
    assert(options.trackFile == QDir::cleanPath(dir.path() + "/jumps/TRACK.CSV"));
    assert(options.videoFile == "/media/360/jump.mp4");
    assert(options.hasVideo());
    assert(options.videoGpsOffsetMs == -1500);
    assert(options.trackStartSec == 12.5);
    assert(options.trackEndSec == 90.0);
    printf("PASS: test_load_resolves_relative_paths\n");
}

void test_defaults_for_gps_only() {
    QJsonObject root;
    root["version"] = 1;
    root["track"] = "TRACK.CSV";

    ReplayConfig config;
    ReplayOptions options;
    assert(config.fromJson(root, "/data", options));
    assert(options.trackFile == "/data/TRACK.CSV");
    assert(!options.hasVideo());
    assert(options.videoGpsOffsetMs == 0);
    assert(options.trackStartSec == 0.0);
    assert(options.trackEndSec == 0.0);
    printf("PASS: test_defaults_for_gps_only\n");
}

void test_rejects_invalid_configs() {
    ReplayConfig config;
    ReplayOptions options;
    options.trackFile = "untouched";

    QJsonObject noVersion;
    noVersion["track"] = "TRACK.CSV";
    assert(!config.fromJson(noVersion, "/data", options));
    assert(config.errorString().startsWith("Unsupported replay config version"));

    QJsonObject future;
    future["version"] = AppConstants::ConfigVersion + 1;
    future["track"] = "TRACK.CSV";
    assert(!config.fromJson(future, "/data", options));

    QJsonObject noTrack;
    noTrack["version"] = 1;
    assert(!config.fromJson(noTrack, "/data", options));
    assert(config.errorString() == "Replay config has no track");

    QJsonObject badTrim;
    badTrim["version"] = 1;
    badTrim["track"] = "TRACK.CSV";
    badTrim["trackStartSec"] = 30;
    badTrim["trackEndSec"] = 10;
    assert(!config.fromJson(badTrim, "/data", options));
    assert(config.errorString() == "trackEndSec must be greater than trackStartSec");

    assert(options.trackFile == "untouched");
    printf("PASS: test_rejects_invalid_configs\n");
}

void test_load_errors() {
    QTemporaryDir dir;
    ReplayConfig config;
    ReplayOptions options;

    assert(!config.load(dir.filePath("missing.json"), options));
    assert(config.errorString().startsWith("File not found"));

    const QString broken = writeConfig(dir, "broken.json", "{ \"version\": 1, ");
    assert(!config.load(broken, options));
    assert(config.errorString().startsWith("Invalid replay config"));

    const QString array = writeConfig(dir, "array.json", "[1, 2, 3]");
    assert(!config.load(array, options));
    assert(config.errorString() == "Invalid replay config format");
    printf("PASS: test_load_errors\n");
}

void test_save_writes_relative_paths() {
    QTemporaryDir dir;
    ReplayOptions options;
    options.trackFile = dir.filePath("tracks/TRACK.CSV");
    options.videoFile = dir.filePath("video.mp4");
    options.videoGpsOffsetMs = 250;
    options.trackEndSec = 60.0;

    QJsonObject json = ReplayConfig::toJson(options, dir.path());
    assert(json["version"].toInt() == AppConstants::ConfigVersion);
    assert(json["track"].toString() == "tracks/TRACK.CSV");
    assert(json["video"].toString() == "video.mp4");
    assert(!json.contains("trackStartSec"));

    ReplayConfig config;
    const QString path = dir.filePath("saved.json");
    assert(config.save(path, options));

    ReplayOptions loaded;
    assert(config.load(path, loaded));
    assert(loaded.trackFile == QDir::cleanPath(options.trackFile));
    assert(loaded.videoFile == QDir::cleanPath(options.videoFile));
    assert(loaded.videoGpsOffsetMs == 250);
    assert(loaded.trackEndSec == 60.0);
    printf("PASS: test_save_writes_relative_paths\n");
}

int main() {
    test_load_resolves_relative_paths();
    test_defaults_for_gps_only();
    test_rejects_invalid_configs();
    test_load_errors();
    test_save_writes_relative_paths();
    printf("All replay config tests passed.\n");
    return 0;
}

#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QList>
#include "TestUtil.h"
#include "replay/TrackGpsStream.h"
#include "track/GpsTrack.h"

// Six fixes, 100 ms apart: 1000 - 1500
static void loadTrack(GpsTrack& track) {
    GpsTrackData data;
    for (int i = 0; i < 6; ++i) {
        GpsFix f;
        f.millis = 1000 + i * 100;
        f.latitude = 52.0 + i * 0.0001;
        f.longitude = 13.0;
        f.altitude = 4000.0 - i;
        data.fixes.push_back(f);
    }
    track.load(data);
}

struct Recorder {
    QList<qint64> fixes;
    QList<StreamEvent> events;

    explicit Recorder(TrackGpsStream& stream) {
        QObject::connect(&stream, &GpsStreamProvider::fixEmitted,
                         [this](const GpsFix& f) { fixes << f.millis; });
        QObject::connect(&stream, &GpsStreamProvider::streamEvent,
                         [this](const StreamEvent& e) { events << e; });
    }

    int count(StreamEventType type) const {
        int n = 0;
        for (const auto& e : events)
            if (e.type == type) ++n;
        return n;
    }
};

void test_replays_all_fixes_in_order() {
    GpsTrack track;
    loadTrack(track);
    TrackGpsStream stream(&track);
    Recorder rec(stream);

    assert(stream.getTrackStartTime() == 1000);
    assert(stream.getTrackDuration() == 500);

    stream.start();
    // First fix is delivered before start() returns
    assert(rec.fixes == QList<qint64>({1000}));
    assert(rec.count(StreamEventType::Started) == 1);
    assert(stream.isStarted());

    waitMs(900);
    assert(rec.fixes == QList<qint64>({1000, 1100, 1200, 1300, 1400, 1500}));
    assert(rec.count(StreamEventType::Completed) == 1);
    assert(stream.isCompleted());
    assert(stream.getCurrentGpsTimeMs() == 1500);

    waitMs(100);
    assert(rec.count(StreamEventType::Completed) == 1);
    printf("PASS: test_replays_all_fixes_in_order\n");
}

void test_pause_holds_replay_clock() {
    GpsTrack track;
    loadTrack(track);
    TrackGpsStream stream(&track);
    Recorder rec(stream);

    stream.start();
    waitMs(150);
    stream.pause();
    assert(stream.isPaused());
    const int emitted = rec.fixes.size();
    assert(emitted >= 2 && emitted < 6);

    waitMs(400);
    assert(rec.fixes.size() == emitted);

    stream.resume();
    assert(!stream.isPaused());
    waitMs(700);
    assert(rec.fixes.size() == 6);
    assert(rec.count(StreamEventType::Completed) == 1);
    printf("PASS: test_pause_holds_replay_clock\n");
}

void test_seek_without_resume() {
    GpsTrack track;
    loadTrack(track);
    TrackGpsStream stream(&track);
    Recorder rec(stream);

    assert(stream.seek(1250, false));
    assert(rec.fixes == QList<qint64>({1250}));
    assert(rec.events.size() == 1);
    assert(rec.events[0].type == StreamEventType::SeekComplete);
    assert(rec.events[0].valueMs == 1250);
    assert(!stream.isStarted());
    assert(stream.getCurrentGpsTimeMs() == 1250);

    waitMs(300);
    assert(rec.fixes.size() == 1);

    // Targets outside the track are clamped
    assert(stream.seek(99999, false));
    assert(stream.getCurrentGpsTimeMs() == 1500);
    assert(stream.seek(0, false));
    assert(stream.getCurrentGpsTimeMs() == 1000);
    printf("PASS: test_seek_without_resume\n");
}

void test_seek_with_resume_continues_from_target() {
    GpsTrack track;
    loadTrack(track);
    TrackGpsStream stream(&track);
    Recorder rec(stream);

    assert(stream.seek(1350, true));
    assert(stream.isStarted());
    assert(rec.count(StreamEventType::SeekComplete) == 1);
    assert(rec.count(StreamEventType::Started) == 1);
    assert(stream.nextIndex() == 4);

    waitMs(500);
    assert(rec.fixes == QList<qint64>({1350, 1400, 1500}));
    assert(rec.count(StreamEventType::Completed) == 1);
    printf("PASS: test_seek_with_resume_continues_from_target\n");
}

void test_seek_while_playing_holds_position() {
    GpsTrack track;
    loadTrack(track);
    TrackGpsStream stream(&track);
    Recorder rec(stream);

    stream.start();
    assert(stream.seek(1200, false));
    assert(stream.isPaused());
    const int emitted = rec.fixes.size();
    waitMs(300);
    assert(rec.fixes.size() == emitted);

    stream.resume();
    waitMs(600);
    assert(rec.fixes.last() == 1500);
    printf("PASS: test_seek_while_playing_holds_position\n");
}

void test_delayed_start() {
    GpsTrack track;
    loadTrack(track);
    TrackGpsStream stream(&track);
    Recorder rec(stream);

    stream.startWithDelay(300);
    assert(stream.isStarted());
    assert(rec.count(StreamEventType::Started) == 1);
    waitMs(150);
    assert(rec.fixes.isEmpty());

    waitMs(400);
    assert(!rec.fixes.isEmpty());
    assert(rec.fixes.first() == 1000);
    printf("PASS: test_delayed_start\n");
}

void test_stop_resets() {
    GpsTrack track;
    loadTrack(track);
    TrackGpsStream stream(&track);
    Recorder rec(stream);

    stream.start();
    waitMs(150);
    stream.stop();
    assert(!stream.isStarted());
    assert(stream.getCurrentGpsTimeMs() == 1000);
    const int emitted = rec.fixes.size();

    waitMs(300);
    assert(rec.fixes.size() == emitted);
    assert(rec.count(StreamEventType::Completed) == 0);
    printf("PASS: test_stop_resets\n");
}

void test_empty_track() {
    GpsTrack track;
    TrackGpsStream stream(&track);
    Recorder rec(stream);

    stream.start();
    assert(!stream.isStarted());
    assert(!stream.seek(1000, true));
    assert(rec.events.isEmpty());
    assert(rec.fixes.isEmpty());
    assert(stream.getTrackDuration() == 0);
    printf("PASS: test_empty_track\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_replays_all_fixes_in_order();
    test_pause_holds_replay_clock();
    test_seek_without_resume();
    test_seek_with_resume_continues_from_target();
    test_seek_while_playing_holds_position();
    test_delayed_start();
    test_stop_resets();
    test_empty_track();
    printf("All track GPS stream tests passed.\n");
    return 0;
}

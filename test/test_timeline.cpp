#include <cassert>
#include <cstdio>
#include "replay/Timeline.h"

// gpsStart=1000, gpsEnd=5000, 3 s of video, video leads GPS by 500 ms
static Timeline videoFirstTimeline() {
    Timeline t;
    t.initialize(1000, 5000, 3000, 500);
    return t;
}

void test_video_first_bounds() {
    Timeline t = videoFirstTimeline();
    assert(t.isInitialized());
    assert(t.hasVideo());
    assert(t.videoStartGpsMs() == 500);
    assert(t.videoEndGpsMs() == 3500);
    assert(t.timelineStartMs() == 500);
    assert(t.timelineEndMs() == 5000);
    assert(t.videoStartsFirst());
    assert(!t.gpsStartsFirst());
    assert(t.getGpsStartDelayMs() == 500);
    assert(t.getVideoStartDelayMs() == 0);
    assert(t.getInitialVideoPositionMs() == 0);
    printf("PASS: test_video_first_bounds\n");
}

void test_gps_first_bounds() {
    Timeline t;
    t.initialize(1000, 5000, 3000, -1000);
    assert(t.videoStartGpsMs() == 2000);
    assert(t.videoEndGpsMs() == 5000);
    assert(t.timelineStartMs() == 1000);
    assert(t.gpsStartsFirst());
    assert(!t.videoStartsFirst());
    assert(t.getInitialVideoPositionMs() == 1000);
    assert(t.getGpsStartDelayMs() == 0);
    assert(t.getVideoStartDelayMs() == 1000);
    printf("PASS: test_gps_first_bounds\n");
}

void test_start_delays_complement() {
    const qint64 offsets[] = {-2500, -1000, -1, 0, 1, 500, 2000};
    for (qint64 offset : offsets) {
        Timeline t;
        t.initialize(1000, 5000, 3000, offset);
        const qint64 gpsDelay = t.getGpsStartDelayMs();
        const qint64 videoDelay = t.getVideoStartDelayMs();
        assert(gpsDelay == 0 || videoDelay == 0);
        assert(gpsDelay - videoDelay == offset);
        assert(t.videoStartsFirst() != t.gpsStartsFirst());
    }
    printf("PASS: test_start_delays_complement\n");
}

void test_conversion_round_trip() {
    Timeline t = videoFirstTimeline();
    for (qint64 gps = 500; gps <= 3500; gps += 250) {
        auto video = t.gpsTimeToVideoTime(gps);
        assert(video.has_value());
        assert(t.videoTimeToGpsTime(*video) == gps);
    }
    assert(*t.gpsTimeToVideoTime(1000) == 500);
    assert(t.videoTimeToGpsTime(0) == 500);
    printf("PASS: test_conversion_round_trip\n");
}

void test_video_bounds_tolerance() {
    Timeline t = videoFirstTimeline();
    // Slightly outside the clip is clamped onto it
    assert(*t.gpsTimeToVideoTime(400) == 0);
    assert(*t.gpsTimeToVideoTime(0) == 0);
    assert(*t.gpsTimeToVideoTime(3800) == 3000);
    assert(*t.gpsTimeToVideoTime(4000) == 3000);
    // Further out there is no video
    assert(!t.gpsTimeToVideoTime(-1).has_value());
    assert(!t.gpsTimeToVideoTime(4001).has_value());
    printf("PASS: test_video_bounds_tolerance\n");
}

void test_elapsed_conversion() {
    Timeline t = videoFirstTimeline();
    assert(t.elapsedToGpsTime(0) == 500);
    assert(t.gpsTimeToElapsed(1000) == 500);
    assert(t.gpsTimeToElapsed(t.elapsedToGpsTime(1234)) == 1234);
    assert(t.timelineDurationMs() == 4500);
    printf("PASS: test_elapsed_conversion\n");
}

void test_zones() {
    Timeline t = videoFirstTimeline();
    assert(t.zoneOf(500) == TimelineZone::BeforeGps);
    assert(t.zoneOf(999) == TimelineZone::BeforeGps);
    assert(t.zoneOf(1000) == TimelineZone::WithinGps);
    assert(t.zoneOf(5000) == TimelineZone::WithinGps);

    Timeline longVideo;
    longVideo.initialize(1000, 5000, 5000, -1000);
    assert(longVideo.timelineEndMs() == 7000);
    assert(longVideo.zoneOf(6000) == TimelineZone::AfterGps);
    printf("PASS: test_zones\n");
}

void test_seek_targets_clamp_into_track() {
    Timeline t = videoFirstTimeline();
    auto [gps, video] = t.calculateSeekTargets(200);
    assert(gps == 1000);
    assert(video.has_value() && *video == 500);

    auto [gpsEnd, videoEnd] = t.calculateSeekTargets(9000);
    assert(gpsEnd == 5000);
    assert(!videoEnd.has_value());
    printf("PASS: test_seek_targets_clamp_into_track\n");
}

void test_without_video() {
    Timeline t;
    t.initialize(1000, 5000, 0, 500);
    assert(t.isInitialized());
    assert(!t.hasVideo());
    assert(t.timelineStartMs() == 1000);
    assert(t.timelineEndMs() == 5000);
    assert(t.gpsStartsFirst());
    assert(!t.videoStartsFirst());
    assert(t.getGpsStartDelayMs() == 0);
    assert(t.getVideoStartDelayMs() == 0);
    assert(t.getInitialVideoPositionMs() == 0);
    assert(!t.gpsTimeToVideoTime(2000).has_value());
    assert(t.zoneOf(500) == TimelineZone::WithinGps);
    printf("PASS: test_without_video\n");
}

void test_invalid_bounds_leave_timeline_inert() {
    Timeline t;
    t.initialize(5000, 5000, 3000, 0);
    assert(!t.isInitialized());
    t.initialize(5000, 1000, 3000, 0);
    assert(!t.isInitialized());

    // A valid timeline is invalidated by bad bounds
    Timeline valid = videoFirstTimeline();
    valid.initialize(10, 5, 0, 0);
    assert(!valid.isInitialized());
    assert(!valid.hasVideo());
    printf("PASS: test_invalid_bounds_leave_timeline_inert\n");
}

void test_pause_and_reset() {
    Timeline t = videoFirstTimeline();
    assert(t.getCurrentGpsTimeMs() == 1000);

    t.updatePosition(2500);
    assert(*t.getCurrentVideoTimeMs() == 2000);
    assert(t.getElapsedMs() == 2000);

    t.onPause();
    assert(t.getPausedGpsTimeMs() == 2500);
    assert(*t.getPausedVideoTimeMs() == 2000);

    t.reset();
    assert(t.getCurrentGpsTimeMs() == 1000);
    assert(t.getPausedGpsTimeMs() == 0);
    assert(t.isInitialized());
    assert(t.timelineStartMs() == 500);

    t.clear();
    assert(!t.isInitialized());
    printf("PASS: test_pause_and_reset\n");
}

int main() {
    test_video_first_bounds();
    test_gps_first_bounds();
    test_start_delays_complement();
    test_conversion_round_trip();
    test_video_bounds_tolerance();
    test_elapsed_conversion();
    test_zones();
    test_seek_targets_clamp_into_track();
    test_without_video();
    test_invalid_bounds_leave_timeline_inert();
    test_pause_and_reset();
    printf("All timeline tests passed.\n");
    return 0;
}

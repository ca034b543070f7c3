#include <cassert>
#include <cstdio>
#include "replay/CompletionTracker.h"
#include "motion/MotionEstimator.h"

void test_ready_after_both_streams() {
    MotionEstimator estimator;
    CompletionTracker tracker(&estimator);
    tracker.setHasVideo(true);

    int readyCount = 0;
    QObject::connect(&tracker, &CompletionTracker::readyToRestart, [&]() { ++readyCount; });

    tracker.onGpsStarted();
    assert(!tracker.isReadyToRestart());

    tracker.onGpsCompleted();
    assert(!tracker.isReadyToRestart());
    assert(readyCount == 0);

    tracker.onVideoCompleted();
    assert(tracker.isReadyToRestart());
    assert(readyCount == 1);
    printf("PASS: test_ready_after_both_streams\n");
}

void test_gps_only_ready_on_gps_completion() {
    CompletionTracker tracker(nullptr);
    tracker.setHasVideo(false);

    int readyCount = 0;
    QObject::connect(&tracker, &CompletionTracker::readyToRestart, [&]() { ++readyCount; });

    tracker.onGpsStarted();
    tracker.onGpsCompleted();
    assert(tracker.isReadyToRestart());
    assert(readyCount == 1);
    printf("PASS: test_gps_only_ready_on_gps_completion\n");
}

void test_not_ready_before_start() {
    CompletionTracker tracker(nullptr);
    tracker.setHasVideo(true);
    tracker.onGpsCompleted();
    tracker.onVideoCompleted();
    assert(!tracker.hasStarted());
    assert(!tracker.isReadyToRestart());

    tracker.markStarted();
    assert(tracker.isReadyToRestart());
    printf("PASS: test_not_ready_before_start\n");
}

void test_readiness_is_stable() {
    CompletionTracker tracker(nullptr);
    tracker.setHasVideo(true);
    tracker.onGpsStarted();
    tracker.onVideoCompleted();
    tracker.onGpsCompleted();
    for (int i = 0; i < 3; ++i)
        assert(tracker.isReadyToRestart());
    printf("PASS: test_readiness_is_stable\n");
}

void test_prepare_for_restart_keeps_started() {
    CompletionTracker tracker(nullptr);
    tracker.setHasVideo(true);
    tracker.onGpsStarted();
    tracker.onGpsCompleted();
    tracker.onVideoCompleted();

    tracker.prepareForRestart();
    assert(!tracker.gpsCompleted());
    assert(!tracker.videoCompleted());
    assert(tracker.hasStarted());
    assert(!tracker.isReadyToRestart());

    tracker.reset();
    assert(!tracker.hasStarted());
    printf("PASS: test_prepare_for_restart_keeps_started\n");
}

void test_stream_start_clears_completion() {
    CompletionTracker tracker(nullptr);
    tracker.setHasVideo(true);
    tracker.onGpsStarted();
    tracker.onGpsCompleted();
    tracker.onVideoCompleted();

    tracker.onVideoStarted();
    assert(!tracker.videoCompleted());
    tracker.onGpsStarted();
    assert(!tracker.gpsCompleted());
    assert(!tracker.isReadyToRestart());
    printf("PASS: test_stream_start_clears_completion\n");
}

void test_estimator_frozen_between_gps_runs() {
    MotionEstimator estimator;
    CompletionTracker tracker(&estimator);
    assert(!estimator.isFrozen());

    tracker.onGpsStarted();
    assert(!estimator.isFrozen());

    tracker.onGpsCompleted();
    assert(estimator.isFrozen());

    tracker.onGpsStarted();
    assert(!estimator.isFrozen());
    printf("PASS: test_estimator_frozen_between_gps_runs\n");
}

int main() {
    test_ready_after_both_streams();
    test_gps_only_ready_on_gps_completion();
    test_not_ready_before_start();
    test_readiness_is_stable();
    test_prepare_for_restart_keeps_started();
    test_stream_start_clears_completion();
    test_estimator_frozen_between_gps_runs();
    printf("All completion tracker tests passed.\n");
    return 0;
}

#pragma once

#include <QtGlobal>

namespace AppConstants {
    inline constexpr const char* AppName = "FlightReplay";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "FlightReplay";

    inline constexpr int ConfigVersion = 1;

    // Video time may overshoot the clip by this much before a GPS time is
    // considered outside the video.
    inline constexpr qint64 VideoBoundsToleranceMs = 500;

    // Drift correction: seek the video only when it is off by more than
    // MaxVideoDriftMs and the previous correction is older than the cooldown.
    inline constexpr qint64 MaxVideoDriftMs = 500;
    inline constexpr qint64 DriftSeekCooldownMs = 1000;

    // Drift correction is suspended this long after a scheduled GPS start
    inline constexpr qint64 SyncHoldAfterGpsStartMs = 2000;

    // Tick intervals for the replay clocks
    inline constexpr int GpsTickIntervalMs = 10;
    inline constexpr int DefaultVideoTickIntervalMs = 33;
}

#include "Logging.h"

Q_LOGGING_CATEGORY(lcTimeline, "replay.timeline")
Q_LOGGING_CATEGORY(lcCompletion, "replay.completion")
Q_LOGGING_CATEGORY(lcPlayback, "replay.playback")
Q_LOGGING_CATEGORY(lcGpsStream, "replay.gps")
Q_LOGGING_CATEGORY(lcVideo, "replay.video")
Q_LOGGING_CATEGORY(lcTrack, "replay.track")
Q_LOGGING_CATEGORY(lcConfig, "replay.config")
Q_LOGGING_CATEGORY(lcSession, "replay.session")
Q_LOGGING_CATEGORY(lcMotion, "replay.motion")

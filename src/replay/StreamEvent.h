#pragma once

#include <QtGlobal>
#include <QMetaType>

enum class StreamSource {
    Gps,
    Video
};

enum class StreamEventType {
    Prepared,      // video only: valueMs carries the duration
    Started,
    SeekComplete,  // valueMs carries the position reached
    Completed
};

// Lifecycle notification from a stream to the playback controller.
// Delivered through queued connections so it is always handled on the
// controller's thread.
struct StreamEvent {
    StreamSource source = StreamSource::Gps;
    StreamEventType type = StreamEventType::Started;
    qint64 valueMs = 0;

    static StreamEvent gps(StreamEventType type, qint64 valueMs = 0) {
        return StreamEvent{StreamSource::Gps, type, valueMs};
    }
    static StreamEvent video(StreamEventType type, qint64 valueMs = 0) {
        return StreamEvent{StreamSource::Video, type, valueMs};
    }
};

Q_DECLARE_METATYPE(StreamEvent)

inline const char* toString(StreamSource source) {
    switch (source) {
    case StreamSource::Gps: return "gps";
    case StreamSource::Video: return "video";
    }
    return "?";
}

inline const char* toString(StreamEventType type) {
    switch (type) {
    case StreamEventType::Prepared: return "prepared";
    case StreamEventType::Started: return "started";
    case StreamEventType::SeekComplete: return "seek-complete";
    case StreamEventType::Completed: return "completed";
    }
    return "?";
}

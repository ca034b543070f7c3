#pragma once

#include <QObject>
#include <QImage>
#include <QString>
#include <memory>

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    qint64 durationMs = 0;
    QString codecName;
};

// Sequential FFmpeg video decoder producing RGB32 frames
class VideoDecoder : public QObject {
    Q_OBJECT
public:
    explicit VideoDecoder(QObject* parent = nullptr);
    ~VideoDecoder();

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_isOpen; }

    // Returns a null image at end of stream
    QImage decodeNextFrame();

    // Seeks to the keyframe before positionMs and decodes forward to it.
    // lastFrame() then holds the first frame at or after positionMs.
    bool seek(qint64 positionMs);

    qint64 currentTimeMs() const { return m_currentTimeMs; }
    bool atEnd() const { return m_atEnd; }
    const QImage& lastFrame() const { return m_lastFrame; }

    const VideoInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message);

    bool m_isOpen = false;
    bool m_atEnd = false;
    qint64 m_currentTimeMs = 0;
    QImage m_lastFrame;
    VideoInfo m_info;
    QString m_error;

    struct FFmpegContext;
    std::unique_ptr<FFmpegContext> m_ctx;
};

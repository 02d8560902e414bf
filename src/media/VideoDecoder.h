#pragma once

#include <QObject>
#include <QImage>
#include <QString>
#include <memory>

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    double duration = 0.0;  // seconds
    int64_t totalFrames = 0;
    QString codecName;
};

class VideoDecoder : public QObject {
    Q_OBJECT
public:
    explicit VideoDecoder(QObject* parent = nullptr);
    ~VideoDecoder();

    bool open(const QString& filePath);
    void close();
    bool isOpen() const { return m_isOpen; }

    // Next frame in decode order as RGB32, null at end of stream. pts is
    // relative to the first frame of the stream.
    QImage decodeNextFrame();
    bool seek(double seconds);
    double currentTime() const { return m_currentTime; }

    const VideoInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message);

    bool m_isOpen = false;
    double m_currentTime = 0.0;
    VideoInfo m_info;
    QString m_error;

#ifdef HAS_FFMPEG
    struct FFmpegContext;
    std::unique_ptr<FFmpegContext> m_ctx;
#endif
};

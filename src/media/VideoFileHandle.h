#pragma once

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <atomic>
#include <memory>
#include "MediaHandle.h"
#include "FrameQueue.h"
#include "VideoDecoder.h"

// Background decode thread that sequentially reads frames into a FrameQueue.
// Follows ffplay's architecture: sequential decode, seek only on request
// (bump the serial, seek to keyframe, resume sequential decode).
class DecodeThread : public QThread {
    Q_OBJECT
public:
    DecodeThread(VideoDecoder* decoder, FrameQueue* queue, QObject* parent = nullptr);

    void requestSeek(double seconds, int serial);
    void requestStop();
    bool isEof() const { return m_eof; }

signals:
    // Emitted once, after the first frame has been queued
    void firstFrameReady();

protected:
    void run() override;

private:
    VideoDecoder* m_decoder;
    FrameQueue* m_queue;

    QMutex m_mutex;
    QWaitCondition m_wake;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_seekRequested{false};
    std::atomic<bool> m_eof{false};
    double m_seekTarget = 0.0;
    int m_serial = 0;
    bool m_announced = false;
};

// FFmpeg-backed video handle. Opening is synchronous; the handle turns Ready
// once the decode thread has produced its first frame.
class VideoFileHandle : public MediaHandle {
    Q_OBJECT
public:
    explicit VideoFileHandle(const QString& filePath, QObject* parent = nullptr);
    ~VideoFileHandle() override;

    double duration() const override { return m_decoder->info().duration; }
    bool hasVideo() const override { return true; }
    QSize frameSize() const override;
    QImage currentFrame() override;

    const VideoInfo& info() const { return m_decoder->info(); }

protected:
    void onSeek(double seconds) override;

private:
    void close();

    std::unique_ptr<VideoDecoder> m_decoder;
    std::unique_ptr<FrameQueue> m_frameQueue;
    std::unique_ptr<DecodeThread> m_decodeThread;
    TimedFrame m_shown;
    int m_serial = 0;
};

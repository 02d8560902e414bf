#pragma once

// Test doubles for the media layer: a handle whose clock is set by the test,
// a factory handing those out, and an export sink that records what it gets.

#include <QColor>
#include <QImage>
#include <QMap>
#include <QSize>
#include <algorithm>
#include <memory>
#include <vector>
#include "media/ExportSink.h"
#include "media/MediaHandle.h"
#include "media/MediaHandleFactory.h"
#include "media/MediaPool.h"

class FakeMediaHandle : public MediaHandle {
public:
    FakeMediaHandle(const QString& source, double duration, bool video, bool audio)
        : MediaHandle(source), m_duration(duration), m_video(video), m_audio(audio) {}

    void makeReady() { setStatus(MediaStatus::Ready); }
    void makeFailed(const QString& error) { setStatus(MediaStatus::Failed, error); }

    // Clock is frozen unless the test moves it
    void setPosition(double seconds) { m_position = seconds; }
    double position() const override { return m_position; }
    double duration() const override { return m_duration; }

    bool hasVideo() const override { return m_video; }
    QSize frameSize() const override { return m_video ? m_frameSize : QSize(); }
    QImage currentFrame() override {
        QImage img(m_frameSize, QImage::Format_RGB32);
        img.fill(m_color);
        return img;
    }
    void setFrame(const QSize& size, const QColor& color) {
        m_frameSize = size;
        m_color = color;
    }

    bool hasAudio() const override { return m_audio; }
    // Constant level on every channel
    int readAudio(double localStart, double rate, float* out, int frames) const override {
        Q_UNUSED(localStart);
        Q_UNUSED(rate);
        for (int i = 0; i < frames * m_channels; ++i) out[i] = m_level;
        ++m_reads;
        return frames;
    }
    void setAudioLevel(float level) { m_level = level; }
    int audioReads() const { return m_reads; }

    int seekCount = 0;
    int playCount = 0;
    int pauseCount = 0;
    double lastSeek = -1.0;

protected:
    void onPlay() override { ++playCount; }
    void onPause() override { ++pauseCount; }
    void onSeek(double seconds) override {
        ++seekCount;
        lastSeek = seconds;
        m_position = seconds;
    }

private:
    double m_duration;
    bool m_video;
    bool m_audio;
    double m_position = 0.0;
    QSize m_frameSize{540, 960};
    QColor m_color = Qt::red;
    float m_level = 0.25f;
    int m_channels = 2;
    mutable int m_reads = 0;
};

// Media description per source path. Unknown paths get 10 s of ready media.
struct FakeMediaInfo {
    double duration = 10.0;
    bool ready = true;
    bool failed = false;
    float level = 0.25f;
    QColor color = Qt::red;
};

class FakeMediaFactory : public MediaHandleFactory {
public:
    void setMedia(const QString& path, const FakeMediaInfo& info) { m_media[path] = info; }

    std::unique_ptr<MediaHandle> create(const Clip& clip) override {
        if (clip.type() == ClipType::Text) return nullptr;
        FakeMediaInfo info = m_media.value(clip.sourcePath(), FakeMediaInfo());

        bool video = clip.type() == ClipType::Video;
        auto h = std::make_unique<FakeMediaHandle>(clip.sourcePath(), info.duration,
                                                   video, !video);
        h->setAudioLevel(info.level);
        h->setFrame(QSize(540, 960), info.color);
        if (info.failed) {
            h->makeFailed("unreadable");
        } else if (info.ready) {
            h->makeReady();
        }
        ++created;
        return h;
    }

    int created = 0;

private:
    QMap<QString, FakeMediaInfo> m_media;
};

inline FakeMediaHandle* fakeHandle(const MediaPool& pool, const ClipRef& ref) {
    return static_cast<FakeMediaHandle*>(pool.handle(ref));
}

// What the recording sink saw. Owned by the test, outlives the sink.
struct SinkLog {
    bool opened = false;
    QSize frameSize;
    int sampleRate = 0;
    int channels = 0;
    std::vector<double> framePts;
    std::vector<QRgb> centerPixels;
    long long audioFrames = 0;
    float peak = 0.0f;
    bool finished = false;
    bool aborted = false;
    bool destroyed = false;

    bool failOpen = false;
    int failAtFrame = -1;   // index of the video frame whose write fails
};

class RecordingSink : public ExportSink {
public:
    explicit RecordingSink(SinkLog& log) : m_log(log) {}
    ~RecordingSink() override { m_log.destroyed = true; }

    bool open(const ExportSettings& settings, const QSize& frameSize,
              int sampleRate, int channels) override {
        Q_UNUSED(settings);
        if (m_log.failOpen) {
            m_error = "disk full";
            return false;
        }
        m_log.opened = true;
        m_log.frameSize = frameSize;
        m_log.sampleRate = sampleRate;
        m_log.channels = channels;
        return true;
    }

    bool writeVideoFrame(const QImage& frame, double pts) override {
        if (m_log.failAtFrame >= 0 &&
            static_cast<int>(m_log.framePts.size()) == m_log.failAtFrame) {
            m_error = "encoder rejected frame";
            return false;
        }
        m_log.framePts.push_back(pts);
        m_log.centerPixels.push_back(frame.pixel(frame.width() / 2, frame.height() / 2));
        return true;
    }

    bool writeAudio(const float* samples, int frames) override {
        for (int i = 0; i < frames * m_log.channels; ++i) {
            m_log.peak = std::max(m_log.peak, samples[i]);
        }
        m_log.audioFrames += frames;
        return true;
    }

    bool finish() override {
        m_log.finished = true;
        return true;
    }

    void abort() override { m_log.aborted = true; }

    QString errorString() const override { return m_error; }

private:
    SinkLog& m_log;
    QString m_error;
};

#pragma once

#include <memory>
#include <vector>
#include "ExportSink.h"

// Encodes to a file with FFmpeg: video with the configured encoder (H.264 by
// default, YUV420P), audio as AAC, muxed by the container the output
// extension names.
class FfmpegExportSink : public ExportSink {
public:
    FfmpegExportSink();
    ~FfmpegExportSink() override;

    bool open(const ExportSettings& settings, const QSize& frameSize,
              int sampleRate, int channels) override;
    bool writeVideoFrame(const QImage& frame, double pts) override;
    bool writeAudio(const float* samples, int frames) override;
    bool finish() override;
    void abort() override;

    QString errorString() const override { return m_error; }

private:
    bool fail(const QString& message);
    bool encodeAudioChunk(const float* samples, int frames);
    bool drainVideo();
    bool drainAudio();
    void release();

    ExportSettings m_settings;
    QString m_error;
    bool m_open = false;
    int m_channels = 2;
    int64_t m_nextVideoPts = 0;
    int64_t m_nextAudioPts = 0;
    std::vector<float> m_pendingAudio;   // waits for a full encoder frame

#ifdef HAS_FFMPEG
    struct EncoderContext;
    std::unique_ptr<EncoderContext> m_ctx;
#endif
};

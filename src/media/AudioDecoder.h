#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <vector>

struct AudioInfo {
    int sampleRate = 0;    // of the source stream
    int channels = 0;
    double duration = 0.0;
    QString codecName;
};

// Decodes the best audio stream of a file and resamples it to interleaved
// float in the requested output format.
class AudioDecoder : public QObject {
    Q_OBJECT
public:
    explicit AudioDecoder(QObject* parent = nullptr);
    ~AudioDecoder();

    bool open(const QString& filePath, int outSampleRate, int outChannels);
    void close();
    bool isOpen() const { return m_isOpen; }

    // Decode up to maxSeconds of audio (everything when negative)
    std::vector<float> decode(double maxSeconds = -1.0);
    bool seek(double seconds);

    const AudioInfo& info() const { return m_info; }
    int outputSampleRate() const { return m_outRate; }
    int outputChannels() const { return m_outChannels; }
    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message);

    bool m_isOpen = false;
    AudioInfo m_info;
    int m_outRate = 0;
    int m_outChannels = 0;
    QString m_error;

#ifdef HAS_FFMPEG
    struct FFmpegAudioContext;
    std::unique_ptr<FFmpegAudioContext> m_ctx;
#endif
};

#pragma once

#include <QThread>
#include <memory>
#include <vector>
#include "MediaHandle.h"

// Decodes a whole audio stream to the mix format off the tick thread
class AudioLoadThread : public QThread {
    Q_OBJECT
public:
    AudioLoadThread(const QString& filePath, int sampleRate, int channels,
                    QObject* parent = nullptr);

    bool succeeded() const { return m_ok; }
    QString errorString() const { return m_error; }
    double duration() const { return m_duration; }
    std::vector<float> takeSamples() { return std::move(m_samples); }

protected:
    void run() override;

private:
    QString m_filePath;
    int m_sampleRate;
    int m_channels;
    bool m_ok = false;
    QString m_error;
    double m_duration = 0.0;
    std::vector<float> m_samples;
};

// Audio handle over a fully decoded PCM buffer. Decoding happens on an
// AudioLoadThread; the handle stays Loading until it finishes, and becomes
// Failed when the file has no decodable audio. Playback is virtual: the mix
// bus pulls samples with readAudio() at the handle's position.
class AudioFileHandle : public MediaHandle {
    Q_OBJECT
public:
    AudioFileHandle(const QString& filePath, int sampleRate, int channels,
                    QObject* parent = nullptr);
    ~AudioFileHandle() override;

    double duration() const override { return m_duration; }
    bool hasAudio() const override { return true; }
    int readAudio(double localStart, double rate, float* out, int frames) const override;

    int sampleRate() const { return m_sampleRate; }
    int channels() const { return m_channels; }

private:
    void onLoaded();

    int m_sampleRate;
    int m_channels;
    double m_duration = 0.0;
    std::vector<float> m_samples;
    std::unique_ptr<AudioLoadThread> m_loader;
};

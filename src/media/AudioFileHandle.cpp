#include "AudioFileHandle.h"
#include "AudioDecoder.h"
#include "Logging.h"
#include <cmath>

// --- AudioLoadThread ---

AudioLoadThread::AudioLoadThread(const QString& filePath, int sampleRate, int channels,
                                 QObject* parent)
    : QThread(parent)
    , m_filePath(filePath)
    , m_sampleRate(sampleRate)
    , m_channels(channels)
{}

void AudioLoadThread::run() {
    AudioDecoder decoder;
    if (!decoder.open(m_filePath, m_sampleRate, m_channels)) {
        m_error = decoder.errorString();
        return;
    }
    m_samples = decoder.decode();
    if (m_samples.empty()) {
        m_error = QString("No audio decoded from %1").arg(m_filePath);
        return;
    }
    m_duration = static_cast<double>(m_samples.size() / m_channels) / m_sampleRate;
    m_ok = true;
}

// --- AudioFileHandle ---

AudioFileHandle::AudioFileHandle(const QString& filePath, int sampleRate, int channels,
                                 QObject* parent)
    : MediaHandle(filePath, parent)
    , m_sampleRate(sampleRate)
    , m_channels(channels)
    , m_loader(std::make_unique<AudioLoadThread>(filePath, sampleRate, channels))
{
    connect(m_loader.get(), &QThread::finished, this, &AudioFileHandle::onLoaded);
    m_loader->start();
}

AudioFileHandle::~AudioFileHandle() {
    if (m_loader) {
        m_loader->wait();
    }
}

void AudioFileHandle::onLoaded() {
    if (!m_loader) return;
    if (!m_loader->succeeded()) {
        setStatus(MediaStatus::Failed, m_loader->errorString());
    } else {
        m_samples = m_loader->takeSamples();
        m_duration = m_loader->duration();
        setStatus(MediaStatus::Ready);
    }
    m_loader.reset();
}

int AudioFileHandle::readAudio(double localStart, double rate, float* out, int frames) const {
    if (m_samples.empty() || frames <= 0 || !std::isfinite(localStart)) return 0;

    const int64_t available = static_cast<int64_t>(m_samples.size()) / m_channels;
    const double step = rate > 0.0 ? rate : 1.0;
    const double first = localStart * m_sampleRate;

    int written = 0;
    for (; written < frames; ++written) {
        // Nearest-sample read
        int64_t src = static_cast<int64_t>(std::floor(first + written * step));
        if (src < 0) continue;
        if (src >= available) break;
        const float* in = m_samples.data() + src * m_channels;
        float* dst = out + static_cast<int64_t>(written) * m_channels;
        for (int c = 0; c < m_channels; ++c) dst[c] = in[c];
    }
    return written;
}

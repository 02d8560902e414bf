#include "AudioMixer.h"
#include "MediaPool.h"
#include "MediaHandle.h"
#include <algorithm>
#include <cmath>

AudioMixer::AudioMixer(int sampleRate, int channels)
    : m_sampleRate(sampleRate > 0 ? sampleRate : 48000)
    , m_channels(channels > 0 ? channels : 2)
{}

int64_t AudioMixer::frameAt(double seconds) const {
    return static_cast<int64_t>(std::llround(std::max(0.0, seconds) * m_sampleRate));
}

std::vector<float> AudioMixer::mix(const std::vector<Clip>& clips, const MediaPool& pool,
                                   double from, double to) const {
    const int64_t first = frameAt(from);
    const int64_t last = frameAt(to);
    if (last <= first) return {};

    std::vector<float> bus(static_cast<size_t>(last - first) * m_channels, 0.0f);
    mixInto(clips, pool, first, bus.data(), static_cast<int>(last - first));
    return bus;
}

void AudioMixer::mixInto(const std::vector<Clip>& clips, const MediaPool& pool,
                         int64_t firstFrame, float* out, int frames) const {
    if (frames <= 0) return;
    std::fill(out, out + static_cast<size_t>(frames) * m_channels, 0.0f);

    std::vector<float> scratch;
    const int64_t endFrame = firstFrame + frames;

    for (const auto& clip : clips) {
        if (clip.type() != ClipType::Audio) continue;
        const float gain = static_cast<float>(clip.volume());
        if (gain <= 0.0f) continue;

        // Overlap of [clip.start, clip.end) with the requested span
        const int64_t from = std::max(firstFrame, frameAt(clip.start));
        const int64_t to = std::min(endFrame, frameAt(clip.end));
        if (to <= from) continue;

        MediaHandle* h = pool.handle(clip.ref());
        if (!h || !h->isReady() || !h->hasAudio()) continue;

        const int count = static_cast<int>(to - from);
        scratch.assign(static_cast<size_t>(count) * m_channels, 0.0f);
        const double localStart =
            (static_cast<double>(from) / m_sampleRate - clip.start) * clip.speed();
        const int got = h->readAudio(localStart, clip.speed(), scratch.data(), count);

        float* dst = out + (from - firstFrame) * m_channels;
        for (int i = 0; i < got * m_channels; ++i) {
            dst[i] += scratch[i] * gain;
        }
    }

    for (int i = 0; i < frames * m_channels; ++i) {
        out[i] = std::clamp(out[i], -1.0f, 1.0f);
    }
}

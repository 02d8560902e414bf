#pragma once

#include <cstdint>
#include <vector>
#include "Clip.h"

class MediaPool;

// Sums the audio clips overlapping a span of project time into one
// interleaved float bus. Each clip is scaled by its volume and read at its
// own local offset; the sum is clamped to [-1, 1]. Handles that are not
// decode-ready contribute silence.
class AudioMixer {
public:
    AudioMixer(int sampleRate, int channels);

    int sampleRate() const { return m_sampleRate; }
    int channels() const { return m_channels; }

    // Frame index on the bus for a project time
    int64_t frameAt(double seconds) const;

    // Mixes the bus frames [frameAt(from), frameAt(to))
    std::vector<float> mix(const std::vector<Clip>& clips, const MediaPool& pool,
                           double from, double to) const;

    // Mixes frames bus frames starting at firstFrame into out (overwritten)
    void mixInto(const std::vector<Clip>& clips, const MediaPool& pool,
                 int64_t firstFrame, float* out, int frames) const;

private:
    int m_sampleRate;
    int m_channels;
};

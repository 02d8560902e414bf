#pragma once

#include <memory>
#include "Clip.h"
#include "MediaHandle.h"

// Creates the playable handle for a clip. The engine owns one factory; tests
// substitute their own.
class MediaHandleFactory {
public:
    virtual ~MediaHandleFactory() = default;
    // nullptr for clip kinds without media (text)
    virtual std::unique_ptr<MediaHandle> create(const Clip& clip) = 0;
};

// Decodes from local files with FFmpeg
class FileMediaFactory : public MediaHandleFactory {
public:
    FileMediaFactory(int sampleRate, int channels)
        : m_sampleRate(sampleRate), m_channels(channels) {}

    std::unique_ptr<MediaHandle> create(const Clip& clip) override;

private:
    int m_sampleRate;
    int m_channels;
};

#include "MediaHandleFactory.h"
#include "VideoFileHandle.h"
#include "AudioFileHandle.h"

std::unique_ptr<MediaHandle> FileMediaFactory::create(const Clip& clip) {
    switch (clip.type()) {
    case ClipType::Video:
        return std::make_unique<VideoFileHandle>(clip.sourcePath());
    case ClipType::Audio:
        return std::make_unique<AudioFileHandle>(clip.sourcePath(), m_sampleRate, m_channels);
    case ClipType::Text:
        break;
    }
    return nullptr;
}

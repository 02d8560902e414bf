#include "Track.h"
#include "Logging.h"
#include <algorithm>

Track::Track(ClipType kind, const QString& name, QObject* parent)
    : QObject(parent), m_kind(kind), m_name(name) {}

Track::~Track() = default;

bool Track::addClip(const Clip& clip) {
    return insertClip(clipCount(), clip);
}

bool Track::insertClip(int index, const Clip& clip) {
    if (clip.type() != m_kind) {
        qCWarning(lcTimeline) << "Refusing clip" << clip.id << "on track" << m_name
                              << "of another kind";
        return false;
    }
    index = std::clamp(index, 0, clipCount());
    m_clips.insert(m_clips.begin() + index, clip);
    return true;
}

Clip Track::takeClip(int index) {
    Clip taken = m_clips[index];
    m_clips.erase(m_clips.begin() + index);
    return taken;
}

int Track::indexOf(int clipId) const {
    for (int i = 0; i < clipCount(); ++i) {
        if (m_clips[i].id == clipId) return i;
    }
    return -1;
}

Clip* Track::findClip(int clipId) {
    int i = indexOf(clipId);
    return i >= 0 ? &m_clips[i] : nullptr;
}

const Clip* Track::findClip(int clipId) const {
    int i = indexOf(clipId);
    return i >= 0 ? &m_clips[i] : nullptr;
}

double Track::duration() const {
    double maxEnd = 0.0;
    for (const auto& c : m_clips) {
        if (c.end > maxEnd) maxEnd = c.end;
    }
    return maxEnd;
}

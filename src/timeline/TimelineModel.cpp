#include "TimelineModel.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QFileInfo>
#include <algorithm>
#include <cmath>

namespace {

double mediaSpan(double mediaDuration) {
    return mediaDuration > 0.0 ? mediaDuration : AppConstants::PlaceholderClipDuration;
}

QString audioNameFor(const QString& path) {
    return QString("%1 (audio)").arg(QFileInfo(path).fileName());
}

} // namespace

TimelineModel::TimelineModel(QObject* parent)
    : QObject(parent)
    , m_videoTrack(std::make_unique<Track>(ClipType::Video, "Video"))
    , m_audioTrack(std::make_unique<Track>(ClipType::Audio, "Audio"))
    , m_textTrack(std::make_unique<Track>(ClipType::Text, "Text"))
    , m_minClipDuration(AppConstants::MinClipDuration)
    , m_defaultTextDuration(AppConstants::DefaultTextDuration)
{}

TimelineModel::~TimelineModel() = default;

Track* TimelineModel::track(ClipType kind) {
    switch (kind) {
    case ClipType::Video: return m_videoTrack.get();
    case ClipType::Audio: return m_audioTrack.get();
    case ClipType::Text: return m_textTrack.get();
    }
    return nullptr;
}

const Track* TimelineModel::track(ClipType kind) const {
    return const_cast<TimelineModel*>(this)->track(kind);
}

double TimelineModel::duration() const {
    return std::max({m_videoTrack->duration(), m_audioTrack->duration(),
                     m_textTrack->duration()});
}

void TimelineModel::setPlayheadPosition(double seconds) {
    seconds = std::max(0.0, seconds);
    if (m_playhead != seconds) {
        m_playhead = seconds;
        emit playheadChanged(seconds);
    }
}

void TimelineModel::setMinClipDuration(double seconds) {
    m_minClipDuration = std::max(0.001, seconds);
}

void TimelineModel::setDefaultTextDuration(double seconds) {
    if (std::isfinite(seconds) && seconds > 0.0) m_defaultTextDuration = seconds;
}

int TimelineModel::attachPrimaryVideo(const QString& path, double mediaDuration) {
    int existing = primaryVideoId();
    if (existing >= 0) {
        replacePrimaryVideo(path, mediaDuration);
        return existing;
    }

    Clip video;
    video.id = nextId();
    video.start = 0.0;
    video.end = std::max(mediaSpan(mediaDuration), m_minClipDuration);
    VideoPayload vp;
    vp.sourcePath = path;
    vp.primary = true;
    video.payload = vp;

    Clip audio;
    audio.id = video.id;
    audio.start = video.start;
    audio.end = video.end;
    AudioPayload ap;
    ap.sourcePath = path;
    ap.displayName = audioNameFor(path);
    ap.volume = 1.0;
    ap.linkedToVideo = true;
    audio.payload = ap;

    m_videoTrack->insertClip(0, video);
    m_audioTrack->insertClip(0, audio);
    emit clipAdded(video.ref());
    emit clipAdded(audio.ref());
    notifyDurationChange();

    qCDebug(lcTimeline) << "Primary video" << video.id << path << "length" << video.end;
    return video.id;
}

bool TimelineModel::replacePrimaryVideo(const QString& path, double mediaDuration) {
    int id = primaryVideoId();
    if (id < 0) return false;

    Clip* video = m_videoTrack->findClip(id);
    video->video()->sourcePath = path;
    writeBounds(*video, video->start, video->start + mediaSpan(mediaDuration));

    if (Clip* audio = m_audioTrack->findClip(id)) {
        if (audio->isLinkedAudio()) {
            audio->audio()->sourcePath = path;
            audio->audio()->displayName = audioNameFor(path);
            emit clipSourceChanged(audio->ref());
        }
    }
    emit clipSourceChanged(video->ref());
    notifyDurationChange();
    return true;
}

int TimelineModel::addVideoClip(const QString& path, double mediaDuration) {
    Clip video;
    video.id = nextId();
    video.start = duration();
    video.end = video.start + std::max(mediaSpan(mediaDuration), m_minClipDuration);
    VideoPayload vp;
    vp.sourcePath = path;
    video.payload = vp;

    Clip audio;
    audio.id = video.id;
    audio.start = video.start;
    audio.end = video.end;
    AudioPayload ap;
    ap.sourcePath = path;
    ap.displayName = audioNameFor(path);
    ap.volume = 1.0;
    ap.linkedToVideo = true;
    audio.payload = ap;

    appendClip(video);
    appendClip(audio);
    notifyDurationChange();
    return video.id;
}

int TimelineModel::addAudioClip(const QString& path, double mediaDuration, double start,
                                double volume) {
    Clip audio;
    audio.id = nextId();
    audio.start = std::max(0.0, start);
    audio.end = audio.start + std::max(mediaSpan(mediaDuration), m_minClipDuration);
    AudioPayload ap;
    ap.sourcePath = path;
    ap.displayName = QFileInfo(path).fileName();
    ap.volume = volume < 0.0 ? AppConstants::StandaloneAudioVolume : std::min(volume, 1.0);
    audio.payload = ap;

    appendClip(audio);
    notifyDurationChange();
    return audio.id;
}

int TimelineModel::addTextClip(const TextPayload& text, double start, double end) {
    Clip clip;
    clip.id = nextId();
    clip.start = std::max(0.0, start);
    if (end <= clip.start) {
        double current = duration();
        double span = current > m_minClipDuration
            ? std::min(m_defaultTextDuration, current)
            : m_defaultTextDuration;
        end = clip.start + span;
    }
    clip.end = std::max(end, clip.start + m_minClipDuration);
    clip.payload = text;

    appendClip(clip);
    notifyDurationChange();
    return clip.id;
}

int TimelineModel::primaryVideoId() const {
    for (const auto& c : m_videoTrack->clips()) {
        if (c.isPrimaryVideo()) return c.id;
    }
    return -1;
}

int TimelineModel::clipCount() const {
    return m_videoTrack->clipCount() + m_audioTrack->clipCount() + m_textTrack->clipCount();
}

Clip* TimelineModel::findClip(const ClipRef& ref) {
    Track* t = track(ref.type);
    return t ? t->findClip(ref.id) : nullptr;
}

const Clip* TimelineModel::findClip(const ClipRef& ref) const {
    const Track* t = track(ref.type);
    return t ? t->findClip(ref.id) : nullptr;
}

const Clip* TimelineModel::linkedAudioFor(int videoId) const {
    const Clip* audio = m_audioTrack->findClip(videoId);
    return (audio && audio->isLinkedAudio()) ? audio : nullptr;
}

bool TimelineModel::setClipBounds(const ClipRef& ref, double start, double end) {
    if (!std::isfinite(start) || !std::isfinite(end)) return false;

    Clip* clip = findClip(ref);
    if (!clip) return false;

    // Linked audio only ever moves with its parent
    if (clip->isLinkedAudio()) {
        Clip* parent = m_videoTrack->findClip(clip->id);
        if (!parent) return false;
        clip = parent;
    }

    start = std::max(0.0, start);
    if (end - start < m_minClipDuration) {
        end = start + m_minClipDuration;
    }

    writeBounds(*clip, start, end);
    notifyDurationChange();
    return true;
}

bool TimelineModel::setVideoSpeed(int videoId, double speed) {
    Clip* video = m_videoTrack->findClip(videoId);
    if (!video || !std::isfinite(speed) || speed <= 0.0) return false;
    if (video->video()->speed == speed) return true;

    video->video()->speed = speed;
    emit clipPropertiesChanged(video->ref());
    if (Clip* audio = m_audioTrack->findClip(videoId)) {
        if (audio->isLinkedAudio()) {
            audio->audio()->speed = speed;
            emit clipPropertiesChanged(audio->ref());
        }
    }
    qCDebug(lcTimeline) << "Video clip" << videoId << "speed" << speed;
    return true;
}

bool TimelineModel::setClipVolume(const ClipRef& ref, double volume) {
    Clip* clip = findClip(ref);
    if (!clip || !std::isfinite(volume)) return false;

    volume = std::clamp(volume, 0.0, 1.0);
    if (VideoPayload* v = clip->video()) {
        if (v->volume == volume) return true;
        v->volume = volume;
        emit clipPropertiesChanged(clip->ref());
        if (Clip* audio = m_audioTrack->findClip(clip->id)) {
            if (audio->isLinkedAudio()) {
                audio->audio()->volume = volume;
                emit clipPropertiesChanged(audio->ref());
            }
        }
    } else if (AudioPayload* a = clip->audio()) {
        if (a->volume == volume) return true;
        a->volume = volume;
        emit clipPropertiesChanged(clip->ref());
    } else {
        return false;
    }
    return true;
}

bool TimelineModel::canRemoveClip(const ClipRef& ref, QString* reason) const {
    const Clip* clip = findClip(ref);
    if (!clip) {
        if (reason) *reason = "No such clip";
        return false;
    }
    if (clip->isPrimaryVideo()) {
        if (reason) *reason = "The primary video can only be replaced, not deleted";
        return false;
    }
    if (clip->isLinkedAudio()) {
        if (reason) *reason = "Cannot delete video audio separately; delete the video clip instead";
        return false;
    }
    return true;
}

std::vector<RemovedClip> TimelineModel::removeClip(const ClipRef& ref) {
    std::vector<RemovedClip> removed;

    QString reason;
    if (!canRemoveClip(ref, &reason)) {
        qCWarning(lcTimeline) << "Delete of clip" << ref.id << "rejected:" << reason;
        return removed;
    }

    Track* t = track(ref.type);
    int index = t->indexOf(ref.id);
    removed.push_back({index, t->takeClip(index)});
    emit clipRemoved(ref);

    if (ref.type == ClipType::Video) {
        int audioIndex = m_audioTrack->indexOf(ref.id);
        if (audioIndex >= 0 && m_audioTrack->clip(audioIndex).isLinkedAudio()) {
            removed.push_back({audioIndex, m_audioTrack->takeClip(audioIndex)});
            emit clipRemoved(ClipRef{ClipType::Audio, ref.id});
        }
    }

    notifyDurationChange();
    return removed;
}

void TimelineModel::restoreClips(const std::vector<RemovedClip>& removed) {
    for (auto it = removed.rbegin(); it != removed.rend(); ++it) {
        track(it->clip.type())->insertClip(it->index, it->clip);
        emit clipAdded(it->clip.ref());
    }
    notifyDurationChange();
}

void TimelineModel::refreshTextVisibility(double t) {
    for (auto& c : m_textTrack->clips()) {
        c.text()->visible = c.isActiveAt(t);
    }
}

void TimelineModel::appendClip(const Clip& clip) {
    if (track(clip.type())->addClip(clip)) {
        emit clipAdded(clip.ref());
    }
}

void TimelineModel::writeBounds(Clip& clip, double start, double end) {
    Clip* linked = nullptr;
    if (clip.type() == ClipType::Video) {
        Clip* audio = m_audioTrack->findClip(clip.id);
        if (audio && audio->isLinkedAudio()) linked = audio;
    }

    // Both sides are written before anyone is told
    clip.start = start;
    clip.end = end;
    if (linked) {
        linked->start = start;
        linked->end = end;
    }

    emit clipTimingChanged(clip.ref(), start, end);
    if (linked) emit clipTimingChanged(linked->ref(), start, end);
}

void TimelineModel::notifyDurationChange() {
    double d = duration();
    if (d != m_lastDuration) {
        m_lastDuration = d;
        emit durationChanged(d);
    }
}

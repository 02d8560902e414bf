#include "MediaSyncController.h"
#include "MediaPool.h"
#include "MediaHandle.h"
#include "AppConstants.h"
#include "Logging.h"
#include <cmath>

MediaSyncController::MediaSyncController(MediaPool& pool, QObject* parent)
    : QObject(parent)
    , m_pool(pool)
    , m_videoTolerance(AppConstants::VideoDriftTolerance)
    , m_audioTolerance(AppConstants::AudioDriftTolerance)
{}

void MediaSyncController::setTolerances(double video, double audio) {
    if (video > 0.0) m_videoTolerance = video;
    if (audio > 0.0) m_audioTolerance = audio;
}

double MediaSyncController::expectedPosition(const Clip& clip, double t) {
    return std::max(0.0, (t - clip.start) * clip.speed());
}

MediaHandle* MediaSyncController::activeVideoHandle() const {
    return m_activeVideo.isValid() ? m_pool.handle(m_activeVideo) : nullptr;
}

void MediaSyncController::synchronize(const ActiveSet& active, bool playing) {
    syncVideo(active, playing);
    syncAudio(active, playing);
}

void MediaSyncController::syncVideo(const ActiveSet& active, bool playing) {
    const ClipRef current = active.video ? active.video->ref() : ClipRef();

    if (current != m_activeVideo) {
        // Cut: the outgoing clip stops at once
        if (MediaHandle* old = activeVideoHandle()) {
            if (old->status() != MediaStatus::Failed) old->pause();
        }
        qCDebug(lcSync) << "Active video" << m_activeVideo.id << "->" << current.id
                        << "at" << active.time;
        m_activeVideo = current;
        m_videoStartPending = current.isValid();
    }

    if (!active.video) return;

    MediaHandle* h = activeVideoHandle();
    if (!h || h->status() == MediaStatus::Failed) return;
    if (!h->isReady()) {
        qCDebug(lcSync) << "Video clip" << current.id << "not ready, retrying next tick";
        m_videoStartPending = true;
        return;
    }

    const Clip& clip = *active.video;
    const double expected = expectedPosition(clip, active.time);
    if (m_videoStartPending) {
        start(h, clip, expected, playing);
        m_videoStartPending = false;
    } else {
        h->setPlaybackRate(clip.speed());
        correct(h, expected, m_videoTolerance, playing);
    }
}

void MediaSyncController::syncAudio(const ActiveSet& active, bool playing) {
    std::set<ClipRef> now;
    for (const auto& clip : active.audio) now.insert(clip.ref());

    // Leaving
    for (auto it = m_startedAudio.begin(); it != m_startedAudio.end();) {
        if (now.count(*it)) {
            ++it;
            continue;
        }
        if (MediaHandle* h = m_pool.handle(*it)) {
            if (h->status() != MediaStatus::Failed) h->pause();
        }
        qCDebug(lcSync) << "Audio clip" << it->id << "left at" << active.time;
        it = m_startedAudio.erase(it);
    }
    for (auto it = m_pendingAudio.begin(); it != m_pendingAudio.end();) {
        it = now.count(*it) ? std::next(it) : m_pendingAudio.erase(it);
    }

    for (const auto& clip : active.audio) {
        const ClipRef ref = clip.ref();
        MediaHandle* h = m_pool.handle(ref);
        if (!h || h->status() == MediaStatus::Failed) continue;

        const double expected = expectedPosition(clip, active.time);

        if (!m_startedAudio.count(ref)) {
            if (!h->isReady()) {
                if (m_pendingAudio.insert(ref).second) {
                    qCDebug(lcSync) << "Audio clip" << ref.id << "entered before ready";
                }
                continue;
            }
            start(h, clip, expected, playing);
            m_pendingAudio.erase(ref);
            m_startedAudio.insert(ref);
            continue;
        }

        // The handle was rebuilt under the same ref (source swap, undo of a
        // delete); wait for it like a newly entering clip
        if (!h->isReady()) {
            m_startedAudio.erase(ref);
            m_pendingAudio.insert(ref);
            qCDebug(lcSync) << "Audio clip" << ref.id << "reloading, start deferred";
            continue;
        }

        h->setVolume(clip.volume());
        h->setPlaybackRate(clip.speed());
        correct(h, expected, m_audioTolerance, playing);
    }
}

void MediaSyncController::start(MediaHandle* h, const Clip& clip, double expected, bool playing) {
    h->setVolume(clip.volume());
    h->setPlaybackRate(clip.speed());
    h->seek(expected);
    if (playing) {
        h->play();
    } else {
        h->pause();
    }
    qCDebug(lcSync) << "Started clip" << clip.id << "at local" << expected
                    << (playing ? "playing" : "paused");
}

void MediaSyncController::correct(MediaHandle* h, double expected, double tolerance, bool playing) {
    // Past the end of the source there is nothing to line up with
    const double d = h->duration();
    if (d > 0.0 && expected >= d) {
        if (!h->isPaused()) h->pause();
        return;
    }

    const double drift = std::abs(h->position() - expected);
    if (drift > tolerance) {
        qCDebug(lcSync) << "Drift" << drift << "on" << h->source() << "reseeking to" << expected;
        h->seek(expected);
    }

    if (playing && h->isPaused()) {
        h->play();
    } else if (!playing && !h->isPaused()) {
        h->pause();
    }
}

void MediaSyncController::pauseAll() {
    m_pool.pauseAll();
    m_activeVideo = ClipRef();
    m_videoStartPending = false;
    m_startedAudio.clear();
    m_pendingAudio.clear();
}

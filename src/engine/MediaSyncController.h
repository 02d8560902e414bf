#pragma once

#include <QObject>
#include <set>
#include "ActiveElementResolver.h"

class MediaHandle;
class MediaPool;

// Steers every media handle the current active set needs so that its local
// position stays within tolerance of (t - clip.start) * speed and its
// play/pause state follows the transport.
//
// The controller keys everything by ClipRef and looks handles up in the pool
// on every tick, so a handle destroyed between ticks is simply gone.
class MediaSyncController : public QObject {
    Q_OBJECT
public:
    explicit MediaSyncController(MediaPool& pool, QObject* parent = nullptr);

    void setTolerances(double video, double audio);
    double videoTolerance() const { return m_videoTolerance; }
    double audioTolerance() const { return m_audioTolerance; }

    // One tick's worth of sync for the resolved set at active.time
    void synchronize(const ActiveSet& active, bool playing);

    // Pauses every handle and forgets what was started, so the next
    // synchronize() treats every active clip as newly entering
    void pauseAll();

    ClipRef activeVideo() const { return m_activeVideo; }
    MediaHandle* activeVideoHandle() const;
    bool isAudioStarted(const ClipRef& ref) const { return m_startedAudio.count(ref) > 0; }
    bool isAudioPending(const ClipRef& ref) const { return m_pendingAudio.count(ref) > 0; }

    static double expectedPosition(const Clip& clip, double t);

private:
    void syncVideo(const ActiveSet& active, bool playing);
    void syncAudio(const ActiveSet& active, bool playing);
    // Seek when off by more than tolerance, then line play/pause up with the transport
    void correct(MediaHandle* h, double expected, double tolerance, bool playing);
    void start(MediaHandle* h, const Clip& clip, double expected, bool playing);

    MediaPool& m_pool;
    double m_videoTolerance;
    double m_audioTolerance;

    ClipRef m_activeVideo;
    bool m_videoStartPending = false;
    std::set<ClipRef> m_startedAudio;
    std::set<ClipRef> m_pendingAudio;   // entered while not decode-ready
};

#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <vector>
#include "Track.h"

// A clip taken out of the model together with where it lived, so that an
// undo can put it back exactly.
struct RemovedClip {
    int index = -1;
    Clip clip;
};

// The project: one track per clip kind, a derived duration and the playhead.
// Timing is only ever written through setClipBounds(), which enforces the
// clip invariants and keeps clip-linked audio in lockstep with its video.
class TimelineModel : public QObject {
    Q_OBJECT
public:
    explicit TimelineModel(QObject* parent = nullptr);
    ~TimelineModel();

    Track* track(ClipType kind);
    const Track* track(ClipType kind) const;

    double duration() const;   // max end across all clips
    double playheadPosition() const { return m_playhead; }
    void setPlayheadPosition(double seconds);

    double minClipDuration() const { return m_minClipDuration; }
    void setMinClipDuration(double seconds);
    double defaultTextDuration() const { return m_defaultTextDuration; }
    void setDefaultTextDuration(double seconds);

    // Media attachment. mediaDuration is the decodable length of the source.
    int attachPrimaryVideo(const QString& path, double mediaDuration);
    bool replacePrimaryVideo(const QString& path, double mediaDuration);
    int addVideoClip(const QString& path, double mediaDuration);
    int addAudioClip(const QString& path, double mediaDuration, double start = 0.0,
                     double volume = -1.0);
    // end <= start picks the default span
    int addTextClip(const TextPayload& text, double start = 0.0, double end = -1.0);

    int primaryVideoId() const;
    int clipCount() const;

    Clip* findClip(const ClipRef& ref);
    const Clip* findClip(const ClipRef& ref) const;
    const Clip* linkedAudioFor(int videoId) const;

    // The clamped-write path. Returns false only for unknown clips or
    // non-finite input; out-of-range values are clamped.
    bool setClipBounds(const ClipRef& ref, double start, double end);
    // Speed and volume leave the bounds alone. A video clip's values are
    // carried by its linked audio as well.
    bool setVideoSpeed(int videoId, double speed);
    bool setClipVolume(const ClipRef& ref, double volume);

    bool canRemoveClip(const ClipRef& ref, QString* reason = nullptr) const;
    // Deleting a video clip cascades to its linked audio. Returns what was
    // removed (empty when the removal was rejected).
    std::vector<RemovedClip> removeClip(const ClipRef& ref);
    void restoreClips(const std::vector<RemovedClip>& removed);

    void refreshTextVisibility(double t);

signals:
    void clipAdded(const ClipRef& ref);
    void clipRemoved(const ClipRef& ref);
    void clipTimingChanged(const ClipRef& ref, double start, double end);
    void clipSourceChanged(const ClipRef& ref);
    // Speed or volume changed
    void clipPropertiesChanged(const ClipRef& ref);
    void playheadChanged(double seconds);
    void durationChanged(double seconds);

private:
    int nextId() { return m_nextClipId++; }
    void appendClip(const Clip& clip);
    void writeBounds(Clip& clip, double start, double end);
    void notifyDurationChange();

    std::unique_ptr<Track> m_videoTrack;
    std::unique_ptr<Track> m_audioTrack;
    std::unique_ptr<Track> m_textTrack;
    double m_playhead = 0.0;
    double m_minClipDuration;
    double m_defaultTextDuration;
    double m_lastDuration = 0.0;
    int m_nextClipId = 1;
};

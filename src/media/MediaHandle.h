#pragma once

#include <QObject>
#include <QString>
#include <QImage>
#include <QSize>
#include <QElapsedTimer>

enum class MediaStatus {
    Loading,   // opened, not decode-ready yet
    Ready,
    Failed     // the resource could not be loaded; commands are dropped
};

// One playable media resource bound to a clip. Keeps its own local clock
// (position in source seconds) that the sync controller steers with
// seek/play/pause/rate. Transport commands are no-ops with a warning once the
// handle has failed.
class MediaHandle : public QObject {
    Q_OBJECT
public:
    explicit MediaHandle(const QString& source, QObject* parent = nullptr);
    ~MediaHandle() override;

    QString source() const { return m_source; }
    MediaStatus status() const { return m_status; }
    bool isReady() const { return m_status == MediaStatus::Ready; }
    QString errorString() const { return m_error; }

    // Transport
    void play();
    void pause();
    void seek(double seconds);
    void setPlaybackRate(double rate);
    void setVolume(double volume);

    virtual double position() const;
    virtual bool isPaused() const { return m_paused; }
    virtual double duration() const = 0;
    double playbackRate() const { return m_rate; }
    double volume() const { return m_volume; }

    // Video side
    virtual bool hasVideo() const { return false; }
    virtual QSize frameSize() const { return QSize(); }
    // Frame due at the current position; the last frame shown when none is newer
    virtual QImage currentFrame() { return QImage(); }

    // Audio side. Fills frames of interleaved float in the mix format starting
    // at local time localStart, stepping at rate source seconds per output
    // second. Returns the number of frames written; the rest is left untouched.
    virtual bool hasAudio() const { return false; }
    virtual int readAudio(double localStart, double rate, float* out, int frames) const;

signals:
    void statusChanged(MediaStatus status);

protected:
    void setStatus(MediaStatus status, const QString& error = QString());

    // Hooks run after the base has updated its clock
    virtual void onPlay() {}
    virtual void onPause() {}
    virtual void onSeek(double seconds) { Q_UNUSED(seconds); }

private:
    bool acceptCommand(const char* what) const;

    QString m_source;
    MediaStatus m_status = MediaStatus::Loading;
    QString m_error;

    // Local clock: anchor position plus wall time since the anchor when playing
    double m_anchor = 0.0;
    QElapsedTimer m_sinceAnchor;
    bool m_paused = true;
    double m_rate = 1.0;
    double m_volume = 1.0;
};

#pragma once

#include <QObject>
#include <QTimer>
#include <QElapsedTimer>
#include <QImage>
#include "ActiveElementResolver.h"

class TimelineModel;
class MediaSyncController;
class Compositor;

enum class PlaybackState {
    Stopped,
    Playing,
    Paused
};

// Transport plus the tick. One tick advances the project clock (while
// playing), resolves the active set, synchronizes media and composes a
// frame. tick() is the only entry point; the internal timer just calls it
// with wall-clock time, tests call it directly.
class Scheduler : public QObject {
    Q_OBJECT
public:
    Scheduler(TimelineModel& model, MediaSyncController& sync, Compositor& compositor,
              QObject* parent = nullptr);
    ~Scheduler() override;

    void play();
    void pause();
    void stop();
    void togglePlayPause();

    void seek(double seconds);
    void stepForward();
    void stepBackward();

    void setFps(double fps);
    double fps() const { return m_fps; }

    PlaybackState state() const { return m_state; }
    bool isPlaying() const { return m_state == PlaybackState::Playing; }
    double currentTime() const;

    // now: monotonic seconds. Re-entrant calls are dropped with a warning.
    void tick(double now);
    // Compose at the current time without advancing the clock
    void refresh();

    // Free-running preview loop driving tick() at the configured fps
    void startLoop();
    void stopLoop();
    bool isLoopRunning() const { return m_timer.isActive(); }

    const ActiveSet& lastActiveSet() const { return m_lastActive; }

signals:
    void stateChanged(PlaybackState state);
    void seekPerformed(double seconds);
    // Project time only moves forward between seeks while playing
    void timeAdvanced(double from, double to);
    void frameComposed(const QImage& frame, double time);
    // The clock reached the end. Afterwards transport pauses and the
    // playhead returns to 0.
    void playbackEnded(double duration);

private slots:
    void onTimer();

private:
    void setState(PlaybackState state);
    void composeAt(double t);
    double wallClock() const { return m_wall.nsecsElapsed() / 1e9; }

    TimelineModel& m_model;
    MediaSyncController& m_sync;
    Compositor& m_compositor;

    QTimer m_timer;
    QElapsedTimer m_wall;
    PlaybackState m_state = PlaybackState::Stopped;
    double m_fps = 30.0;
    double m_lastTick = -1.0;   // wall time of the previous playing tick, -1 = none
    bool m_inTick = false;
    ActiveSet m_lastActive;
};

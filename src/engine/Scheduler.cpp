#include "Scheduler.h"
#include "TimelineModel.h"
#include "MediaSyncController.h"
#include "Compositor.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>

Scheduler::Scheduler(TimelineModel& model, MediaSyncController& sync, Compositor& compositor,
                     QObject* parent)
    : QObject(parent)
    , m_model(model)
    , m_sync(sync)
    , m_compositor(compositor)
{
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, &Scheduler::onTimer);
    m_wall.start();
}

Scheduler::~Scheduler() {
    m_timer.stop();
}

double Scheduler::currentTime() const {
    return m_model.playheadPosition();
}

void Scheduler::setState(PlaybackState state) {
    if (state == m_state) return;
    m_state = state;
    emit stateChanged(state);
}

void Scheduler::play() {
    if (m_state == PlaybackState::Playing) return;
    if (m_model.duration() <= 0.0) {
        qCWarning(lcEngine) << "Nothing to play";
        return;
    }
    if (m_model.playheadPosition() >= m_model.duration()) {
        m_model.setPlayheadPosition(0.0);
    }
    // The first tick after play() only sets the baseline
    m_lastTick = -1.0;
    setState(PlaybackState::Playing);
    qCDebug(lcEngine) << "Play from" << m_model.playheadPosition();
}

void Scheduler::pause() {
    if (m_state != PlaybackState::Playing) return;
    m_lastTick = -1.0;
    setState(PlaybackState::Paused);
    m_sync.pauseAll();
    qCDebug(lcEngine) << "Pause at" << m_model.playheadPosition();
}

void Scheduler::stop() {
    m_lastTick = -1.0;
    setState(PlaybackState::Stopped);
    m_sync.pauseAll();
    m_model.setPlayheadPosition(0.0);
    refresh();
}

void Scheduler::togglePlayPause() {
    if (m_state == PlaybackState::Playing) {
        pause();
    } else {
        play();
    }
}

void Scheduler::seek(double seconds) {
    if (!std::isfinite(seconds)) return;
    double t = std::clamp(seconds, 0.0, std::max(0.0, m_model.duration()));
    m_model.setPlayheadPosition(t);
    // A seek is a discontinuity: don't count the time since the last tick
    m_lastTick = -1.0;
    emit seekPerformed(t);
    refresh();
}

void Scheduler::stepForward() {
    seek(currentTime() + 1.0 / m_fps);
}

void Scheduler::stepBackward() {
    seek(currentTime() - 1.0 / m_fps);
}

void Scheduler::setFps(double fps) {
    if (fps <= 0.0 || !std::isfinite(fps)) return;
    m_fps = fps;
    if (m_timer.isActive()) {
        m_timer.setInterval(std::max(1, static_cast<int>(1000.0 / m_fps)));
    }
}

void Scheduler::startLoop() {
    m_timer.start(std::max(1, static_cast<int>(1000.0 / m_fps)));
}

void Scheduler::stopLoop() {
    m_timer.stop();
}

void Scheduler::onTimer() {
    tick(wallClock());
}

void Scheduler::refresh() {
    if (m_inTick) {
        qCWarning(lcEngine) << "Re-entrant refresh dropped";
        return;
    }
    m_inTick = true;
    composeAt(m_model.playheadPosition());
    m_inTick = false;
}

void Scheduler::tick(double now) {
    if (m_inTick) {
        qCWarning(lcEngine) << "Re-entrant tick dropped";
        return;
    }
    m_inTick = true;

    double t = m_model.playheadPosition();
    if (m_state == PlaybackState::Playing) {
        double dt = m_lastTick >= 0.0 ? std::max(0.0, now - m_lastTick) : 0.0;
        m_lastTick = now;

        const double from = t;
        const double duration = m_model.duration();
        t = from + dt;

        if (t >= duration) {
            // Play out the tail, then terminal -> initial. playbackEnded goes
            // out while the state still reads Playing so listeners can tell
            // the end apart from a user pause.
            if (duration > from) emit timeAdvanced(from, duration);
            qCInfo(lcEngine) << "Reached end of project at" << duration;
            emit playbackEnded(duration);
            m_lastTick = -1.0;
            setState(PlaybackState::Paused);
            m_sync.pauseAll();
            m_model.setPlayheadPosition(0.0);
            composeAt(0.0);
            m_inTick = false;
            return;
        }

        if (t > from) emit timeAdvanced(from, t);
        m_model.setPlayheadPosition(t);
    }

    composeAt(t);
    m_inTick = false;
}

void Scheduler::composeAt(double t) {
    m_model.refreshTextVisibility(t);
    m_lastActive = ActiveElementResolver::resolve(m_model, t);
    m_sync.synchronize(m_lastActive, m_state == PlaybackState::Playing);
    const QImage& frame = m_compositor.compose(m_sync.activeVideoHandle(), m_lastActive.text);
    emit frameComposed(frame, t);
}

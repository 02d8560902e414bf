#include "MediaHandle.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>

MediaHandle::MediaHandle(const QString& source, QObject* parent)
    : QObject(parent)
    , m_source(source)
{}

MediaHandle::~MediaHandle() = default;

bool MediaHandle::acceptCommand(const char* what) const {
    if (m_status == MediaStatus::Failed) {
        qCWarning(lcMedia) << "Dropping" << what << "for failed media" << m_source << m_error;
        return false;
    }
    return true;
}

void MediaHandle::play() {
    if (!acceptCommand("play")) return;
    if (!m_paused) return;
    m_paused = false;
    m_sinceAnchor.start();
    onPlay();
}

void MediaHandle::pause() {
    if (!acceptCommand("pause")) return;
    if (m_paused) return;
    m_anchor = position();
    m_paused = true;
    onPause();
}

void MediaHandle::seek(double seconds) {
    if (!acceptCommand("seek")) return;
    if (!std::isfinite(seconds)) return;
    double d = duration();
    seconds = std::max(0.0, seconds);
    if (d > 0.0) seconds = std::min(seconds, d);
    m_anchor = seconds;
    if (!m_paused) m_sinceAnchor.start();
    onSeek(seconds);
}

void MediaHandle::setPlaybackRate(double rate) {
    if (!acceptCommand("rate change")) return;
    if (!std::isfinite(rate) || rate <= 0.0 || rate == m_rate) return;
    // Re-anchor so the position stays continuous across the change
    m_anchor = position();
    if (!m_paused) m_sinceAnchor.start();
    m_rate = rate;
}

void MediaHandle::setVolume(double volume) {
    if (!acceptCommand("volume change")) return;
    m_volume = std::clamp(volume, 0.0, 1.0);
}

double MediaHandle::position() const {
    double pos = m_anchor;
    if (!m_paused && m_sinceAnchor.isValid()) {
        pos += m_sinceAnchor.nsecsElapsed() / 1e9 * m_rate;
    }
    double d = duration();
    return d > 0.0 ? std::min(pos, d) : pos;
}

int MediaHandle::readAudio(double localStart, double rate, float* out, int frames) const {
    Q_UNUSED(localStart);
    Q_UNUSED(rate);
    Q_UNUSED(out);
    Q_UNUSED(frames);
    return 0;
}

void MediaHandle::setStatus(MediaStatus status, const QString& error) {
    if (status == m_status) return;
    m_status = status;
    m_error = error;
    if (status == MediaStatus::Failed) {
        qCWarning(lcMedia) << "Media failed to load:" << m_source << error;
    } else {
        qCDebug(lcMedia) << "Media" << m_source << (status == MediaStatus::Ready ? "ready" : "loading");
    }
    emit statusChanged(status);
}

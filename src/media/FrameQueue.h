#pragma once

#include <QImage>
#include <QMutex>
#include <deque>

struct TimedFrame {
    QImage image;
    double pts = 0.0;  // media-local presentation time, seconds
    int serial = 0;    // seek generation the frame was decoded in
};

// Bounded hand-off between a decode thread and the tick. Never blocks: the
// producer backs off while tryPush() fails and retries.
class FrameQueue {
public:
    explicit FrameQueue(int maxSize = 8) : m_maxSize(maxSize) {}

    bool tryPush(const TimedFrame& frame) {
        QMutexLocker lock(&m_mutex);
        if (static_cast<int>(m_queue.size()) >= m_maxSize) return false;
        m_queue.push_back(frame);
        return true;
    }

    // Pops every frame due at or before pts and hands back the newest of
    // them. Frames from an older serial are discarded on the way; frames
    // further ahead stay queued.
    bool popUntil(double pts, int serial, TimedFrame& frame) {
        QMutexLocker lock(&m_mutex);
        bool popped = false;
        while (!m_queue.empty()) {
            const TimedFrame& front = m_queue.front();
            if (front.serial != serial) {
                m_queue.pop_front();
                continue;
            }
            if (front.pts > pts) break;
            frame = front;
            m_queue.pop_front();
            popped = true;
        }
        return popped;
    }

    // Earliest queued pts, or a negative value when empty
    double frontPts() const {
        QMutexLocker lock(&m_mutex);
        return m_queue.empty() ? -1.0 : m_queue.front().pts;
    }

    void clear() {
        QMutexLocker lock(&m_mutex);
        m_queue.clear();
    }

private:
    mutable QMutex m_mutex;
    std::deque<TimedFrame> m_queue;
    int m_maxSize;
};

#include "VideoFileHandle.h"
#include "Logging.h"

// --- DecodeThread ---

DecodeThread::DecodeThread(VideoDecoder* decoder, FrameQueue* queue, QObject* parent)
    : QThread(parent), m_decoder(decoder), m_queue(queue) {}

void DecodeThread::requestSeek(double seconds, int serial) {
    QMutexLocker lock(&m_mutex);
    m_seekTarget = seconds;
    m_serial = serial;
    m_seekRequested = true;
    m_eof = false;
    m_queue->clear();
    m_wake.wakeOne();
}

void DecodeThread::requestStop() {
    QMutexLocker lock(&m_mutex);
    m_stopRequested = true;
    m_wake.wakeOne();
}

void DecodeThread::run() {
    int serial = 0;
    while (!m_stopRequested) {
        if (m_seekRequested) {
            double target;
            {
                QMutexLocker lock(&m_mutex);
                target = m_seekTarget;
                serial = m_serial;
                m_seekRequested = false;
            }
            m_eof = false;
            m_queue->clear();
            m_decoder->seek(target);
        }

        // At EOF, wait for a seek or stop
        if (m_eof) {
            QMutexLocker lock(&m_mutex);
            if (!m_stopRequested && !m_seekRequested) {
                m_wake.wait(&m_mutex, 100);
            }
            continue;
        }

        QImage frame = m_decoder->decodeNextFrame();
        if (frame.isNull()) {
            m_eof = true;
            continue;
        }

        TimedFrame tf;
        tf.image = frame;
        tf.pts = m_decoder->currentTime();
        tf.serial = serial;

        // Backpressure: wait for room, but keep watching for stop/seek
        while (!m_stopRequested && !m_seekRequested) {
            if (m_queue->tryPush(tf)) {
                if (!m_announced) {
                    m_announced = true;
                    emit firstFrameReady();
                }
                break;
            }
            QThread::msleep(2);
        }
    }
}

// --- VideoFileHandle ---

VideoFileHandle::VideoFileHandle(const QString& filePath, QObject* parent)
    : MediaHandle(filePath, parent)
    , m_decoder(std::make_unique<VideoDecoder>())
    , m_frameQueue(std::make_unique<FrameQueue>(8))
{
    if (!m_decoder->open(filePath)) {
        setStatus(MediaStatus::Failed, m_decoder->errorString());
        return;
    }

    m_decodeThread = std::make_unique<DecodeThread>(m_decoder.get(), m_frameQueue.get());
    // Queued: the status flips on this handle's thread, never mid-tick
    connect(m_decodeThread.get(), &DecodeThread::firstFrameReady, this, [this]() {
        if (status() == MediaStatus::Loading) setStatus(MediaStatus::Ready);
    }, Qt::QueuedConnection);
    m_decodeThread->start();
}

VideoFileHandle::~VideoFileHandle() {
    close();
}

void VideoFileHandle::close() {
    if (m_decodeThread) {
        m_decodeThread->requestStop();
        if (!m_decodeThread->wait(2000)) {
            qCWarning(lcMedia) << "Decode thread for" << source() << "is slow to stop";
            m_decodeThread->wait();
        }
        m_decodeThread.reset();
    }
    m_frameQueue->clear();
    m_decoder->close();
}

QSize VideoFileHandle::frameSize() const {
    const VideoInfo& vi = m_decoder->info();
    return QSize(vi.width, vi.height);
}

QImage VideoFileHandle::currentFrame() {
    TimedFrame due;
    if (m_frameQueue->popUntil(position(), m_serial, due)) {
        m_shown = due;
    } else if (m_shown.image.isNull() || m_shown.serial != m_serial) {
        // Right after a seek nothing is due yet; show the earliest decoded
        // frame of the new serial instead of holding the stale one
        TimedFrame next;
        double front = m_frameQueue->frontPts();
        if (front >= 0.0 && m_frameQueue->popUntil(front, m_serial, next)) {
            m_shown = next;
        }
    }
    return m_shown.image;
}

void VideoFileHandle::onSeek(double seconds) {
    if (!m_decodeThread) return;
    ++m_serial;
    m_decodeThread->requestSeek(seconds, m_serial);
}

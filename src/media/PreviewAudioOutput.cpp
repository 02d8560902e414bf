#include "PreviewAudioOutput.h"
#include "Logging.h"
#include <QAudioFormat>
#include <QAudioDevice>
#include <QAudioSink>
#include <QMediaDevices>
#include <algorithm>

PreviewAudioOutput::PreviewAudioOutput(int sampleRate, int channels, QObject* parent)
    : QObject(parent)
    , m_sampleRate(sampleRate)
    , m_channels(channels)
{}

PreviewAudioOutput::~PreviewAudioOutput() {
    stop();
}

bool PreviewAudioOutput::start() {
    if (m_device) return true;

    QAudioDevice device = QMediaDevices::defaultAudioOutput();
    if (device.isNull()) {
        qCWarning(lcMedia) << "No audio output device; preview is silent";
        return false;
    }

    QAudioFormat format;
    format.setSampleRate(m_sampleRate);
    format.setChannelCount(m_channels);
    format.setSampleFormat(QAudioFormat::Float);
    if (!device.isFormatSupported(format)) {
        qCWarning(lcMedia) << "Output device" << device.description()
                           << "does not take float" << m_sampleRate << "Hz; preview is silent";
        return false;
    }

    m_sink = std::make_unique<QAudioSink>(device, format);
    m_device = m_sink->start();
    if (!m_device) {
        qCWarning(lcMedia) << "Audio output failed to start:" << m_sink->error();
        m_sink.reset();
        return false;
    }
    return true;
}

void PreviewAudioOutput::stop() {
    if (m_sink) m_sink->stop();
    m_device = nullptr;
    m_sink.reset();
}

void PreviewAudioOutput::push(const float* samples, int frames) {
    if (!m_device || frames <= 0) return;
    const qint64 bytesPerFrame = static_cast<qint64>(sizeof(float)) * m_channels;
    qint64 bytes = std::min<qint64>(frames * bytesPerFrame, m_sink->bytesFree());
    bytes -= bytes % bytesPerFrame;
    if (bytes <= 0) return;
    if (m_device->write(reinterpret_cast<const char*>(samples), bytes) < 0) {
        qCWarning(lcMedia) << "Audio output write failed";
    }
}

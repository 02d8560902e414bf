#pragma once

#include <QObject>
#include <memory>

class QAudioSink;
class QIODevice;

// Plays the preview mix bus on the default output device. Push mode: the
// scheduler hands over each tick's mixed samples; what the device cannot take
// right now is dropped rather than queued, so preview audio never lags the
// picture.
class PreviewAudioOutput : public QObject {
    Q_OBJECT
public:
    PreviewAudioOutput(int sampleRate, int channels, QObject* parent = nullptr);
    ~PreviewAudioOutput() override;

    bool start();
    void stop();
    bool isActive() const { return m_device != nullptr; }

    void push(const float* samples, int frames);

private:
    int m_sampleRate;
    int m_channels;
    std::unique_ptr<QAudioSink> m_sink;
    QIODevice* m_device = nullptr;   // owned by m_sink
};

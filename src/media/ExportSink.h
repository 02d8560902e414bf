#pragma once

#include <QImage>
#include <QSize>
#include <QString>

struct ExportSettings {
    QString outputPath;
    int width = 0;          // 0 = size of the first composed frame
    int height = 0;
    double fps = 30.0;
    int videoBitrate = 8000000;
    QString videoCodec = "libx264";
    int audioBitrate = 128000;
};

// Destination of an export: composed frames plus the mixed audio bus.
// open() is called once the first frame's size is known. abort() must leave
// no partial output behind.
class ExportSink {
public:
    virtual ~ExportSink() = default;

    virtual bool open(const ExportSettings& settings, const QSize& frameSize,
                      int sampleRate, int channels) = 0;
    // pts in project seconds
    virtual bool writeVideoFrame(const QImage& frame, double pts) = 0;
    // Interleaved float in the format passed to open()
    virtual bool writeAudio(const float* samples, int frames) = 0;
    virtual bool finish() = 0;
    virtual void abort() = 0;

    virtual QString errorString() const = 0;
};

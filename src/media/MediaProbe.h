#pragma once

#include <QObject>
#include <QSize>
#include <QString>

struct MediaInfo {
    QString filePath;
    QString containerFormat;
    double duration = 0.0;   // seconds; longest stream when the container has none

    bool hasVideo = false;
    QSize videoSize;
    double videoFps = 0.0;
    QString videoCodec;

    bool hasAudio = false;
    int audioSampleRate = 0;
    int audioChannels = 0;
    QString audioCodec;
};

// Reads container and stream parameters without decoding. Used to size clips
// when media is attached; a file with neither a video nor an audio stream is
// rejected.
class MediaProbe : public QObject {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe();

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    MediaInfo m_info;
    QString m_error;
};

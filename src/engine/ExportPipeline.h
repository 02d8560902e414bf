#pragma once

#include <QObject>
#include <QImage>
#include <QString>
#include <memory>
#include <set>
#include "ExportSink.h"
#include "AudioMixer.h"
#include "Scheduler.h"

class TimelineModel;
class MediaPool;
class Compositor;

enum class ExportStatus {
    Completed,
    Cancelled,
    Failed
};

struct ExportResult {
    ExportStatus status = ExportStatus::Failed;
    QString outputPath;
    QString error;
    int videoClipsSpliced = 0;
    int audioTracksMixed = 0;
    int textOverlaysRendered = 0;
    double duration = 0.0;
};

// Captures a real-time playthrough from 0 to the project duration. Every
// composed frame and the mixed audio bus are fed to an ExportSink; the sink is
// opened on the first frame, finalized when playback ends and aborted when
// the run is paused, cancelled or fails. A seek or a timeline edit while the
// capture runs cancels it: the output would no longer match the project.
class ExportPipeline : public QObject {
    Q_OBJECT
public:
    ExportPipeline(TimelineModel& model, MediaPool& pool, Scheduler& scheduler,
                   Compositor& compositor, int sampleRate, int channels,
                   QObject* parent = nullptr);
    ~ExportPipeline() override;

    bool start(std::unique_ptr<ExportSink> sink, const ExportSettings& settings);
    void cancel();
    bool isRunning() const { return m_running; }

signals:
    void progress(double fraction);  // 0.0 to 1.0
    void finished(const ExportResult& result);

private slots:
    void onTimeAdvanced(double from, double to);
    void onFrameComposed(const QImage& frame, double time);
    void onPlaybackEnded(double duration);
    void onStateChanged(PlaybackState state);
    void onSeekPerformed(double seconds);
    void onTimelineEdited();

private:
    bool ensureSinkOpen(const QSize& frameSize);
    void writeAudioUntil(double t);
    void complete(double duration);
    void fail(const QString& error);
    void cancelRun(const QString& reason);
    void finishWith(ExportStatus status, const QString& error);

    TimelineModel& m_model;
    MediaPool& m_pool;
    Scheduler& m_scheduler;
    Compositor& m_compositor;
    AudioMixer m_mixer;

    std::unique_ptr<ExportSink> m_sink;
    ExportSettings m_settings;
    bool m_running = false;
    bool m_sinkOpen = false;
    bool m_rewinding = false;       // our own seek to 0 is not a user seek
    double m_duration = 0.0;
    int64_t m_audioFrames = 0;      // bus frames already written
    double m_lastProgress = -1.0;

    std::set<int> m_videoIds;
    std::set<int> m_audioIds;
    std::set<int> m_textIds;
};

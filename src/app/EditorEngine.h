#pragma once

#include <QObject>
#include <QImage>
#include <QString>
#include <memory>
#include <vector>
#include "Clip.h"
#include "EditorConfig.h"
#include "ExportPipeline.h"
#include "TextLayerConfig.h"

class QUndoStack;
class TimelineModel;
class MediaHandleFactory;
class MediaPool;
class MediaSyncController;
class Compositor;
class InteractionController;
class Scheduler;
class AudioMixer;
class PreviewAudioOutput;
class MediaHandle;

// The editor core. One instance owns the timeline, every media handle, the
// sync controller, compositor, scheduler and export pipeline; nothing is
// global. The shell and the tests drive it through this class.
class EditorEngine : public QObject {
    Q_OBJECT
public:
    explicit EditorEngine(const EditorSettings& settings = EditorSettings(),
                          QObject* parent = nullptr);
    // Media comes from the given factory instead of local files
    EditorEngine(const EditorSettings& settings, std::unique_ptr<MediaHandleFactory> factory,
                 QObject* parent = nullptr);
    ~EditorEngine() override;

    const EditorSettings& settings() const { return m_settings; }

    TimelineModel& model() { return *m_model; }
    QUndoStack& undoStack() { return *m_undoStack; }
    MediaPool& mediaPool() { return *m_pool; }
    MediaSyncController& syncController() { return *m_sync; }
    Compositor& compositor() { return *m_compositor; }
    InteractionController& interaction() { return *m_interaction; }
    Scheduler& scheduler() { return *m_scheduler; }

    // Media attachment; the length is probed from the file. -1 on failure.
    int attachVideo(const QString& path);
    int addVideo(const QString& path);
    int addAudio(const QString& path, double start = 0.0);

    // Same with a known media length
    int attachVideo(const QString& path, double mediaDuration);
    int addVideo(const QString& path, double mediaDuration);
    int addAudio(const QString& path, double mediaDuration, double start);

    int addText(const TextPayload& text, double start = 0.0, double end = -1.0);
    // A descriptor with no end, or an end past the project, ends with the project
    int loadTextDescriptors(const std::vector<TextDescriptor>& texts);
    bool loadTextFile(const QString& path);

    // True once no handle is still loading
    bool isMediaSettled() const;

    // Transport
    void play();
    void pause();
    void togglePlayPause();
    void seek(double seconds);
    void tick(double now);
    bool isPlaying() const;
    double currentTime() const;

    // Free-running preview loop
    void startPreview();
    void stopPreview();

    const QImage& renderSurface() const;
    std::vector<Clip> visibleTextClips() const;

    // Captures 0..duration into an MP4 at settings.outputPath. The outcome
    // arrives through exportFinished.
    bool exportProject(const ExportSettings& settings);
    bool exportProject(const ExportSettings& settings, std::unique_ptr<ExportSink> sink);
    void cancelExport();
    bool isExporting() const;

    void setPreviewAudioEnabled(bool enabled);
    bool isPreviewAudioEnabled() const { return m_previewAudioEnabled; }

    QString errorString() const { return m_error; }

signals:
    void frameComposed(const QImage& frame, double time);
    void exportProgress(double fraction);
    void exportFinished(const ExportResult& result);

private slots:
    void onModelChanged();
    void onHandleCreated(const ClipRef& ref, MediaHandle* handle);
    void onTimeAdvanced(double from, double to);
    void onStateChanged();
    void onExportFinished(const ExportResult& result);

private:
    void init(std::unique_ptr<MediaHandleFactory> factory);
    bool probeDuration(const QString& path, double& duration);
    void refreshIfIdle();

    EditorSettings m_settings;
    std::unique_ptr<TimelineModel> m_model;
    std::unique_ptr<QUndoStack> m_undoStack;
    std::unique_ptr<MediaHandleFactory> m_factory;
    std::unique_ptr<MediaPool> m_pool;
    std::unique_ptr<MediaSyncController> m_sync;
    std::unique_ptr<Compositor> m_compositor;
    std::unique_ptr<InteractionController> m_interaction;
    std::unique_ptr<Scheduler> m_scheduler;
    std::unique_ptr<ExportPipeline> m_export;
    std::unique_ptr<AudioMixer> m_mixer;
    std::unique_ptr<PreviewAudioOutput> m_audioOut;

    bool m_previewAudioEnabled = true;
    QString m_error;
};

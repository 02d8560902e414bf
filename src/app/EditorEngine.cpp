#include "EditorEngine.h"
#include "TimelineModel.h"
#include "ActiveElementResolver.h"
#include "InteractionController.h"
#include "MediaHandleFactory.h"
#include "MediaPool.h"
#include "MediaProbe.h"
#include "MediaSyncController.h"
#include "Compositor.h"
#include "Scheduler.h"
#include "AudioMixer.h"
#include "PreviewAudioOutput.h"
#include "FfmpegExportSink.h"
#include "Logging.h"
#include <QUndoStack>
#include <algorithm>

EditorEngine::EditorEngine(const EditorSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    init(std::make_unique<FileMediaFactory>(settings.mixSampleRate, settings.mixChannels));
}

EditorEngine::EditorEngine(const EditorSettings& settings,
                           std::unique_ptr<MediaHandleFactory> factory, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    init(std::move(factory));
}

EditorEngine::~EditorEngine() {
    if (m_scheduler) m_scheduler->stopLoop();
    if (m_audioOut) m_audioOut->stop();
    // Export pipeline and scheduler reference the pool; tear down in reverse
    m_export.reset();
    m_scheduler.reset();
    m_interaction.reset();
    m_sync.reset();
    m_pool.reset();
}

void EditorEngine::init(std::unique_ptr<MediaHandleFactory> factory) {
    m_model = std::make_unique<TimelineModel>();
    m_model->setMinClipDuration(m_settings.minClipDuration);
    m_model->setDefaultTextDuration(m_settings.defaultTextDuration);

    m_undoStack = std::make_unique<QUndoStack>();
    m_factory = std::move(factory);
    m_pool = std::make_unique<MediaPool>(*m_model, *m_factory);

    m_sync = std::make_unique<MediaSyncController>(*m_pool);
    m_sync->setTolerances(m_settings.videoDriftTolerance, m_settings.audioDriftTolerance);

    m_compositor = std::make_unique<Compositor>(m_settings.designSize);
    m_interaction = std::make_unique<InteractionController>(*m_model, *m_undoStack);

    m_scheduler = std::make_unique<Scheduler>(*m_model, *m_sync, *m_compositor);
    m_scheduler->setFps(m_settings.previewFps);

    m_mixer = std::make_unique<AudioMixer>(m_settings.mixSampleRate, m_settings.mixChannels);
    m_export = std::make_unique<ExportPipeline>(*m_model, *m_pool, *m_scheduler, *m_compositor,
                                                m_mixer->sampleRate(), m_mixer->channels());
    m_previewAudioEnabled = m_settings.previewAudio;

    connect(m_scheduler.get(), &Scheduler::frameComposed, this, &EditorEngine::frameComposed);
    connect(m_scheduler.get(), &Scheduler::timeAdvanced, this, &EditorEngine::onTimeAdvanced);
    connect(m_scheduler.get(), &Scheduler::stateChanged, this, &EditorEngine::onStateChanged);
    connect(m_export.get(), &ExportPipeline::progress, this, &EditorEngine::exportProgress);
    connect(m_export.get(), &ExportPipeline::finished, this, &EditorEngine::onExportFinished);

    connect(m_model.get(), &TimelineModel::clipAdded, this, &EditorEngine::onModelChanged);
    connect(m_model.get(), &TimelineModel::clipRemoved, this, &EditorEngine::onModelChanged);
    connect(m_model.get(), &TimelineModel::clipTimingChanged, this, &EditorEngine::onModelChanged);
    connect(m_model.get(), &TimelineModel::clipSourceChanged, this, &EditorEngine::onModelChanged);
    connect(m_model.get(), &TimelineModel::clipPropertiesChanged, this, &EditorEngine::onModelChanged);
    connect(m_pool.get(), &MediaPool::handleCreated, this, &EditorEngine::onHandleCreated);

    qCInfo(lcEngine) << "Engine ready, design size" << m_settings.designSize
                     << "mix" << m_mixer->sampleRate() << "Hz" << m_mixer->channels() << "ch";
}

bool EditorEngine::probeDuration(const QString& path, double& duration) {
    MediaProbe probe;
    if (!probe.probe(path)) {
        m_error = probe.errorString();
        qCWarning(lcMedia) << "Cannot attach" << path << ":" << m_error;
        return false;
    }
    duration = probe.info().duration;
    return true;
}

int EditorEngine::attachVideo(const QString& path) {
    double duration = 0.0;
    if (!probeDuration(path, duration)) return -1;
    return attachVideo(path, duration);
}

int EditorEngine::addVideo(const QString& path) {
    double duration = 0.0;
    if (!probeDuration(path, duration)) return -1;
    return addVideo(path, duration);
}

int EditorEngine::addAudio(const QString& path, double start) {
    double duration = 0.0;
    if (!probeDuration(path, duration)) return -1;
    return addAudio(path, duration, start);
}

int EditorEngine::attachVideo(const QString& path, double mediaDuration) {
    int id = m_model->attachPrimaryVideo(path, mediaDuration);
    // Attachment is not undoable; commands referring to the old timing are stale
    m_undoStack->clear();
    return id;
}

int EditorEngine::addVideo(const QString& path, double mediaDuration) {
    return m_model->addVideoClip(path, mediaDuration);
}

int EditorEngine::addAudio(const QString& path, double mediaDuration, double start) {
    return m_model->addAudioClip(path, mediaDuration, start);
}

int EditorEngine::addText(const TextPayload& text, double start, double end) {
    return m_model->addTextClip(text, start, end);
}

int EditorEngine::loadTextDescriptors(const std::vector<TextDescriptor>& texts) {
    int added = 0;
    for (const auto& desc : texts) {
        double duration = m_model->duration();
        double projectEnd = duration > 0.0 ? duration : AppConstants::FallbackTextEnd;
        double end = desc.end;
        if (end < 0.0 || end > projectEnd) end = projectEnd;
        if (m_model->addTextClip(desc.text, desc.start, end) >= 0) ++added;
    }
    qCInfo(lcTimeline) << "Loaded" << added << "text layers";
    return added;
}

bool EditorEngine::loadTextFile(const QString& path) {
    TextLayerConfig config;
    std::vector<TextDescriptor> texts;
    if (!config.load(path, texts)) {
        m_error = config.errorString();
        qCWarning(lcTimeline) << "Cannot load text layers:" << m_error;
        return false;
    }
    loadTextDescriptors(texts);
    return true;
}

bool EditorEngine::isMediaSettled() const {
    for (MediaHandle* h : m_pool->handles()) {
        if (h->status() == MediaStatus::Loading) return false;
    }
    return true;
}

void EditorEngine::play() {
    m_scheduler->play();
}

void EditorEngine::pause() {
    m_scheduler->pause();
}

void EditorEngine::togglePlayPause() {
    m_scheduler->togglePlayPause();
}

void EditorEngine::seek(double seconds) {
    m_scheduler->seek(seconds);
}

void EditorEngine::tick(double now) {
    m_scheduler->tick(now);
}

bool EditorEngine::isPlaying() const {
    return m_scheduler->isPlaying();
}

double EditorEngine::currentTime() const {
    return m_scheduler->currentTime();
}

void EditorEngine::startPreview() {
    m_scheduler->refresh();
    m_scheduler->startLoop();
}

void EditorEngine::stopPreview() {
    m_scheduler->stopLoop();
}

const QImage& EditorEngine::renderSurface() const {
    return m_compositor->surface();
}

std::vector<Clip> EditorEngine::visibleTextClips() const {
    std::vector<Clip> visible;
    for (const auto& c : m_model->track(ClipType::Text)->clips()) {
        if (c.text()->visible) visible.push_back(c);
    }
    return visible;
}

bool EditorEngine::exportProject(const ExportSettings& settings) {
    if (settings.outputPath.isEmpty()) {
        m_error = "No output path given";
        qCWarning(lcExport) << m_error;
        return false;
    }
    return exportProject(settings, std::make_unique<FfmpegExportSink>());
}

bool EditorEngine::exportProject(const ExportSettings& settings,
                                 std::unique_ptr<ExportSink> sink) {
    if (m_audioOut) m_audioOut->stop();
    if (!m_export->start(std::move(sink), settings)) {
        m_error = "Export could not be started";
        return false;
    }
    return true;
}

void EditorEngine::cancelExport() {
    m_export->cancel();
}

bool EditorEngine::isExporting() const {
    return m_export->isRunning();
}

void EditorEngine::setPreviewAudioEnabled(bool enabled) {
    m_previewAudioEnabled = enabled;
    if (!enabled && m_audioOut) m_audioOut->stop();
}

void EditorEngine::onModelChanged() {
    refreshIfIdle();
}

void EditorEngine::onHandleCreated(const ClipRef& ref, MediaHandle* handle) {
    Q_UNUSED(ref);
    // A handle becoming ready while paused should show up without a tick
    connect(handle, &MediaHandle::statusChanged, this, [this](MediaStatus status) {
        if (status == MediaStatus::Ready) refreshIfIdle();
    });
}

void EditorEngine::refreshIfIdle() {
    if (!m_scheduler || m_scheduler->isPlaying()) return;
    m_scheduler->refresh();
}

void EditorEngine::onTimeAdvanced(double from, double to) {
    if (!m_previewAudioEnabled || !m_audioOut || !m_audioOut->isActive()) return;
    if (m_export->isRunning()) return;

    std::vector<float> bus = m_mixer->mix(m_model->track(ClipType::Audio)->clips(), *m_pool,
                                          from, to);
    if (!bus.empty()) {
        m_audioOut->push(bus.data(), static_cast<int>(bus.size()) / m_mixer->channels());
    }
}

void EditorEngine::onStateChanged() {
    if (m_scheduler->isPlaying() && m_previewAudioEnabled && !m_export->isRunning()) {
        if (!m_audioOut) {
            m_audioOut = std::make_unique<PreviewAudioOutput>(m_mixer->sampleRate(),
                                                              m_mixer->channels());
        }
        if (!m_audioOut->isActive() && !m_audioOut->start()) {
            qCWarning(lcMedia) << "Preview audio unavailable, continuing silently";
        }
    } else if (m_audioOut) {
        m_audioOut->stop();
    }
}

void EditorEngine::onExportFinished(const ExportResult& result) {
    m_scheduler->setFps(m_settings.previewFps);
    emit exportFinished(result);
}

#include "ExportPipeline.h"
#include "TimelineModel.h"
#include "MediaPool.h"
#include "Compositor.h"
#include "Logging.h"
#include <algorithm>

ExportPipeline::ExportPipeline(TimelineModel& model, MediaPool& pool, Scheduler& scheduler,
                               Compositor& compositor, int sampleRate, int channels,
                               QObject* parent)
    : QObject(parent)
    , m_model(model)
    , m_pool(pool)
    , m_scheduler(scheduler)
    , m_compositor(compositor)
    , m_mixer(sampleRate, channels)
{
    connect(&m_scheduler, &Scheduler::timeAdvanced, this, &ExportPipeline::onTimeAdvanced);
    connect(&m_scheduler, &Scheduler::frameComposed, this, &ExportPipeline::onFrameComposed);
    connect(&m_scheduler, &Scheduler::playbackEnded, this, &ExportPipeline::onPlaybackEnded);
    connect(&m_scheduler, &Scheduler::stateChanged, this, &ExportPipeline::onStateChanged);
    connect(&m_scheduler, &Scheduler::seekPerformed, this, &ExportPipeline::onSeekPerformed);

    connect(&m_model, &TimelineModel::clipAdded, this, &ExportPipeline::onTimelineEdited);
    connect(&m_model, &TimelineModel::clipRemoved, this, &ExportPipeline::onTimelineEdited);
    connect(&m_model, &TimelineModel::clipTimingChanged, this, &ExportPipeline::onTimelineEdited);
    connect(&m_model, &TimelineModel::clipSourceChanged, this, &ExportPipeline::onTimelineEdited);
    connect(&m_model, &TimelineModel::clipPropertiesChanged, this, &ExportPipeline::onTimelineEdited);
}

ExportPipeline::~ExportPipeline() {
    if (m_running && m_sink) {
        m_sink->abort();
    }
}

bool ExportPipeline::start(std::unique_ptr<ExportSink> sink, const ExportSettings& settings) {
    if (m_running) {
        qCWarning(lcExport) << "Export already running, request ignored";
        return false;
    }

    m_settings = settings;
    m_sink = std::move(sink);
    m_sinkOpen = false;
    m_audioFrames = 0;
    m_lastProgress = -1.0;
    m_videoIds.clear();
    m_audioIds.clear();
    m_textIds.clear();
    m_duration = m_model.duration();

    if (!m_sink) {
        finishWith(ExportStatus::Failed, "No export destination");
        return false;
    }
    if (m_duration <= 0.0) {
        finishWith(ExportStatus::Failed, "Nothing to export: project is empty");
        return false;
    }

    qCInfo(lcExport) << "Export started:" << settings.outputPath
                     << "duration" << m_duration << "fps" << settings.fps;

    // Rewind before arming so the pause and seek are not taken as a cancel
    m_scheduler.pause();
    m_scheduler.setFps(settings.fps);
    m_running = true;

    // Composes frame 0 synchronously, which opens the sink
    m_rewinding = true;
    m_scheduler.seek(0.0);
    m_rewinding = false;
    if (!m_running) return false;

    m_scheduler.play();
    return m_running;
}

void ExportPipeline::cancel() {
    if (!m_running) return;
    cancelRun("Export cancelled");
}

void ExportPipeline::onTimeAdvanced(double from, double to) {
    Q_UNUSED(from);
    if (!m_running || !m_sinkOpen) return;
    writeAudioUntil(to);
}

void ExportPipeline::onFrameComposed(const QImage& frame, double time) {
    if (!m_running) return;
    if (!ensureSinkOpen(frame.size())) return;

    if (!m_sink->writeVideoFrame(frame, time)) {
        fail(QString("Failed to write video frame at %1s: %2")
                 .arg(time, 0, 'f', 3).arg(m_sink->errorString()));
        return;
    }

    const ActiveSet& active = m_scheduler.lastActiveSet();
    if (active.video) m_videoIds.insert(active.video->id);
    for (int id : m_compositor.lastRenderedText()) m_textIds.insert(id);

    if (m_duration > 0.0) {
        double fraction = std::clamp(time / m_duration, 0.0, 1.0);
        if (fraction - m_lastProgress >= 0.01) {
            m_lastProgress = fraction;
            emit progress(fraction);
        }
    }
}

void ExportPipeline::onPlaybackEnded(double duration) {
    if (!m_running) return;
    complete(duration);
}

void ExportPipeline::onStateChanged(PlaybackState state) {
    if (!m_running || state == PlaybackState::Playing) return;
    cancelRun("Export cancelled: playback was paused");
}

void ExportPipeline::onSeekPerformed(double seconds) {
    if (!m_running || m_rewinding) return;
    cancelRun(QString("Export cancelled: seek to %1s during capture").arg(seconds, 0, 'f', 2));
}

void ExportPipeline::onTimelineEdited() {
    if (!m_running) return;
    cancelRun("Export cancelled: the timeline was edited during capture");
}

bool ExportPipeline::ensureSinkOpen(const QSize& frameSize) {
    if (m_sinkOpen) return true;
    if (!m_sink->open(m_settings, frameSize, m_mixer.sampleRate(), m_mixer.channels())) {
        fail("Failed to open export destination: " + m_sink->errorString());
        return false;
    }
    m_sinkOpen = true;
    qCDebug(lcExport) << "Sink opened at" << frameSize;
    return true;
}

void ExportPipeline::writeAudioUntil(double t) {
    const int64_t target = m_mixer.frameAt(std::min(t, m_duration));
    if (target <= m_audioFrames) return;

    const Track* audioTrack = m_model.track(ClipType::Audio);
    const std::vector<Clip>& clips = audioTrack->clips();

    const double from = static_cast<double>(m_audioFrames) / m_mixer.sampleRate();
    const double to = static_cast<double>(target) / m_mixer.sampleRate();
    for (const auto& c : clips) {
        if (c.start < to && c.end > from && c.volume() > 0.0) {
            MediaHandle* h = m_pool.handle(c.ref());
            if (h && h->isReady() && h->hasAudio()) m_audioIds.insert(c.id);
        }
    }

    const int frames = static_cast<int>(target - m_audioFrames);
    std::vector<float> bus(static_cast<size_t>(frames) * m_mixer.channels());
    m_mixer.mixInto(clips, m_pool, m_audioFrames, bus.data(), frames);
    if (!m_sink->writeAudio(bus.data(), frames)) {
        fail("Failed to write audio: " + m_sink->errorString());
        return;
    }
    m_audioFrames = target;
}

void ExportPipeline::complete(double duration) {
    if (!ensureSinkOpen(m_compositor.surfaceSize())) return;

    writeAudioUntil(duration);
    if (!m_running) return;

    if (!m_sink->finish()) {
        fail("Failed to finalize export: " + m_sink->errorString());
        return;
    }
    emit progress(1.0);
    finishWith(ExportStatus::Completed, QString());
}

void ExportPipeline::fail(const QString& error) {
    qCCritical(lcExport) << error;
    if (m_sink) m_sink->abort();
    finishWith(ExportStatus::Failed, error);
    m_scheduler.pause();
}

void ExportPipeline::cancelRun(const QString& reason) {
    qCInfo(lcExport) << reason;
    if (m_sink) m_sink->abort();
    finishWith(ExportStatus::Cancelled, reason);
    m_scheduler.pause();
}

void ExportPipeline::finishWith(ExportStatus status, const QString& error) {
    m_running = false;
    m_sinkOpen = false;

    ExportResult result;
    result.status = status;
    result.outputPath = m_settings.outputPath;
    result.error = error;
    result.videoClipsSpliced = static_cast<int>(m_videoIds.size());
    result.audioTracksMixed = static_cast<int>(m_audioIds.size());
    result.textOverlaysRendered = static_cast<int>(m_textIds.size());
    result.duration = status == ExportStatus::Completed ? m_duration : 0.0;

    if (status == ExportStatus::Completed) {
        qCInfo(lcExport) << "Export completed:" << result.outputPath
                         << result.videoClipsSpliced << "video clips,"
                         << result.audioTracksMixed << "audio clips,"
                         << result.textOverlaysRendered << "text overlays";
    }

    m_sink.reset();
    emit finished(result);
}

#include <cassert>
#include <cstdio>
#include <cmath>
#include <QGuiApplication>
#include "FakeMedia.h"
#include "app/EditorEngine.h"
#include "timeline/TimelineModel.h"
#include "timeline/InteractionController.h"

static bool near(double a, double b, double eps = 1e-9) { return std::abs(a - b) < eps; }

// Engine with two 4 s video clips (red then blue), a standalone music track
// over the whole project and one title between 1 s and 3 s
struct Project {
    FakeMediaFactory* factory = nullptr;
    std::unique_ptr<EditorEngine> engine;
    std::vector<ExportResult> results;
    std::vector<double> progress;
    int videoA = -1;
    int videoB = -1;
    int music = -1;
    int title = -1;

    explicit Project(bool withContent = true) {
        EditorSettings settings;
        settings.previewAudio = false;
        auto f = std::make_unique<FakeMediaFactory>();
        factory = f.get();
        FakeMediaInfo blue;
        blue.color = Qt::blue;
        factory->setMedia("/media/b.mp4", blue);

        engine = std::make_unique<EditorEngine>(settings, std::move(f));
        QObject::connect(engine.get(), &EditorEngine::exportFinished,
                         [this](const ExportResult& r) { results.push_back(r); });
        QObject::connect(engine.get(), &EditorEngine::exportProgress,
                         [this](double p) { progress.push_back(p); });
        if (!withContent) return;

        videoA = engine->attachVideo("/media/a.mp4", 4.0);
        videoB = engine->addVideo("/media/b.mp4", 4.0);
        music = engine->addAudio("/media/music.mp3", 8.0, 0.0);
        TextPayload t;
        t.content = "Title";
        t.anchor = QPointF(540.0, 200.0);
        title = engine->addText(t, 1.0, 3.0);
    }

    // Wall-clock ticks every step seconds starting at 100
    void run(double until, double step = 0.1) {
        engine->tick(100.0);
        for (int k = 1; 100.0 + k * step <= 100.0 + until + 1e-9; ++k) {
            engine->tick(100.0 + k * step);
            if (!engine->isExporting()) break;
        }
    }
};

static ExportSettings settingsFor(const QString& path) {
    ExportSettings s;
    s.outputPath = path;
    s.fps = 30.0;
    return s;
}

void test_export_completes_with_counts() {
    Project p;
    SinkLog log;
    assert(p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                   std::make_unique<RecordingSink>(log)));
    assert(p.engine->isExporting());
    assert(p.engine->isPlaying());
    // Frame 0 went out with the rewind and opened the sink
    assert(log.opened);
    assert(log.frameSize == QSize(540, 960));
    assert(log.sampleRate == 48000 && log.channels == 2);
    assert(log.framePts.size() == 1 && log.framePts[0] == 0.0);

    p.run(9.0);

    assert(p.results.size() == 1);
    const ExportResult& r = p.results[0];
    assert(r.status == ExportStatus::Completed);
    assert(r.outputPath == "/tmp/out.mp4");
    assert(r.error.isEmpty());
    assert(near(r.duration, 8.0));
    assert(r.videoClipsSpliced == 2);
    // Two clip-linked tracks plus the music
    assert(r.audioTracksMixed == 3);
    assert(r.textOverlaysRendered == 1);

    assert(log.finished && !log.aborted && log.destroyed);
    assert(log.audioFrames == 8 * 48000);
    // Linked audio at full volume plus music at 0.8, each at level 0.25
    assert(std::abs(log.peak - 0.45f) < 1e-5f);

    for (size_t i = 1; i < log.framePts.size(); ++i) {
        assert(log.framePts[i] >= log.framePts[i - 1]);
        assert(log.framePts[i] < 8.0);
        QColor expected = log.framePts[i] < 4.0 ? QColor(Qt::red) : QColor(Qt::blue);
        assert(QColor(log.centerPixels[i]) == expected);
    }
    assert(log.framePts.back() > 7.5);

    assert(!p.progress.empty() && p.progress.back() == 1.0);
    for (size_t i = 1; i < p.progress.size(); ++i) assert(p.progress[i] >= p.progress[i - 1]);

    // Transport went back to the start and the preview rate is restored
    assert(!p.engine->isExporting());
    assert(!p.engine->isPlaying());
    assert(near(p.engine->currentTime(), 0.0));
    assert(near(p.engine->scheduler().fps(), p.engine->settings().previewFps));
    printf("PASS: test_export_completes_with_counts\n");
}

void test_pause_cancels_export() {
    Project p;
    SinkLog log;
    assert(p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                   std::make_unique<RecordingSink>(log)));
    p.run(2.0);
    assert(p.engine->isExporting());

    p.engine->pause();
    assert(p.results.size() == 1);
    assert(p.results[0].status == ExportStatus::Cancelled);
    assert(near(p.results[0].duration, 0.0));
    assert(log.aborted && !log.finished && log.destroyed);
    assert(!p.engine->isExporting());

    // Further ticks do not reach the released sink
    size_t frames = log.framePts.size();
    p.engine->play();
    p.engine->tick(500.0);
    p.engine->tick(500.5);
    assert(log.framePts.size() == frames);
    printf("PASS: test_pause_cancels_export\n");
}

void test_cancel_export() {
    Project p;
    SinkLog log;
    assert(p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                   std::make_unique<RecordingSink>(log)));
    p.run(1.0);
    p.engine->cancelExport();
    assert(p.results.size() == 1);
    assert(p.results[0].status == ExportStatus::Cancelled);
    assert(log.aborted);
    assert(!p.engine->isPlaying());

    // A second export can start afterwards
    SinkLog again;
    assert(p.engine->exportProject(settingsFor("/tmp/again.mp4"),
                                   std::make_unique<RecordingSink>(again)));
    p.run(9.0);
    assert(p.results.size() == 2);
    assert(p.results[1].status == ExportStatus::Completed);
    assert(again.finished);
    printf("PASS: test_cancel_export\n");
}

void test_sink_open_failure() {
    Project p;
    SinkLog log;
    log.failOpen = true;
    assert(!p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                    std::make_unique<RecordingSink>(log)));
    assert(p.results.size() == 1);
    assert(p.results[0].status == ExportStatus::Failed);
    assert(p.results[0].error.contains("disk full"));
    assert(!p.engine->errorString().isEmpty());
    assert(!p.engine->isExporting());
    assert(!p.engine->isPlaying());
    printf("PASS: test_sink_open_failure\n");
}

void test_write_failure_mid_export() {
    Project p;
    SinkLog log;
    log.failAtFrame = 5;
    assert(p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                   std::make_unique<RecordingSink>(log)));
    p.run(9.0);
    assert(p.results.size() == 1);
    assert(p.results[0].status == ExportStatus::Failed);
    assert(p.results[0].error.contains("encoder rejected frame"));
    assert(log.aborted && !log.finished);
    assert(log.framePts.size() == 5);
    assert(!p.engine->isPlaying());
    printf("PASS: test_write_failure_mid_export\n");
}

void test_empty_project_is_rejected() {
    Project p(false);
    SinkLog log;
    assert(!p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                    std::make_unique<RecordingSink>(log)));
    assert(p.results.size() == 1);
    assert(p.results[0].status == ExportStatus::Failed);
    assert(!log.opened);

    // The file-backed overload needs a destination
    assert(!p.engine->exportProject(ExportSettings()));
    assert(p.results.size() == 1);
    printf("PASS: test_empty_project_is_rejected\n");
}

void test_export_starts_from_zero_after_seek() {
    Project p;
    p.engine->seek(5.0);
    SinkLog log;
    assert(p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                   std::make_unique<RecordingSink>(log)));
    assert(log.framePts.front() == 0.0);
    assert(QColor(log.centerPixels.front()) == QColor(Qt::red));
    p.run(9.0);
    assert(p.results.size() == 1 && p.results[0].status == ExportStatus::Completed);
    printf("PASS: test_export_starts_from_zero_after_seek\n");
}

void test_timeline_edit_cancels_export() {
    Project p;
    SinkLog log;
    assert(p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                   std::make_unique<RecordingSink>(log)));
    p.run(2.0);
    assert(p.engine->isExporting());

    // Appending a clip stretches the project past what was captured so far
    assert(p.engine->addVideo("/media/c.mp4", 4.0) >= 0);
    assert(near(p.engine->model().duration(), 12.0));
    assert(p.results.size() == 1);
    assert(p.results[0].status == ExportStatus::Cancelled);
    assert(p.results[0].error.contains("edited"));
    assert(log.aborted && !log.finished && log.destroyed);
    assert(!p.engine->isExporting());
    assert(!p.engine->isPlaying());

    // Nothing completes later on
    p.engine->play();
    p.engine->tick(600.0);
    p.engine->tick(620.0);
    assert(p.results.size() == 1);

    // Edits that keep the duration also cancel
    Project q;
    SinkLog qlog;
    assert(q.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                   std::make_unique<RecordingSink>(qlog)));
    q.run(1.0);
    assert(q.engine->interaction().setClipTiming(ClipRef{ClipType::Text, q.title}, 2.0, 3.0));
    assert(q.results.size() == 1);
    assert(q.results[0].status == ExportStatus::Cancelled);
    assert(qlog.aborted);
    printf("PASS: test_timeline_edit_cancels_export\n");
}

void test_seek_cancels_export() {
    Project p;
    SinkLog log;
    assert(p.engine->exportProject(settingsFor("/tmp/out.mp4"),
                                   std::make_unique<RecordingSink>(log)));
    // The rewind at start is not a user seek
    assert(p.results.empty());
    p.run(2.0);

    p.engine->seek(5.0);
    assert(p.results.size() == 1);
    assert(p.results[0].status == ExportStatus::Cancelled);
    assert(p.results[0].error.contains("seek"));
    assert(log.aborted && !log.finished);
    assert(!p.engine->isExporting());
    assert(!p.engine->isPlaying());
    // The seek itself still lands
    assert(near(p.engine->currentTime(), 5.0));
    for (double pts : log.framePts) assert(pts < 2.5);
    printf("PASS: test_seek_cancels_export\n");
}

int main(int argc, char* argv[]) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    test_export_completes_with_counts();
    test_pause_cancels_export();
    test_cancel_export();
    test_sink_open_failure();
    test_write_failure_mid_export();
    test_empty_project_is_rejected();
    test_export_starts_from_zero_after_seek();
    test_timeline_edit_cancels_export();
    test_seek_cancels_export();
    printf("All export pipeline tests passed.\n");
    return 0;
}

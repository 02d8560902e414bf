#include <cassert>
#include <cstdio>
#include <cmath>
#include <QCoreApplication>
#include "FakeMedia.h"
#include "engine/MediaSyncController.h"
#include "timeline/ActiveElementResolver.h"
#include "timeline/TimelineModel.h"

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

struct Fixture {
    TimelineModel model;
    FakeMediaFactory factory;
    MediaPool pool{model, factory};
    MediaSyncController sync{pool};

    void at(double t, bool playing) {
        sync.synchronize(ActiveElementResolver::resolve(model, t), playing);
    }
};

void test_entering_video_is_started_at_local_offset() {
    Fixture f;
    int a = f.model.attachPrimaryVideo("/media/a.mp4", 4.0);
    int b = f.model.addVideoClip("/media/b.mp4", 4.0);
    f.model.setVideoSpeed(b, 2.0);

    f.at(0.5, true);
    FakeMediaHandle* ha = fakeHandle(f.pool, {ClipType::Video, a});
    assert(f.sync.activeVideo() == (ClipRef{ClipType::Video, a}));
    assert(near(ha->lastSeek, 0.5));
    assert(!ha->isPaused());

    // Cut to b at 5.0: local = (5 - 4) * 2
    f.at(5.0, true);
    FakeMediaHandle* hb = fakeHandle(f.pool, {ClipType::Video, b});
    assert(ha->isPaused());
    assert(near(hb->lastSeek, 2.0));
    assert(near(hb->playbackRate(), 2.0));
    assert(!hb->isPaused());
    assert(f.sync.activeVideoHandle() == hb);
    printf("PASS: test_entering_video_is_started_at_local_offset\n");
}

void test_drift_correction_respects_tolerance() {
    Fixture f;
    int v = f.model.attachPrimaryVideo("/media/a.mp4", 10.0);
    f.at(1.0, true);
    FakeMediaHandle* h = fakeHandle(f.pool, {ClipType::Video, v});
    int seeks = h->seekCount;

    // Within 0.1 s of expected: left alone
    h->setPosition(2.05);
    f.at(2.0, true);
    assert(h->seekCount == seeks);

    // Beyond tolerance: reseek to expected
    h->setPosition(2.5);
    f.at(2.2, true);
    assert(h->seekCount == seeks + 1);
    assert(near(h->lastSeek, 2.2));

    // Audio uses the wider tolerance
    FakeMediaHandle* audio = fakeHandle(f.pool, {ClipType::Audio, v});
    int audioSeeks = audio->seekCount;
    audio->setPosition(3.15);
    f.at(3.0, true);
    assert(audio->seekCount == audioSeeks);
    audio->setPosition(3.5);
    f.at(3.1, true);
    assert(audio->seekCount == audioSeeks + 1);
    printf("PASS: test_drift_correction_respects_tolerance\n");
}

void test_play_state_follows_transport() {
    Fixture f;
    int v = f.model.attachPrimaryVideo("/media/a.mp4", 10.0);
    f.at(1.0, false);
    FakeMediaHandle* h = fakeHandle(f.pool, {ClipType::Video, v});
    assert(h->isPaused());

    f.at(1.0, true);
    assert(!h->isPaused());

    f.at(1.0, false);
    assert(h->isPaused());
    printf("PASS: test_play_state_follows_transport\n");
}

void test_audio_entering_before_ready_is_pending() {
    Fixture f;
    FakeMediaInfo slow;
    slow.ready = false;
    f.factory.setMedia("/media/music.mp3", slow);

    int music = f.model.addAudioClip("/media/music.mp3", 10.0, 1.0);
    ClipRef ref{ClipType::Audio, music};

    f.at(2.0, true);
    assert(f.sync.isAudioPending(ref));
    assert(!f.sync.isAudioStarted(ref));

    FakeMediaHandle* h = fakeHandle(f.pool, ref);
    h->makeReady();
    f.at(2.5, true);
    assert(f.sync.isAudioStarted(ref));
    assert(!f.sync.isAudioPending(ref));
    assert(near(h->lastSeek, 1.5));
    assert(!h->isPaused());

    // Leaving pauses it
    f.at(11.5, true);
    assert(!f.sync.isAudioStarted(ref));
    assert(h->isPaused());
    printf("PASS: test_audio_entering_before_ready_is_pending\n");
}

void test_reloading_audio_waits_until_ready() {
    Fixture f;
    FakeMediaInfo slow;
    slow.ready = false;
    f.factory.setMedia("/media/new.mp4", slow);

    int v = f.model.attachPrimaryVideo("/media/a.mp4", 10.0);
    ClipRef audioRef{ClipType::Audio, v};
    f.at(1.0, true);
    assert(f.sync.isAudioStarted(audioRef));

    // Swapping the source rebuilds both handles under the same refs
    assert(f.model.replacePrimaryVideo("/media/new.mp4", 10.0));
    FakeMediaHandle* audio = fakeHandle(f.pool, audioRef);
    FakeMediaHandle* video = fakeHandle(f.pool, {ClipType::Video, v});
    assert(audio->status() == MediaStatus::Loading);

    f.at(2.0, true);
    assert(audio->seekCount == 0 && audio->playCount == 0);
    assert(video->seekCount == 0 && video->playCount == 0);
    assert(f.sync.isAudioPending(audioRef));
    assert(!f.sync.isAudioStarted(audioRef));

    // Once loaded both start at the current local offset
    audio->makeReady();
    video->makeReady();
    f.at(2.5, true);
    assert(f.sync.isAudioStarted(audioRef));
    assert(!f.sync.isAudioPending(audioRef));
    assert(near(audio->lastSeek, 2.5) && !audio->isPaused());
    assert(near(video->lastSeek, 2.5) && !video->isPaused());
    printf("PASS: test_reloading_audio_waits_until_ready\n");
}

void test_failed_media_is_skipped() {
    Fixture f;
    FakeMediaInfo broken;
    broken.failed = true;
    f.factory.setMedia("/media/broken.mp4", broken);

    int v = f.model.attachPrimaryVideo("/media/broken.mp4", 10.0);
    f.at(1.0, true);
    FakeMediaHandle* h = fakeHandle(f.pool, {ClipType::Video, v});
    assert(h->status() == MediaStatus::Failed);
    assert(h->seekCount == 0 && h->playCount == 0);
    assert(!f.sync.isAudioStarted({ClipType::Audio, v}));

    // Commands sent anyway are dropped
    h->play();
    assert(h->playCount == 0);
    printf("PASS: test_failed_media_is_skipped\n");
}

void test_source_shorter_than_clip_pauses_at_end() {
    Fixture f;
    FakeMediaInfo shortMedia;
    shortMedia.duration = 3.0;
    f.factory.setMedia("/media/short.mp4", shortMedia);

    int v = f.model.attachPrimaryVideo("/media/short.mp4", 3.0);
    f.model.setClipBounds({ClipType::Video, v}, 0.0, 6.0);

    f.at(1.0, true);
    FakeMediaHandle* h = fakeHandle(f.pool, {ClipType::Video, v});
    assert(!h->isPaused());
    int seeks = h->seekCount;

    f.at(4.0, true);
    assert(h->isPaused());
    assert(h->seekCount == seeks);
    printf("PASS: test_source_shorter_than_clip_pauses_at_end\n");
}

void test_pause_all_restarts_on_next_sync() {
    Fixture f;
    int v = f.model.attachPrimaryVideo("/media/a.mp4", 10.0);
    f.at(1.0, true);
    FakeMediaHandle* h = fakeHandle(f.pool, {ClipType::Video, v});

    f.sync.pauseAll();
    assert(h->isPaused());
    assert(!f.sync.activeVideo().isValid());

    int seeks = h->seekCount;
    f.at(4.0, true);
    assert(h->seekCount == seeks + 1);
    assert(near(h->lastSeek, 4.0));
    printf("PASS: test_pause_all_restarts_on_next_sync\n");
}

void test_expected_position() {
    Clip c;
    c.start = 2.0;
    c.end = 8.0;
    VideoPayload vp;
    vp.speed = 1.5;
    c.payload = vp;
    assert(near(MediaSyncController::expectedPosition(c, 4.0), 3.0));
    assert(near(MediaSyncController::expectedPosition(c, 1.0), 0.0));
    printf("PASS: test_expected_position\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    test_entering_video_is_started_at_local_offset();
    test_drift_correction_respects_tolerance();
    test_play_state_follows_transport();
    test_audio_entering_before_ready_is_pending();
    test_reloading_audio_waits_until_ready();
    test_failed_media_is_skipped();
    test_source_shorter_than_clip_pauses_at_end();
    test_pause_all_restarts_on_next_sync();
    test_expected_position();
    printf("All media sync tests passed.\n");
    return 0;
}

#include <cassert>
#include <cstdio>
#include <cmath>
#include <vector>
#include "timeline/TimelineModel.h"
#include "app/AppConstants.h"

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

void test_attach_primary_creates_linked_audio() {
    TimelineModel model;
    int id = model.attachPrimaryVideo("/media/clip.mp4", 12.0);

    const Clip* video = model.findClip({ClipType::Video, id});
    const Clip* audio = model.findClip({ClipType::Audio, id});
    assert(video && audio);
    assert(video->isPrimaryVideo());
    assert(audio->isLinkedAudio());
    assert(near(video->start, 0.0) && near(video->end, 12.0));
    assert(near(audio->start, video->start) && near(audio->end, video->end));
    assert(near(audio->volume(), 1.0));
    assert(near(model.duration(), 12.0));
    printf("PASS: test_attach_primary_creates_linked_audio\n");
}

void test_added_video_appends_at_duration() {
    TimelineModel model;
    model.attachPrimaryVideo("/media/a.mp4", 5.0);
    int second = model.addVideoClip("/media/b.mp4", 3.0);

    const Clip* v = model.findClip({ClipType::Video, second});
    assert(near(v->start, 5.0) && near(v->end, 8.0));
    assert(model.linkedAudioFor(second) != nullptr);
    assert(near(model.duration(), 8.0));
    printf("PASS: test_added_video_appends_at_duration\n");
}

void test_standalone_audio_defaults() {
    TimelineModel model;
    int id = model.addAudioClip("/media/music.mp3", 30.0);
    const Clip* a = model.findClip({ClipType::Audio, id});
    assert(near(a->start, 0.0));
    assert(near(a->volume(), AppConstants::StandaloneAudioVolume));
    assert(!a->isLinkedAudio());
    printf("PASS: test_standalone_audio_defaults\n");
}

void test_bounds_enforce_minimum_and_start() {
    TimelineModel model;
    int id = model.addAudioClip("/media/music.mp3", 10.0);
    ClipRef ref{ClipType::Audio, id};

    assert(model.setClipBounds(ref, -4.0, 2.0));
    const Clip* a = model.findClip(ref);
    assert(near(a->start, 0.0) && near(a->end, 2.0));

    assert(model.setClipBounds(ref, 3.0, 3.01));
    assert(near(a->start, 3.0));
    assert(a->end - a->start >= model.minClipDuration() - 1e-12);

    assert(!model.setClipBounds(ref, NAN, 4.0));
    assert(!model.setClipBounds({ClipType::Audio, 999}, 0.0, 1.0));
    printf("PASS: test_bounds_enforce_minimum_and_start\n");
}

void test_linked_audio_moves_with_video() {
    TimelineModel model;
    int id = model.attachPrimaryVideo("/media/clip.mp4", 10.0);

    int notified = 0;
    QObject::connect(&model, &TimelineModel::clipTimingChanged,
                     [&](const ClipRef& ref, double s, double e) {
        // Both sides are already written when the first signal goes out
        const Clip* v = model.findClip({ClipType::Video, ref.id});
        const Clip* a = model.findClip({ClipType::Audio, ref.id});
        assert(near(v->start, s) && near(a->start, s));
        assert(near(v->end, e) && near(a->end, e));
        ++notified;
    });

    model.setClipBounds({ClipType::Video, id}, 2.0, 6.0);
    assert(notified == 2);

    // Writing the audio side drives the parent
    model.setClipBounds({ClipType::Audio, id}, 1.0, 4.0);
    const Clip* v = model.findClip({ClipType::Video, id});
    assert(near(v->start, 1.0) && near(v->end, 4.0));
    printf("PASS: test_linked_audio_moves_with_video\n");
}

void test_duration_is_derived() {
    TimelineModel model;
    double lastSignal = -1.0;
    QObject::connect(&model, &TimelineModel::durationChanged,
                     [&](double d) { lastSignal = d; });

    int id = model.attachPrimaryVideo("/media/clip.mp4", 10.0);
    assert(near(lastSignal, 10.0));

    TextPayload t;
    t.content = "late";
    model.addTextClip(t, 9.0, 14.0);
    assert(near(model.duration(), 14.0));

    model.setClipBounds({ClipType::Video, id}, 0.0, 20.0);
    assert(near(model.duration(), 20.0));
    assert(near(lastSignal, 20.0));
    printf("PASS: test_duration_is_derived\n");
}

void test_text_default_span() {
    TimelineModel empty;
    TextPayload t;
    t.content = "hello";
    int a = empty.addTextClip(t);
    const Clip* ca = empty.findClip({ClipType::Text, a});
    assert(near(ca->end - ca->start, 3.0));

    TimelineModel shortProject;
    shortProject.attachPrimaryVideo("/media/clip.mp4", 2.0);
    int b = shortProject.addTextClip(t);
    const Clip* cb = shortProject.findClip({ClipType::Text, b});
    assert(near(cb->start, 0.0) && near(cb->end, 2.0));

    // Anchor and size defaults
    assert(near(cb->text()->anchor.x(), 540.0) && near(cb->text()->anchor.y(), 960.0));
    assert(near(cb->text()->size, 48.0));
    printf("PASS: test_text_default_span\n");
}

void test_removal_rules() {
    TimelineModel model;
    int primary = model.attachPrimaryVideo("/media/a.mp4", 5.0);
    int second = model.addVideoClip("/media/b.mp4", 5.0);

    QString reason;
    assert(!model.canRemoveClip({ClipType::Video, primary}, &reason));
    assert(!model.canRemoveClip({ClipType::Audio, second}, &reason));
    assert(reason.contains("delete the video clip"));

    // Orphaned audio deletion is a no-op
    assert(model.removeClip({ClipType::Audio, second}).empty());
    assert(model.findClip({ClipType::Audio, second}) != nullptr);

    // Video deletion cascades to its audio
    std::vector<RemovedClip> removed = model.removeClip({ClipType::Video, second});
    assert(removed.size() == 2);
    assert(model.findClip({ClipType::Video, second}) == nullptr);
    assert(model.findClip({ClipType::Audio, second}) == nullptr);
    assert(near(model.duration(), 5.0));

    model.restoreClips(removed);
    const Clip* v = model.findClip({ClipType::Video, second});
    const Clip* a = model.findClip({ClipType::Audio, second});
    assert(v && a && a->isLinkedAudio());
    assert(near(v->start, 5.0) && near(a->end, 10.0));
    printf("PASS: test_removal_rules\n");
}

void test_replace_primary_keeps_id_and_start() {
    TimelineModel model;
    int id = model.attachPrimaryVideo("/media/a.mp4", 5.0);
    model.setClipBounds({ClipType::Video, id}, 1.0, 6.0);

    int sourceChanges = 0;
    QObject::connect(&model, &TimelineModel::clipSourceChanged,
                     [&](const ClipRef&) { ++sourceChanges; });

    int again = model.attachPrimaryVideo("/media/b.mp4", 8.0);
    assert(again == id);
    const Clip* v = model.findClip({ClipType::Video, id});
    const Clip* a = model.findClip({ClipType::Audio, id});
    assert(v->sourcePath() == "/media/b.mp4" && a->sourcePath() == "/media/b.mp4");
    assert(near(v->start, 1.0) && near(v->end, 9.0));
    assert(near(a->start, 1.0) && near(a->end, 9.0));
    assert(sourceChanges == 2);
    assert(model.track(ClipType::Video)->clipCount() == 1);
    printf("PASS: test_replace_primary_keeps_id_and_start\n");
}

void test_text_visibility_is_half_open() {
    TimelineModel model;
    TextPayload t;
    t.content = "caption";
    int id = model.addTextClip(t, 2.0, 4.0);
    const Clip* c = model.findClip({ClipType::Text, id});

    model.refreshTextVisibility(1.999);
    assert(!c->text()->visible);
    model.refreshTextVisibility(2.0);
    assert(c->text()->visible);
    model.refreshTextVisibility(4.0);
    assert(!c->text()->visible);
    printf("PASS: test_text_visibility_is_half_open\n");
}

void test_speed_and_volume_mirror_to_linked_audio() {
    TimelineModel model;
    int id = model.attachPrimaryVideo("/media/a.mp4", 5.0);
    std::vector<ClipRef> changed;
    int timingChanges = 0;
    QObject::connect(&model, &TimelineModel::clipPropertiesChanged,
                     [&](const ClipRef& ref) { changed.push_back(ref); });
    QObject::connect(&model, &TimelineModel::clipTimingChanged,
                     [&](const ClipRef&, double, double) { ++timingChanges; });

    assert(model.setVideoSpeed(id, 2.0));
    assert(!model.setVideoSpeed(id, 0.0));
    assert(near(model.findClip({ClipType::Audio, id})->speed(), 2.0));
    assert(changed.size() == 2);
    assert(changed[0] == (ClipRef{ClipType::Video, id}));
    assert(changed[1] == (ClipRef{ClipType::Audio, id}));

    // Unchanged values stay quiet
    assert(model.setVideoSpeed(id, 2.0));
    assert(changed.size() == 2);

    assert(model.setClipVolume({ClipType::Video, id}, 1.7));
    assert(near(model.findClip({ClipType::Video, id})->volume(), 1.0));
    assert(changed.size() == 2);
    model.setClipVolume({ClipType::Video, id}, 0.3);
    assert(near(model.findClip({ClipType::Audio, id})->volume(), 0.3));
    assert(changed.size() == 4);

    // Neither moves the clip
    assert(timingChanges == 0);
    assert(near(model.duration(), 5.0));
    printf("PASS: test_speed_and_volume_mirror_to_linked_audio\n");
}

int main() {
    test_attach_primary_creates_linked_audio();
    test_added_video_appends_at_duration();
    test_standalone_audio_defaults();
    test_bounds_enforce_minimum_and_start();
    test_linked_audio_moves_with_video();
    test_duration_is_derived();
    test_text_default_span();
    test_removal_rules();
    test_replace_primary_keeps_id_and_start();
    test_text_visibility_is_half_open();
    test_speed_and_volume_mirror_to_linked_audio();
    printf("All timeline model tests passed.\n");
    return 0;
}

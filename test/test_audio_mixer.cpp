#include <cassert>
#include <cstdio>
#include <cmath>
#include <QCoreApplication>
#include "FakeMedia.h"
#include "engine/AudioMixer.h"
#include "timeline/TimelineModel.h"

static bool near(float a, float b) { return std::abs(a - b) < 1e-5f; }

static const std::vector<Clip>& audioClips(const TimelineModel& model) {
    return model.track(ClipType::Audio)->clips();
}

void test_frame_index() {
    AudioMixer mixer(48000, 2);
    assert(mixer.frameAt(0.0) == 0);
    assert(mixer.frameAt(1.5) == 72000);
    assert(mixer.frameAt(-2.0) == 0);

    AudioMixer fallback(0, 0);
    assert(fallback.sampleRate() == 48000);
    assert(fallback.channels() == 2);
    printf("PASS: test_frame_index\n");
}

void test_volume_weighted_sum() {
    TimelineModel model;
    FakeMediaFactory factory;
    FakeMediaInfo a;
    a.level = 0.5f;
    FakeMediaInfo b;
    b.level = 0.25f;
    factory.setMedia("/media/a.mp3", a);
    factory.setMedia("/media/b.mp3", b);
    MediaPool pool(model, factory);

    model.addAudioClip("/media/a.mp3", 10.0, 0.0, 0.5);
    model.addAudioClip("/media/b.mp3", 10.0, 0.0, 1.0);

    AudioMixer mixer(1000, 2);
    std::vector<float> bus = mixer.mix(audioClips(model), pool, 1.0, 2.0);
    assert(bus.size() == 2000);
    // 0.5 * 0.5 + 0.25 * 1.0
    for (float s : bus) assert(near(s, 0.5f));
    printf("PASS: test_volume_weighted_sum\n");
}

void test_sum_is_clamped() {
    TimelineModel model;
    FakeMediaFactory factory;
    FakeMediaInfo loud;
    loud.level = 0.9f;
    factory.setMedia("/media/loud.mp3", loud);
    MediaPool pool(model, factory);

    model.addAudioClip("/media/loud.mp3", 10.0, 0.0, 1.0);
    model.addAudioClip("/media/loud.mp3", 10.0, 0.0, 1.0);

    AudioMixer mixer(1000, 2);
    std::vector<float> bus = mixer.mix(audioClips(model), pool, 0.0, 0.5);
    assert(!bus.empty());
    for (float s : bus) assert(near(s, 1.0f));
    printf("PASS: test_sum_is_clamped\n");
}

void test_not_ready_and_muted_are_silent() {
    TimelineModel model;
    FakeMediaFactory factory;
    FakeMediaInfo loading;
    loading.ready = false;
    factory.setMedia("/media/loading.mp3", loading);
    MediaPool pool(model, factory);

    model.addAudioClip("/media/loading.mp3", 10.0, 0.0, 1.0);
    int muted = model.addAudioClip("/media/quiet.mp3", 10.0, 0.0, 1.0);
    model.setClipVolume({ClipType::Audio, muted}, 0.0);

    AudioMixer mixer(1000, 2);
    std::vector<float> bus = mixer.mix(audioClips(model), pool, 0.0, 1.0);
    assert(bus.size() == 2000);
    for (float s : bus) assert(s == 0.0f);
    assert(fakeHandle(pool, {ClipType::Audio, muted})->audioReads() == 0);
    printf("PASS: test_not_ready_and_muted_are_silent\n");
}

void test_partial_overlap() {
    TimelineModel model;
    FakeMediaFactory factory;
    MediaPool pool(model, factory);

    // [1.5, 11.5) at the default level 0.25 and full volume
    model.addAudioClip("/media/late.mp3", 10.0, 1.5, 1.0);

    AudioMixer mixer(1000, 2);
    std::vector<float> bus = mixer.mix(audioClips(model), pool, 1.0, 2.0);
    assert(bus.size() == 2000);
    // First 500 frames precede the clip
    for (int i = 0; i < 500 * 2; ++i) assert(bus[i] == 0.0f);
    for (int i = 500 * 2; i < 1000 * 2; ++i) assert(near(bus[i], 0.25f));

    // Empty span
    assert(mixer.mix(audioClips(model), pool, 2.0, 2.0).empty());
    printf("PASS: test_partial_overlap\n");
}

void test_mix_into_overwrites() {
    TimelineModel model;
    FakeMediaFactory factory;
    MediaPool pool(model, factory);

    AudioMixer mixer(1000, 2);
    std::vector<float> out(200, 0.7f);
    mixer.mixInto(audioClips(model), pool, 0, out.data(), 100);
    for (float s : out) assert(s == 0.0f);
    printf("PASS: test_mix_into_overwrites\n");
}

void test_mix_into_empty_span_leaves_buffer() {
    TimelineModel model;
    FakeMediaFactory factory;
    MediaPool pool(model, factory);
    model.addAudioClip("/media/music.mp3", 10.0, 0.0);

    AudioMixer mixer(1000, 2);
    std::vector<float> out(20, 0.7f);
    mixer.mixInto(audioClips(model), pool, 0, out.data(), 0);
    for (float s : out) assert(s == 0.7f);
    // A negative count is an empty span, not a huge one
    mixer.mixInto(audioClips(model), pool, 0, out.data() + 10, -5);
    for (float s : out) assert(s == 0.7f);
    mixer.mixInto(audioClips(model), pool, 0, nullptr, 0);
    printf("PASS: test_mix_into_empty_span_leaves_buffer\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    test_frame_index();
    test_volume_weighted_sum();
    test_sum_is_clamped();
    test_not_ready_and_muted_are_silent();
    test_partial_overlap();
    test_mix_into_overwrites();
    test_mix_into_empty_span_leaves_buffer();
    printf("All audio mixer tests passed.\n");
    return 0;
}

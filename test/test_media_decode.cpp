#include <cassert>
#include <cstdio>
#include <cmath>
#include <vector>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QFileInfo>
#include "media/MediaProbe.h"
#include "media/VideoDecoder.h"
#include "media/AudioDecoder.h"
#include "media/AudioFileHandle.h"
#include "media/VideoFileHandle.h"

// A short clip with video and audio. Override with REELFORGE_TEST_MEDIA.
static QString testVideo() {
    QByteArray env = qgetenv("REELFORGE_TEST_MEDIA");
    return env.isEmpty() ? QStringLiteral("../testdata/sample.mp4") : QString::fromLocal8Bit(env);
}

static bool haveTestVideo() {
    return QFileInfo::exists(testVideo());
}

static void waitForStatus(MediaHandle& h, int timeoutMs = 5000) {
    QElapsedTimer timer;
    timer.start();
    while (h.status() == MediaStatus::Loading && timer.elapsed() < timeoutMs) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
    }
}

void test_missing_file_fails() {
    printf("=== test_missing_file_fails ===\n");

    MediaProbe probe;
    assert(!probe.probe("/nonexistent/clip.mp4"));
    assert(!probe.errorString().isEmpty());

    VideoDecoder video;
    assert(!video.open("/nonexistent/clip.mp4"));
    assert(!video.isOpen());

    VideoFileHandle handle("/nonexistent/clip.mp4");
    assert(handle.status() == MediaStatus::Failed);
    // Commands on a failed handle are dropped
    handle.play();
    assert(handle.isPaused());

    AudioFileHandle audio("/nonexistent/clip.mp4", 48000, 2);
    waitForStatus(audio);
    assert(audio.status() == MediaStatus::Failed);
    std::vector<float> buf(200, 0.5f);
    assert(audio.readAudio(0.0, 1.0, buf.data(), 100) == 0);

    printf("PASS: test_missing_file_fails\n\n");
}

void test_media_probe() {
    printf("=== test_media_probe ===\n");

#ifdef HAS_FFMPEG
    if (!haveTestVideo()) {
        printf("SKIP: test_media_probe (no %s)\n\n", qPrintable(testVideo()));
        return;
    }

    MediaProbe probe;
    bool ok = probe.probe(testVideo());
    if (!ok) {
        printf("FAIL: probe failed - %s\n", probe.errorString().toUtf8().constData());
        assert(false);
    }

    const MediaInfo& info = probe.info();
    printf("  Container: %s\n", info.containerFormat.toUtf8().constData());
    printf("  Duration: %.3f s\n", info.duration);
    if (info.hasVideo) {
        printf("  Video: %dx%d @ %.2f fps, %s\n", info.videoSize.width(), info.videoSize.height(),
               info.videoFps, info.videoCodec.toUtf8().constData());
    }
    if (info.hasAudio) {
        printf("  Audio: %d Hz, %d ch, %s\n", info.audioSampleRate, info.audioChannels,
               info.audioCodec.toUtf8().constData());
    }

    assert(info.hasVideo);
    assert(info.videoSize.isValid());
    assert(info.videoFps > 0);
    assert(info.duration > 0);

    printf("PASS: test_media_probe\n\n");
#else
    printf("SKIP: test_media_probe (no FFmpeg)\n\n");
#endif
}

void test_video_decode_10_frames() {
    printf("=== test_video_decode_10_frames ===\n");

#ifdef HAS_FFMPEG
    if (!haveTestVideo()) {
        printf("SKIP: test_video_decode_10_frames (no test media)\n\n");
        return;
    }

    VideoDecoder decoder;
    bool ok = decoder.open(testVideo());
    if (!ok) {
        printf("FAIL: cannot open video - %s\n", decoder.errorString().toUtf8().constData());
        assert(false);
    }

    const VideoInfo& info = decoder.info();
    printf("  Video: %dx%d, %.2f fps, duration %.3f s, codec %s\n",
           info.width, info.height, info.fps, info.duration,
           info.codecName.toUtf8().constData());

    double lastPts = -1.0;
    for (int i = 0; i < 10; ++i) {
        QImage frame = decoder.decodeNextFrame();
        if (frame.isNull()) {
            printf("  Frame %d: NULL (end of stream or error)\n", i);
            break;
        }
        assert(frame.width() == info.width);
        assert(frame.height() == info.height);
        assert(decoder.currentTime() >= lastPts);
        lastPts = decoder.currentTime();
    }

    double seekTarget = info.duration / 2.0;
    ok = decoder.seek(seekTarget);
    assert(ok);
    QImage seekFrame = decoder.decodeNextFrame();
    if (!seekFrame.isNull()) {
        printf("  After seek to %.3f s: PTS=%.4f s\n", seekTarget, decoder.currentTime());
        // Decoding resumes from the keyframe at or before the target
        assert(decoder.currentTime() <= seekTarget + 0.5);
    }

    decoder.close();
    assert(!decoder.isOpen());

    printf("PASS: test_video_decode_10_frames\n\n");
#else
    printf("SKIP: test_video_decode_10_frames (no FFmpeg)\n\n");
#endif
}

void test_audio_decode_to_mix_format() {
    printf("=== test_audio_decode_to_mix_format ===\n");

#ifdef HAS_FFMPEG
    if (!haveTestVideo()) {
        printf("SKIP: test_audio_decode_to_mix_format (no test media)\n\n");
        return;
    }

    AudioDecoder decoder;
    if (!decoder.open(testVideo(), 48000, 2)) {
        printf("  No audio stream found - SKIP\n\n");
        return;
    }

    const AudioInfo& info = decoder.info();
    printf("  Source audio: %d Hz, %d ch, codec %s, duration %.3f s\n",
           info.sampleRate, info.channels, info.codecName.toUtf8().constData(), info.duration);
    assert(decoder.outputSampleRate() == 48000);
    assert(decoder.outputChannels() == 2);

    std::vector<float> pcm = decoder.decode(0.1);
    printf("  Decoded %zu samples (expected ~%d for 0.1 s)\n", pcm.size(), 48000 / 10 * 2);
    assert(!pcm.empty());
    assert(pcm.size() % 2 == 0);
    for (float s : pcm) assert(std::isfinite(s));

    decoder.close();
    printf("PASS: test_audio_decode_to_mix_format\n\n");
#else
    printf("SKIP: test_audio_decode_to_mix_format (no FFmpeg)\n\n");
#endif
}

void test_file_handles_become_ready() {
    printf("=== test_file_handles_become_ready ===\n");

#ifdef HAS_FFMPEG
    if (!haveTestVideo()) {
        printf("SKIP: test_file_handles_become_ready (no test media)\n\n");
        return;
    }

    VideoFileHandle video(testVideo());
    waitForStatus(video);
    assert(video.isReady());
    assert(video.frameSize().isValid());
    assert(!video.currentFrame().isNull());

    video.seek(video.duration() / 2.0);
    assert(std::abs(video.position() - video.duration() / 2.0) < 1e-6);

    AudioFileHandle audio(testVideo(), 48000, 2);
    waitForStatus(audio);
    if (audio.isReady()) {
        std::vector<float> buf(4800 * 2, 0.0f);
        int got = audio.readAudio(0.0, 1.0, buf.data(), 4800);
        assert(got == 4800);
        assert(audio.duration() > 0.0);
    } else {
        printf("  No audio track in test media\n");
    }

    printf("PASS: test_file_handles_become_ready\n\n");
#else
    printf("SKIP: test_file_handles_become_ready (no FFmpeg)\n\n");
#endif
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    test_missing_file_fails();
    test_media_probe();
    test_video_decode_10_frames();
    test_audio_decode_to_mix_format();
    test_file_handles_become_ready();
    printf("All media decode tests passed.\n");
    return 0;
}

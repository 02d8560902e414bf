#include "FfmpegExportSink.h"
#include "Logging.h"
#include <QFile>
#include <algorithm>
#include <cmath>

#ifdef HAS_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
}

struct FfmpegExportSink::EncoderContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* videoEnc = nullptr;
    AVCodecContext* audioEnc = nullptr;
    AVStream* videoStream = nullptr;
    AVStream* audioStream = nullptr;
    SwsContext* swsCtx = nullptr;
    SwrContext* swrCtx = nullptr;
    AVFrame* videoFrame = nullptr;
    AVFrame* audioFrame = nullptr;
    AVPacket* packet = nullptr;
    int audioFrameSize = 1024;

    ~EncoderContext() {
        if (packet) av_packet_free(&packet);
        if (audioFrame) av_frame_free(&audioFrame);
        if (videoFrame) av_frame_free(&videoFrame);
        if (swrCtx) swr_free(&swrCtx);
        if (swsCtx) sws_freeContext(swsCtx);
        if (audioEnc) avcodec_free_context(&audioEnc);
        if (videoEnc) avcodec_free_context(&videoEnc);
        if (fmtCtx) {
            if (!(fmtCtx->oformat->flags & AVFMT_NOFILE) && fmtCtx->pb)
                avio_closep(&fmtCtx->pb);
            avformat_free_context(fmtCtx);
        }
    }
};

namespace {

QString avError(int code) {
    char buf[256];
    av_strerror(code, buf, sizeof(buf));
    return QString::fromUtf8(buf);
}

} // namespace
#endif

FfmpegExportSink::FfmpegExportSink() = default;

FfmpegExportSink::~FfmpegExportSink() {
    if (m_open) abort();
}

bool FfmpegExportSink::fail(const QString& message) {
    m_error = message;
    qCCritical(lcExport) << message;
    return false;
}

bool FfmpegExportSink::open(const ExportSettings& settings, const QSize& frameSize,
                            int sampleRate, int channels) {
    m_settings = settings;
    m_channels = channels;
    m_nextVideoPts = 0;
    m_nextAudioPts = 0;
    m_pendingAudio.clear();

    if (settings.outputPath.isEmpty()) return fail("No output path given");

#ifdef HAS_FFMPEG
    int width = settings.width > 0 ? settings.width : frameSize.width();
    int height = settings.height > 0 ? settings.height : frameSize.height();
    // YUV420P needs even dimensions
    width &= ~1;
    height &= ~1;
    if (width <= 0 || height <= 0) return fail("Invalid export frame size");

    m_ctx = std::make_unique<EncoderContext>();
    const QByteArray path = settings.outputPath.toUtf8();

    int ret = avformat_alloc_output_context2(&m_ctx->fmtCtx, nullptr, nullptr, path.constData());
    if (ret < 0 || !m_ctx->fmtCtx) {
        release();
        return fail(QString("Cannot create output for %1 (%2)").arg(settings.outputPath, avError(ret)));
    }

    // --- Video stream ---
    const AVCodec* encoder = avcodec_find_encoder_by_name(settings.videoCodec.toUtf8().constData());
    if (!encoder) encoder = avcodec_find_encoder(AV_CODEC_ID_H264);
    if (!encoder) {
        release();
        return fail(QString("No encoder for %1").arg(settings.videoCodec));
    }

    AVRational fpsQ = av_d2q(settings.fps > 0.0 ? settings.fps : 30.0, 100000);
    m_ctx->videoStream = avformat_new_stream(m_ctx->fmtCtx, nullptr);
    m_ctx->videoEnc = avcodec_alloc_context3(encoder);
    AVCodecContext* venc = m_ctx->videoEnc;
    venc->width = width;
    venc->height = height;
    venc->pix_fmt = AV_PIX_FMT_YUV420P;
    venc->time_base = AVRational{fpsQ.den, fpsQ.num};
    venc->framerate = fpsQ;
    venc->bit_rate = settings.videoBitrate;
    venc->gop_size = 12;
    if (m_ctx->fmtCtx->oformat->flags & AVFMT_GLOBALHEADER)
        venc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    AVDictionary* opts = nullptr;
    if (QString(encoder->name) == "libx264")
        av_dict_set(&opts, "preset", "veryfast", 0);
    ret = avcodec_open2(venc, encoder, &opts);
    av_dict_free(&opts);
    if (ret < 0) {
        release();
        return fail(QString("Cannot open video encoder %1 (%2)").arg(QString::fromUtf8(encoder->name), avError(ret)));
    }
    avcodec_parameters_from_context(m_ctx->videoStream->codecpar, venc);
    m_ctx->videoStream->time_base = venc->time_base;

    m_ctx->videoFrame = av_frame_alloc();
    m_ctx->videoFrame->format = venc->pix_fmt;
    m_ctx->videoFrame->width = width;
    m_ctx->videoFrame->height = height;
    if (av_frame_get_buffer(m_ctx->videoFrame, 0) < 0) {
        release();
        return fail("Cannot allocate video frame");
    }

    // --- Audio stream ---
    const AVCodec* aac = avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (!aac) {
        release();
        return fail("No AAC encoder available");
    }
    m_ctx->audioStream = avformat_new_stream(m_ctx->fmtCtx, nullptr);
    m_ctx->audioEnc = avcodec_alloc_context3(aac);
    AVCodecContext* aenc = m_ctx->audioEnc;
    aenc->sample_rate = sampleRate;
    av_channel_layout_default(&aenc->ch_layout, channels);
    aenc->sample_fmt = AV_SAMPLE_FMT_FLTP;
    aenc->bit_rate = settings.audioBitrate;
    aenc->time_base = AVRational{1, sampleRate};
    if (m_ctx->fmtCtx->oformat->flags & AVFMT_GLOBALHEADER)
        aenc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    ret = avcodec_open2(aenc, aac, nullptr);
    if (ret < 0) {
        release();
        return fail(QString("Cannot open AAC encoder (%1)").arg(avError(ret)));
    }
    avcodec_parameters_from_context(m_ctx->audioStream->codecpar, aenc);
    m_ctx->audioStream->time_base = aenc->time_base;
    m_ctx->audioFrameSize = aenc->frame_size > 0 ? aenc->frame_size : 1024;

    // Mix bus is packed float; AAC wants planar
    AVChannelLayout inLayout;
    av_channel_layout_default(&inLayout, channels);
    ret = swr_alloc_set_opts2(&m_ctx->swrCtx,
        &aenc->ch_layout, aenc->sample_fmt, sampleRate,
        &inLayout, AV_SAMPLE_FMT_FLT, sampleRate, 0, nullptr);
    av_channel_layout_uninit(&inLayout);
    if (ret < 0 || swr_init(m_ctx->swrCtx) < 0) {
        release();
        return fail("Cannot create audio converter");
    }

    m_ctx->audioFrame = av_frame_alloc();
    m_ctx->audioFrame->format = aenc->sample_fmt;
    m_ctx->audioFrame->sample_rate = sampleRate;
    av_channel_layout_copy(&m_ctx->audioFrame->ch_layout, &aenc->ch_layout);
    m_ctx->audioFrame->nb_samples = m_ctx->audioFrameSize;
    if (av_frame_get_buffer(m_ctx->audioFrame, 0) < 0) {
        release();
        return fail("Cannot allocate audio frame");
    }

    m_ctx->packet = av_packet_alloc();

    // --- File ---
    if (!(m_ctx->fmtCtx->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&m_ctx->fmtCtx->pb, path.constData(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            release();
            return fail(QString("Cannot open %1 for writing (%2)").arg(settings.outputPath, avError(ret)));
        }
    }
    ret = avformat_write_header(m_ctx->fmtCtx, nullptr);
    if (ret < 0) {
        release();
        QFile::remove(settings.outputPath);
        return fail(QString("Cannot write container header (%1)").arg(avError(ret)));
    }

    m_open = true;
    qCInfo(lcExport) << "Export sink open:" << settings.outputPath << width << "x" << height
                     << encoder->name << "+ aac" << sampleRate << "Hz";
    return true;
#else
    Q_UNUSED(frameSize);
    Q_UNUSED(sampleRate);
    return fail("Cannot export: FFmpeg not available");
#endif
}

bool FfmpegExportSink::writeVideoFrame(const QImage& frame, double pts) {
    if (!m_open) return fail("Export sink is not open");
#ifdef HAS_FFMPEG
    if (frame.isNull()) return true;

    // Capture is real-time; ticks that land on an already written frame slot
    // are dropped
    int64_t slot = static_cast<int64_t>(std::llround(pts * av_q2d(m_ctx->videoEnc->framerate)));
    if (slot < m_nextVideoPts) return true;

    QImage src = frame.format() == QImage::Format_RGB32
        ? frame : frame.convertToFormat(QImage::Format_RGB32);

    m_ctx->swsCtx = sws_getCachedContext(m_ctx->swsCtx,
        src.width(), src.height(), AV_PIX_FMT_RGB32,
        m_ctx->videoEnc->width, m_ctx->videoEnc->height, AV_PIX_FMT_YUV420P,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_ctx->swsCtx) return fail("Cannot create frame scaler");

    if (av_frame_make_writable(m_ctx->videoFrame) < 0) return fail("Video frame not writable");

    const uint8_t* srcData[1] = { src.constBits() };
    const int srcStride[1] = { static_cast<int>(src.bytesPerLine()) };
    sws_scale(m_ctx->swsCtx, srcData, srcStride, 0, src.height(),
              m_ctx->videoFrame->data, m_ctx->videoFrame->linesize);

    m_ctx->videoFrame->pts = slot;
    m_nextVideoPts = slot + 1;

    int ret = avcodec_send_frame(m_ctx->videoEnc, m_ctx->videoFrame);
    if (ret < 0) return fail(QString("Video encode failed (%1)").arg(avError(ret)));
    return drainVideo();
#else
    Q_UNUSED(pts);
    return fail("Cannot export: FFmpeg not available");
#endif
}

bool FfmpegExportSink::writeAudio(const float* samples, int frames) {
    if (!m_open) return fail("Export sink is not open");
#ifdef HAS_FFMPEG
    if (frames <= 0) return true;
    m_pendingAudio.insert(m_pendingAudio.end(), samples,
                          samples + static_cast<size_t>(frames) * m_channels);

    const size_t chunk = static_cast<size_t>(m_ctx->audioFrameSize) * m_channels;
    size_t consumed = 0;
    while (m_pendingAudio.size() - consumed >= chunk) {
        if (!encodeAudioChunk(m_pendingAudio.data() + consumed, m_ctx->audioFrameSize))
            return false;
        consumed += chunk;
    }
    m_pendingAudio.erase(m_pendingAudio.begin(), m_pendingAudio.begin() + consumed);
    return true;
#else
    Q_UNUSED(samples);
    return fail("Cannot export: FFmpeg not available");
#endif
}

bool FfmpegExportSink::encodeAudioChunk(const float* samples, int frames) {
#ifdef HAS_FFMPEG
    if (av_frame_make_writable(m_ctx->audioFrame) < 0) return fail("Audio frame not writable");

    const uint8_t* in[1] = { reinterpret_cast<const uint8_t*>(samples) };
    int converted = swr_convert(m_ctx->swrCtx, m_ctx->audioFrame->data, m_ctx->audioFrameSize,
                                in, frames);
    if (converted < 0) return fail("Audio conversion failed");

    m_ctx->audioFrame->nb_samples = converted;
    m_ctx->audioFrame->pts = m_nextAudioPts;
    m_nextAudioPts += converted;

    int ret = avcodec_send_frame(m_ctx->audioEnc, m_ctx->audioFrame);
    if (ret < 0) return fail(QString("Audio encode failed (%1)").arg(avError(ret)));
    return drainAudio();
#else
    Q_UNUSED(samples);
    Q_UNUSED(frames);
    return false;
#endif
}

bool FfmpegExportSink::drainVideo() {
#ifdef HAS_FFMPEG
    while (true) {
        int ret = avcodec_receive_packet(m_ctx->videoEnc, m_ctx->packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
        if (ret < 0) return fail(QString("Video encoder error (%1)").arg(avError(ret)));
        m_ctx->packet->stream_index = m_ctx->videoStream->index;
        av_packet_rescale_ts(m_ctx->packet, m_ctx->videoEnc->time_base, m_ctx->videoStream->time_base);
        ret = av_interleaved_write_frame(m_ctx->fmtCtx, m_ctx->packet);
        if (ret < 0) return fail(QString("Cannot write video packet (%1)").arg(avError(ret)));
    }
#else
    return false;
#endif
}

bool FfmpegExportSink::drainAudio() {
#ifdef HAS_FFMPEG
    while (true) {
        int ret = avcodec_receive_packet(m_ctx->audioEnc, m_ctx->packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
        if (ret < 0) return fail(QString("Audio encoder error (%1)").arg(avError(ret)));
        m_ctx->packet->stream_index = m_ctx->audioStream->index;
        av_packet_rescale_ts(m_ctx->packet, m_ctx->audioEnc->time_base, m_ctx->audioStream->time_base);
        ret = av_interleaved_write_frame(m_ctx->fmtCtx, m_ctx->packet);
        if (ret < 0) return fail(QString("Cannot write audio packet (%1)").arg(avError(ret)));
    }
#else
    return false;
#endif
}

bool FfmpegExportSink::finish() {
    if (!m_open) return fail("Export sink is not open");
#ifdef HAS_FFMPEG
    // Pad the tail to one full encoder frame
    if (!m_pendingAudio.empty()) {
        m_pendingAudio.resize(static_cast<size_t>(m_ctx->audioFrameSize) * m_channels, 0.0f);
        if (!encodeAudioChunk(m_pendingAudio.data(), m_ctx->audioFrameSize)) return false;
        m_pendingAudio.clear();
    }

    avcodec_send_frame(m_ctx->videoEnc, nullptr);
    if (!drainVideo()) return false;
    avcodec_send_frame(m_ctx->audioEnc, nullptr);
    if (!drainAudio()) return false;

    int ret = av_write_trailer(m_ctx->fmtCtx);
    if (ret < 0) return fail(QString("Cannot finalize container (%1)").arg(avError(ret)));

    release();
    m_open = false;
    qCInfo(lcExport) << "Export written:" << m_settings.outputPath;
    return true;
#else
    return false;
#endif
}

void FfmpegExportSink::abort() {
    release();
    m_open = false;
    m_pendingAudio.clear();
    if (!m_settings.outputPath.isEmpty() && QFile::exists(m_settings.outputPath)) {
        if (QFile::remove(m_settings.outputPath)) {
            qCInfo(lcExport) << "Removed partial output" << m_settings.outputPath;
        } else {
            qCWarning(lcExport) << "Could not remove partial output" << m_settings.outputPath;
        }
    }
}

void FfmpegExportSink::release() {
#ifdef HAS_FFMPEG
    m_ctx.reset();
#endif
}

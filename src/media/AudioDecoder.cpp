#include "AudioDecoder.h"
#include "Logging.h"

#ifdef HAS_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
}

struct AudioDecoder::FFmpegAudioContext {
    AVFormatContext* fmtCtx = nullptr;
    AVCodecContext* codecCtx = nullptr;
    SwrContext* swrCtx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    int audioStreamIdx = -1;
    double timeBase = 0.0;

    ~FFmpegAudioContext() {
        if (packet) av_packet_free(&packet);
        if (frame) av_frame_free(&frame);
        if (swrCtx) swr_free(&swrCtx);
        if (codecCtx) avcodec_free_context(&codecCtx);
        if (fmtCtx) avformat_close_input(&fmtCtx);
    }
};
#endif

AudioDecoder::AudioDecoder(QObject* parent) : QObject(parent) {}
AudioDecoder::~AudioDecoder() { close(); }

bool AudioDecoder::open(const QString& filePath, int outSampleRate, int outChannels) {
    close();
    m_outRate = outSampleRate;
    m_outChannels = outChannels;
    if (outSampleRate <= 0 || outChannels <= 0) return fail("Invalid output audio format");

#ifdef HAS_FFMPEG
    m_ctx = std::make_unique<FFmpegAudioContext>();

    int ret = avformat_open_input(&m_ctx->fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        return fail(QString("Cannot open %1 (%2)").arg(filePath, errBuf));
    }

    ret = avformat_find_stream_info(m_ctx->fmtCtx, nullptr);
    if (ret < 0) return fail("Cannot find stream info");

    m_ctx->audioStreamIdx = av_find_best_stream(m_ctx->fmtCtx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (m_ctx->audioStreamIdx < 0) return fail(QString("No audio stream in %1").arg(filePath));

    AVStream* stream = m_ctx->fmtCtx->streams[m_ctx->audioStreamIdx];
    AVCodecParameters* par = stream->codecpar;

    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec) return fail("No decoder for audio codec");

    m_ctx->codecCtx = avcodec_alloc_context3(codec);
    avcodec_parameters_to_context(m_ctx->codecCtx, par);

    ret = avcodec_open2(m_ctx->codecCtx, codec, nullptr);
    if (ret < 0) return fail("Cannot open audio decoder");

    m_ctx->timeBase = av_q2d(stream->time_base);

    m_info.sampleRate = m_ctx->codecCtx->sample_rate;
    m_info.channels = m_ctx->codecCtx->ch_layout.nb_channels;
    m_info.codecName = QString(codec->name);
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        m_info.duration = static_cast<double>(stream->duration) * m_ctx->timeBase;
    } else if (m_ctx->fmtCtx->duration > 0) {
        m_info.duration = static_cast<double>(m_ctx->fmtCtx->duration) / AV_TIME_BASE;
    }

    // Resample to the mix bus format: packed float at the output rate
    AVChannelLayout outLayout;
    av_channel_layout_default(&outLayout, m_outChannels);
    ret = swr_alloc_set_opts2(&m_ctx->swrCtx,
        &outLayout, AV_SAMPLE_FMT_FLT, m_outRate,
        &m_ctx->codecCtx->ch_layout, m_ctx->codecCtx->sample_fmt, m_info.sampleRate,
        0, nullptr);
    av_channel_layout_uninit(&outLayout);
    if (ret < 0 || !m_ctx->swrCtx) return fail("Cannot create audio resampler");

    ret = swr_init(m_ctx->swrCtx);
    if (ret < 0) return fail("Cannot initialise audio resampler");

    m_ctx->frame = av_frame_alloc();
    m_ctx->packet = av_packet_alloc();

    m_isOpen = true;
    m_error.clear();
    qCDebug(lcMedia) << "Opened audio" << filePath << m_info.sampleRate << "Hz"
                     << m_info.channels << "ch" << m_info.duration << "s";
    return true;
#else
    return fail(QString("Cannot decode %1: FFmpeg not available").arg(filePath));
#endif
}

bool AudioDecoder::fail(const QString& message) {
#ifdef HAS_FFMPEG
    m_ctx.reset();
#endif
    m_isOpen = false;
    m_error = message;
    return false;
}

void AudioDecoder::close() {
#ifdef HAS_FFMPEG
    m_ctx.reset();
#endif
    m_isOpen = false;
    m_info = AudioInfo{};
}

std::vector<float> AudioDecoder::decode(double maxSeconds) {
    std::vector<float> result;
#ifdef HAS_FFMPEG
    if (!m_isOpen || !m_ctx) return result;

    int64_t maxFrames = -1;
    if (maxSeconds > 0)
        maxFrames = static_cast<int64_t>(maxSeconds * m_outRate);
    int64_t totalFrames = 0;

    auto convert = [&](const uint8_t** in, int inSamples) {
        int outSamples = swr_get_out_samples(m_ctx->swrCtx, inSamples);
        if (outSamples <= 0) return;
        size_t offset = result.size();
        result.resize(offset + static_cast<size_t>(outSamples) * m_outChannels);
        uint8_t* outPtr = reinterpret_cast<uint8_t*>(result.data() + offset);
        int converted = swr_convert(m_ctx->swrCtx, &outPtr, outSamples, in, inSamples);
        if (converted < 0) converted = 0;
        result.resize(offset + static_cast<size_t>(converted) * m_outChannels);
        totalFrames += converted;
    };

    auto drainFrames = [&]() -> bool {
        while (avcodec_receive_frame(m_ctx->codecCtx, m_ctx->frame) >= 0) {
            convert(const_cast<const uint8_t**>(m_ctx->frame->extended_data),
                    m_ctx->frame->nb_samples);
            if (maxFrames > 0 && totalFrames >= maxFrames) return true;
        }
        return false;
    };

    while (av_read_frame(m_ctx->fmtCtx, m_ctx->packet) >= 0) {
        if (m_ctx->packet->stream_index != m_ctx->audioStreamIdx) {
            av_packet_unref(m_ctx->packet);
            continue;
        }

        int ret = avcodec_send_packet(m_ctx->codecCtx, m_ctx->packet);
        av_packet_unref(m_ctx->packet);
        if (ret < 0) continue;

        if (drainFrames()) return result;
    }

    // End of file: flush the decoder, then the resampler's delay line
    avcodec_send_packet(m_ctx->codecCtx, nullptr);
    drainFrames();
    convert(nullptr, 0);
#else
    Q_UNUSED(maxSeconds);
#endif
    return result;
}

bool AudioDecoder::seek(double seconds) {
#ifdef HAS_FFMPEG
    if (!m_isOpen || !m_ctx) return false;

    int64_t timestamp = static_cast<int64_t>(seconds * AV_TIME_BASE);
    int ret = av_seek_frame(m_ctx->fmtCtx, -1, timestamp, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) return false;

    avcodec_flush_buffers(m_ctx->codecCtx);
    return true;
#else
    Q_UNUSED(seconds);
    return false;
#endif
}

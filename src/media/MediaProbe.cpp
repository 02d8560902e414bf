#include "MediaProbe.h"
#include "Logging.h"
#include <algorithm>

#ifdef HAS_FFMPEG
extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

namespace {

double streamDuration(const AVStream* stream) {
    if (stream->duration == AV_NOPTS_VALUE || stream->duration <= 0) return 0.0;
    return stream->duration * av_q2d(stream->time_base);
}

QString codecName(const AVCodecParameters* par) {
    const AVCodecDescriptor* desc = avcodec_descriptor_get(par->codec_id);
    return desc ? QString(desc->name) : QStringLiteral("unknown");
}

} // namespace
#endif

MediaProbe::MediaProbe(QObject* parent) : QObject(parent) {}
MediaProbe::~MediaProbe() = default;

bool MediaProbe::probe(const QString& filePath) {
    m_info = MediaInfo{};
    m_info.filePath = filePath;
    m_error.clear();

#ifdef HAS_FFMPEG
    AVFormatContext* fmtCtx = nullptr;
    int ret = avformat_open_input(&fmtCtx, filePath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        char errBuf[256];
        av_strerror(ret, errBuf, sizeof(errBuf));
        m_error = QString("Cannot open file: %1 (%2)").arg(filePath, errBuf);
        return false;
    }

    ret = avformat_find_stream_info(fmtCtx, nullptr);
    if (ret < 0) {
        m_error = QString("Cannot read stream info: %1").arg(filePath);
        avformat_close_input(&fmtCtx);
        return false;
    }

    m_info.containerFormat = QString(fmtCtx->iformat->name);

    double longestStream = 0.0;
    for (unsigned i = 0; i < fmtCtx->nb_streams; ++i) {
        const AVStream* stream = fmtCtx->streams[i];
        const AVCodecParameters* par = stream->codecpar;

        if (par->codec_type == AVMEDIA_TYPE_VIDEO && !m_info.hasVideo) {
            // Cover art is a single attached picture, not a video track
            if (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) continue;
            m_info.hasVideo = true;
            m_info.videoSize = QSize(par->width, par->height);
            m_info.videoCodec = codecName(par);
            if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0) {
                m_info.videoFps = av_q2d(stream->avg_frame_rate);
            } else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0) {
                m_info.videoFps = av_q2d(stream->r_frame_rate);
            }
            longestStream = std::max(longestStream, streamDuration(stream));
        } else if (par->codec_type == AVMEDIA_TYPE_AUDIO && !m_info.hasAudio) {
            m_info.hasAudio = true;
            m_info.audioSampleRate = par->sample_rate;
            m_info.audioChannels = par->ch_layout.nb_channels;
            m_info.audioCodec = codecName(par);
            longestStream = std::max(longestStream, streamDuration(stream));
        }
    }

    m_info.duration = fmtCtx->duration > 0
        ? static_cast<double>(fmtCtx->duration) / AV_TIME_BASE
        : longestStream;
    avformat_close_input(&fmtCtx);

    if (!m_info.hasVideo && !m_info.hasAudio) {
        m_error = QString("No audio or video stream in %1").arg(filePath);
        return false;
    }

    qCDebug(lcMedia) << "Probed" << filePath << m_info.duration << "s video" << m_info.hasVideo
                     << m_info.videoSize << "audio" << m_info.hasAudio;
    return true;
#else
    m_error = QString("Cannot probe %1: FFmpeg not available").arg(filePath);
    return false;
#endif
}

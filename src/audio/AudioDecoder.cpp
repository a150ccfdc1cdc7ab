#include "audio/AudioDecoder.h"
#include <memory>
#include <stdexcept>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace {

std::string avError(int code) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(code, errbuf, sizeof(errbuf));
    return errbuf;
}

struct FormatCloser {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecFreer {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct FrameFreer {
    void operator()(AVFrame* f) const { av_frame_free(&f); }
};
struct PacketFreer {
    void operator()(AVPacket* p) const { av_packet_free(&p); }
};
struct SwrFreer {
    void operator()(SwrContext* s) const { swr_free(&s); }
};

using SwrPtr = std::unique_ptr<SwrContext, SwrFreer>;

SwrPtr makeResampler(const AVChannelLayout* srcLayout, AVSampleFormat srcFmt, int srcRate,
                     int dstChannels, int dstRate) {
    AVChannelLayout dstLayout;
    av_channel_layout_default(&dstLayout, dstChannels);

    SwrContext* raw = nullptr;
    int ret = swr_alloc_set_opts2(&raw, &dstLayout, AV_SAMPLE_FMT_FLT, dstRate, srcLayout, srcFmt, srcRate, 0, nullptr);
    av_channel_layout_uninit(&dstLayout);
    if (ret < 0 || !raw) {
        throw std::runtime_error("swr_alloc_set_opts2 failed: " + (ret < 0 ? avError(ret) : std::string("null context")));
    }
    SwrPtr swr(raw);
    ret = swr_init(swr.get());
    if (ret < 0) throw std::runtime_error("swr_init failed: " + avError(ret));
    return swr;
}

// Appends whatever swr produces for the given input (nullptr input flushes).
void convertInto(SwrContext* swr, const uint8_t** input, int inSamples, int srcRate, int dstRate,
                 int dstChannels, std::vector<float>& out) {
    int64_t delay = swr_get_delay(swr, srcRate);
    int capacity = static_cast<int>(av_rescale_rnd(delay + inSamples, dstRate, srcRate, AV_ROUND_UP)) + 32;
    std::vector<float> chunk(static_cast<size_t>(capacity) * dstChannels);
    uint8_t* outPtr = reinterpret_cast<uint8_t*>(chunk.data());
    int produced = swr_convert(swr, &outPtr, capacity, input, inSamples);
    if (produced < 0) throw std::runtime_error("swr_convert failed: " + avError(produced));
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<size_t>(produced) * dstChannels);
}

}

namespace AudioDecoder {

AudioBuffer decodeFile(const std::string& path) {
    av_log_set_level(AV_LOG_ERROR);

    AVFormatContext* rawFmt = nullptr;
    int ret = avformat_open_input(&rawFmt, path.c_str(), nullptr, nullptr);
    if (ret < 0) throw std::runtime_error("Cannot open audio " + path + ": " + avError(ret));
    std::unique_ptr<AVFormatContext, FormatCloser> fmt(rawFmt);

    ret = avformat_find_stream_info(fmt.get(), nullptr);
    if (ret < 0) throw std::runtime_error("No stream info in " + path + ": " + avError(ret));

    int streamIndex = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (streamIndex < 0) throw std::runtime_error("No audio stream in " + path);
    AVCodecParameters* par = fmt->streams[streamIndex]->codecpar;

    const AVCodec* codec = avcodec_find_decoder(par->codec_id);
    if (!codec) throw std::runtime_error("No decoder for audio stream in " + path);

    std::unique_ptr<AVCodecContext, CodecFreer> dec(avcodec_alloc_context3(codec));
    if (!dec) throw std::runtime_error("avcodec_alloc_context3 failed");
    ret = avcodec_parameters_to_context(dec.get(), par);
    if (ret < 0) throw std::runtime_error("avcodec_parameters_to_context failed: " + avError(ret));
    ret = avcodec_open2(dec.get(), codec, nullptr);
    if (ret < 0) throw std::runtime_error("avcodec_open2 failed: " + avError(ret));

    AudioBuffer buffer;
    buffer.sampleRate = dec->sample_rate;
    buffer.channels = dec->ch_layout.nb_channels;
    if (buffer.sampleRate <= 0 || buffer.channels <= 0) {
        throw std::runtime_error("Invalid audio format in " + path);
    }

    std::unique_ptr<AVPacket, PacketFreer> packet(av_packet_alloc());
    std::unique_ptr<AVFrame, FrameFreer> frame(av_frame_alloc());
    SwrPtr swr;

    auto drain = [&]() {
        while (true) {
            int r = avcodec_receive_frame(dec.get(), frame.get());
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return;
            if (r < 0) throw std::runtime_error("Audio decode failed: " + avError(r));
            if (!swr) {
                swr = makeResampler(&frame->ch_layout, static_cast<AVSampleFormat>(frame->format),
                                    frame->sample_rate, buffer.channels, buffer.sampleRate);
            }
            convertInto(swr.get(), const_cast<const uint8_t**>(frame->extended_data), frame->nb_samples,
                        frame->sample_rate, buffer.sampleRate, buffer.channels, buffer.samples);
            av_frame_unref(frame.get());
        }
    };

    while (av_read_frame(fmt.get(), packet.get()) >= 0) {
        if (packet->stream_index == streamIndex) {
            ret = avcodec_send_packet(dec.get(), packet.get());
            if (ret < 0 && ret != AVERROR(EAGAIN)) {
                av_packet_unref(packet.get());
                throw std::runtime_error("avcodec_send_packet failed: " + avError(ret));
            }
            drain();
        }
        av_packet_unref(packet.get());
    }
    avcodec_send_packet(dec.get(), nullptr);
    drain();
    if (swr) {
        convertInto(swr.get(), nullptr, 0, buffer.sampleRate, buffer.sampleRate, buffer.channels, buffer.samples);
    }
    return buffer;
}

AudioBuffer convert(const AudioBuffer& input, int sampleRate, int channels) {
    if (input.sampleRate == sampleRate && input.channels == channels) return input;

    AVChannelLayout srcLayout;
    av_channel_layout_default(&srcLayout, input.channels);
    SwrPtr swr = makeResampler(&srcLayout, AV_SAMPLE_FMT_FLT, input.sampleRate, channels, sampleRate);
    av_channel_layout_uninit(&srcLayout);

    AudioBuffer out;
    out.sampleRate = sampleRate;
    out.channels = channels;
    const uint8_t* in = reinterpret_cast<const uint8_t*>(input.samples.data());
    convertInto(swr.get(), &in, static_cast<int>(input.frameCount()), input.sampleRate, sampleRate, channels,
                out.samples);
    convertInto(swr.get(), nullptr, 0, input.sampleRate, sampleRate, channels, out.samples);
    return out;
}

}

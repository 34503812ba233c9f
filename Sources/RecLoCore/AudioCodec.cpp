#include "AudioCodec.hpp"

#include "Logging.hpp"
#include "Types.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mathematics.h>
}

namespace reclo {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("codec");
}

std::string av_error(int ret) {
    char errbuf[256];
    av_strerror(ret, errbuf, sizeof(errbuf));
    return errbuf;
}

} // namespace

// ---------------------------------------------------------------------------
// PCM decoders
// ---------------------------------------------------------------------------

std::vector<int16_t> Pcm16Decoder::decode(const uint8_t* frame, size_t len) {
    if (!frame || len == 0 || len % 2 != 0) {
        throw std::runtime_error("PCM16 frame of " + std::to_string(len) + " bytes");
    }

    std::vector<int16_t> out(len / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<int16_t>(frame[2 * i] | (frame[2 * i + 1] << 8));
    }
    return out;
}

uint8_t Pcm16Decoder::codec_id() const {
    return static_cast<uint8_t>(CodecId::pcm16);
}

std::vector<int16_t> Pcm8Decoder::decode(const uint8_t* frame, size_t len) {
    if (!frame || len == 0) {
        throw std::runtime_error("empty PCM8 frame");
    }

    std::vector<int16_t> out(len);
    for (size_t i = 0; i < len; ++i) {
        out[i] = static_cast<int16_t>((static_cast<int>(frame[i]) - 128) * 256);
    }
    return out;
}

uint8_t Pcm8Decoder::codec_id() const {
    return static_cast<uint8_t>(CodecId::pcm8);
}

// ---------------------------------------------------------------------------
// OpusDecoder
// ---------------------------------------------------------------------------

OpusDecoder::OpusDecoder(uint8_t codec_id, uint32_t sample_rate)
    : codec_id_(codec_id), sample_rate_(static_cast<int>(sample_rate)) {
    const AVCodec* decoder = avcodec_find_decoder(AV_CODEC_ID_OPUS);
    if (!decoder) {
        throw std::runtime_error("No Opus decoder available in libavcodec");
    }

    ctx_ = avcodec_alloc_context3(decoder);
    if (!ctx_) {
        throw std::runtime_error("Failed to allocate Opus decoder context");
    }
    ctx_->sample_rate = sample_rate_;
    AVChannelLayout mono = AV_CHANNEL_LAYOUT_MONO;
    av_channel_layout_copy(&ctx_->ch_layout, &mono);

    int ret = avcodec_open2(ctx_, decoder, nullptr);
    if (ret < 0) {
        avcodec_free_context(&ctx_);
        throw std::runtime_error("Failed to open Opus decoder: " + av_error(ret));
    }

    pkt_   = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (!pkt_ || !frame_) {
        av_frame_free(&frame_);
        av_packet_free(&pkt_);
        avcodec_free_context(&ctx_);
        throw std::runtime_error("Failed to allocate Opus decoder buffers");
    }
}

OpusDecoder::~OpusDecoder() {
    if (swr_) swr_free(&swr_);
    av_frame_free(&frame_);
    av_packet_free(&pkt_);
    avcodec_free_context(&ctx_);
}

std::vector<int16_t> OpusDecoder::decode(const uint8_t* frame, size_t len) {
    if (!frame || len == 0) {
        throw std::runtime_error("empty Opus frame");
    }

    int ret = av_new_packet(pkt_, static_cast<int>(len));
    if (ret < 0) {
        throw std::runtime_error("av_new_packet: " + av_error(ret));
    }
    std::memcpy(pkt_->data, frame, len);

    ret = avcodec_send_packet(ctx_, pkt_);
    av_packet_unref(pkt_);
    if (ret < 0) {
        throw std::runtime_error("Opus packet rejected: " + av_error(ret));
    }

    std::vector<int16_t> out;
    while ((ret = avcodec_receive_frame(ctx_, frame_)) == 0) {
        convert(out);
        av_frame_unref(frame_);
    }
    if (ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
        throw std::runtime_error("Opus decode failed: " + av_error(ret));
    }
    return out;
}

void OpusDecoder::convert(std::vector<int16_t>& out) {
    // The decoder's output rate and layout are only known once it has
    // produced a frame.
    if (!swr_) {
        AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
        int ret = swr_alloc_set_opts2(&swr_,
            &out_layout, AV_SAMPLE_FMT_S16, sample_rate_,
            &frame_->ch_layout, static_cast<AVSampleFormat>(frame_->format),
            frame_->sample_rate,
            0, nullptr);
        if (ret < 0 || swr_init(swr_) < 0) {
            if (swr_) swr_free(&swr_);
            throw std::runtime_error("Failed to initialize Opus resampler");
        }
        logger()->debug("Opus decoder output {} Hz -> {} Hz mono s16",
                        frame_->sample_rate, sample_rate_);
    }

    int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr_, frame_->sample_rate) + frame_->nb_samples,
        sample_rate_, frame_->sample_rate, AV_ROUND_UP));

    std::vector<int16_t> buf(out_samples);
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    int converted = swr_convert(swr_, &out_buf, out_samples,
                                (const uint8_t**)frame_->extended_data,
                                frame_->nb_samples);
    if (converted < 0) {
        throw std::runtime_error("swr_convert: " + av_error(converted));
    }
    out.insert(out.end(), buf.begin(), buf.begin() + converted);
}

// ---------------------------------------------------------------------------
// make_decoder
// ---------------------------------------------------------------------------

std::unique_ptr<AudioDecoder> make_decoder(uint8_t codec_id, uint32_t sample_rate) {
    switch (static_cast<CodecId>(codec_id)) {
        case CodecId::pcm16:
            return std::make_unique<Pcm16Decoder>();
        case CodecId::pcm8:
            return std::make_unique<Pcm8Decoder>();
        case CodecId::opus:
        case CodecId::opus_fs320:
            return std::make_unique<OpusDecoder>(codec_id, sample_rate);
    }
    logger()->warn("No decoder for codec id {}", codec_id);
    return nullptr;
}

// ---------------------------------------------------------------------------
// Pcm16Encoder
// ---------------------------------------------------------------------------

Pcm16Encoder::Pcm16Encoder(FrameChannel& sink, size_t frame_samples)
    : sink_(sink), frame_samples_(std::max<size_t>(frame_samples, 1)) {}

void Pcm16Encoder::encode(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return;

    pending_.insert(pending_.end(), samples, samples + count);
    while (pending_.size() >= frame_samples_) {
        emit(frame_samples_);
    }
}

void Pcm16Encoder::flush() {
    if (!pending_.empty()) {
        emit(pending_.size());
    }
}

uint8_t Pcm16Encoder::codec_id() const {
    return static_cast<uint8_t>(CodecId::pcm16);
}

void Pcm16Encoder::emit(size_t count) {
    FrameChannel::Frame bytes(count * 2);
    for (size_t i = 0; i < count; ++i) {
        const uint16_t v = static_cast<uint16_t>(pending_[i]);
        bytes[2 * i]     = static_cast<uint8_t>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(v >> 8);
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(count));
    sink_.push(std::move(bytes));
}

// ---------------------------------------------------------------------------
// OpusEncoder
// ---------------------------------------------------------------------------

OpusEncoder::OpusEncoder(FrameChannel& sink, uint32_t sample_rate, int bit_rate,
                         uint8_t codec_id)
    : sink_(sink), codec_id_(codec_id) {
    const AVCodec* encoder = avcodec_find_encoder_by_name("libopus");
    if (!encoder) {
        encoder = avcodec_find_encoder(AV_CODEC_ID_OPUS);
    }
    if (!encoder) {
        throw std::runtime_error("No Opus encoder available in libavcodec");
    }

    ctx_ = avcodec_alloc_context3(encoder);
    if (!ctx_) {
        throw std::runtime_error("Failed to allocate Opus encoder context");
    }
    ctx_->sample_rate = static_cast<int>(sample_rate);
    ctx_->sample_fmt  = AV_SAMPLE_FMT_S16;
    ctx_->bit_rate    = bit_rate;
    ctx_->strict_std_compliance = FF_COMPLIANCE_EXPERIMENTAL;
    AVChannelLayout mono = AV_CHANNEL_LAYOUT_MONO;
    av_channel_layout_copy(&ctx_->ch_layout, &mono);

    int ret = avcodec_open2(ctx_, encoder, nullptr);
    if (ret < 0) {
        avcodec_free_context(&ctx_);
        throw std::runtime_error(std::string("Failed to open Opus encoder '") +
                                 encoder->name + "': " + av_error(ret));
    }
    frame_samples_ = ctx_->frame_size > 0 ? ctx_->frame_size
                                          : static_cast<int>(sample_rate / 50);

    pkt_   = av_packet_alloc();
    frame_ = av_frame_alloc();
    if (pkt_ && frame_) {
        frame_->nb_samples  = frame_samples_;
        frame_->format      = AV_SAMPLE_FMT_S16;
        frame_->sample_rate = ctx_->sample_rate;
        av_channel_layout_copy(&frame_->ch_layout, &ctx_->ch_layout);
        ret = av_frame_get_buffer(frame_, 0);
    }
    if (!pkt_ || !frame_ || ret < 0) {
        av_frame_free(&frame_);
        av_packet_free(&pkt_);
        avcodec_free_context(&ctx_);
        throw std::runtime_error("Failed to allocate Opus encoder buffers");
    }

    logger()->info("Opus encoder '{}' ({} Hz, {} samples/frame, {} bps)",
                   encoder->name, sample_rate, frame_samples_, bit_rate);
}

OpusEncoder::~OpusEncoder() {
    av_frame_free(&frame_);
    av_packet_free(&pkt_);
    avcodec_free_context(&ctx_);
}

void OpusEncoder::encode(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return;

    pending_.insert(pending_.end(), samples, samples + count);

    const size_t frame = static_cast<size_t>(frame_samples_);
    size_t offset = 0;
    while (pending_.size() - offset >= frame) {
        encode_frame(pending_.data() + offset, frame_samples_);
        offset += frame;
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
}

void OpusEncoder::flush() {
    if (pending_.empty()) return;

    // Opus only accepts whole frames; the tail is zero-padded.
    encode_frame(pending_.data(), static_cast<int>(pending_.size()));
    pending_.clear();
}

void OpusEncoder::encode_frame(const int16_t* samples, int count) {
    int ret = av_frame_make_writable(frame_);
    if (ret < 0) {
        throw std::runtime_error("av_frame_make_writable: " + av_error(ret));
    }

    int16_t* dst = reinterpret_cast<int16_t*>(frame_->data[0]);
    std::memcpy(dst, samples, static_cast<size_t>(count) * sizeof(int16_t));
    if (count < frame_samples_) {
        std::fill(dst + count, dst + frame_samples_, static_cast<int16_t>(0));
    }
    frame_->pts = next_pts_;
    next_pts_ += frame_samples_;

    ret = avcodec_send_frame(ctx_, frame_);
    if (ret < 0) {
        throw std::runtime_error("Opus encode failed: " + av_error(ret));
    }
    drain();
}

void OpusEncoder::drain() {
    while (avcodec_receive_packet(ctx_, pkt_) == 0) {
        sink_.push(FrameChannel::Frame(pkt_->data, pkt_->data + pkt_->size));
        av_packet_unref(pkt_);
    }
}

// ---------------------------------------------------------------------------
// make_encoder
// ---------------------------------------------------------------------------

std::unique_ptr<AudioEncoder> make_encoder(uint8_t codec_id, uint32_t sample_rate,
                                           FrameChannel& sink) {
    switch (static_cast<CodecId>(codec_id)) {
        case CodecId::pcm16:
            return std::make_unique<Pcm16Encoder>(sink, sample_rate / 50);
        case CodecId::opus:
        case CodecId::opus_fs320:
            return std::make_unique<OpusEncoder>(sink, sample_rate, 32000, codec_id);
        case CodecId::pcm8:
            break;
    }
    logger()->warn("No encoder for codec id {}", codec_id);
    return nullptr;
}

} // namespace reclo

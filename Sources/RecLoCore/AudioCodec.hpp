#pragma once

#include "FrameChannel.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace reclo {

// ---------------------------------------------------------------------------
// Decoding (central side)
// ---------------------------------------------------------------------------

/// Turns one stored frame into mono linear PCM16 samples.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    /// Decode a single frame.  Throws std::runtime_error if the frame is
    /// malformed; callers skip that frame and continue with the chunk.
    virtual std::vector<int16_t> decode(const uint8_t* frame, size_t len) = 0;

    virtual uint8_t codec_id() const = 0;
};

/// Codec 0: frames are little-endian signed 16-bit samples.
class Pcm16Decoder : public AudioDecoder {
public:
    std::vector<int16_t> decode(const uint8_t* frame, size_t len) override;
    uint8_t codec_id() const override;
};

/// Codec 1: frames are unsigned 8-bit samples centred on 128.
class Pcm8Decoder : public AudioDecoder {
public:
    std::vector<int16_t> decode(const uint8_t* frame, size_t len) override;
    uint8_t codec_id() const override;
};

/// Codecs 20/21: Opus packets decoded with libavcodec and converted to mono
/// s16 at the chunk's sample rate with libswresample.
class OpusDecoder : public AudioDecoder {
public:
    OpusDecoder(uint8_t codec_id, uint32_t sample_rate);
    ~OpusDecoder() override;

    // Non-copyable.
    OpusDecoder(const OpusDecoder&) = delete;
    OpusDecoder& operator=(const OpusDecoder&) = delete;

    std::vector<int16_t> decode(const uint8_t* frame, size_t len) override;
    uint8_t codec_id() const override { return codec_id_; }

private:
    void convert(std::vector<int16_t>& out);

    uint8_t         codec_id_;
    int             sample_rate_;
    AVCodecContext* ctx_   = nullptr;
    AVPacket*       pkt_   = nullptr;
    AVFrame*        frame_ = nullptr;
    SwrContext*     swr_   = nullptr;
};

/// Decoder for a chunk's codec, or nullptr for an unknown codec id.
/// Throws std::runtime_error if the FFmpeg decoder cannot be opened.
std::unique_ptr<AudioDecoder> make_decoder(uint8_t codec_id, uint32_t sample_rate);

// ---------------------------------------------------------------------------
// Encoding (peripheral side)
// ---------------------------------------------------------------------------

/// Turns a stream of mono PCM16 samples into frames pushed to a channel.
class AudioEncoder {
public:
    virtual ~AudioEncoder() = default;

    /// Buffer samples and emit every complete frame.
    virtual void encode(const int16_t* samples, size_t count) = 0;

    /// Emit the trailing partial frame, if any.
    virtual void flush() = 0;

    virtual uint8_t codec_id() const = 0;
};

/// Codec 0: each frame is frame_samples raw little-endian samples.
class Pcm16Encoder : public AudioEncoder {
public:
    Pcm16Encoder(FrameChannel& sink, size_t frame_samples = 320);

    void encode(const int16_t* samples, size_t count) override;
    void flush() override;
    uint8_t codec_id() const override;

private:
    void emit(size_t count);

    FrameChannel&        sink_;
    size_t               frame_samples_;
    std::vector<int16_t> pending_;
};

/// Codecs 20/21: libopus through libavcodec.  At 16 kHz a 20 ms frame is
/// 320 samples, matching the stored opus_fs320 layout.
class OpusEncoder : public AudioEncoder {
public:
    OpusEncoder(FrameChannel& sink, uint32_t sample_rate = 16000,
                int bit_rate = 32000,
                uint8_t codec_id = 21);
    ~OpusEncoder() override;

    // Non-copyable.
    OpusEncoder(const OpusEncoder&) = delete;
    OpusEncoder& operator=(const OpusEncoder&) = delete;

    void encode(const int16_t* samples, size_t count) override;
    void flush() override;
    uint8_t codec_id() const override { return codec_id_; }

    int frame_samples() const { return frame_samples_; }

private:
    void encode_frame(const int16_t* samples, int count);
    void drain();

    FrameChannel&        sink_;
    uint8_t              codec_id_;
    int                  frame_samples_ = 320;
    int64_t              next_pts_      = 0;
    AVCodecContext*      ctx_   = nullptr;
    AVPacket*            pkt_   = nullptr;
    AVFrame*             frame_ = nullptr;
    std::vector<int16_t> pending_;
};

/// Encoder for a codec id, or nullptr for an unknown one.
std::unique_ptr<AudioEncoder> make_encoder(uint8_t codec_id, uint32_t sample_rate,
                                           FrameChannel& sink);

} // namespace reclo

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reclo {

static constexpr size_t kWavHeaderSize = 44;

struct WavFormat {
    uint32_t sample_rate = 16000;
    uint16_t channels    = 1;
    uint16_t bit_depth   = 16;

    uint32_t byte_rate() const { return sample_rate * channels * (bit_depth / 8u); }
    uint16_t block_align() const { return static_cast<uint16_t>(channels * (bit_depth / 8u)); }
};

/// Canonical 44-byte RIFF/WAVE header for uncompressed PCM.
std::array<uint8_t, kWavHeaderSize> build_wav_header(const WavFormat& fmt, uint32_t data_size);

/// Parse a canonical header.  Returns nullopt if it is not RIFF/WAVE/PCM.
std::optional<WavFormat> parse_wav_header(const uint8_t* data, size_t len);

/// Write header + PCM bytes and flush.  Returns false on any I/O error.
bool write_wav(const std::string& path, const WavFormat& fmt,
               const std::vector<uint8_t>& pcm);

/// The whole file, header included.  Returns nullopt if it cannot be read.
std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path);

/// Mono PCM16 samples to little-endian bytes at the given bit depth
/// (16, or 8 for unsigned 8-bit).
std::vector<uint8_t> samples_to_pcm(const std::vector<int16_t>& samples, int bit_depth);

} // namespace reclo

#pragma once

#include "ChunkFile.hpp"
#include "Clock.hpp"
#include "WireFormat.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

namespace reclo {
namespace test {

namespace fs = std::filesystem;

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("reclo_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    std::string str(const std::string& sub = "") const {
        return sub.empty() ? path_.string() : (path_ / sub).string();
    }

private:
    fs::path path_;
};

/// Clock whose wall and monotonic time only move when told to.
class FakeClock : public Clock {
public:
    std::optional<uint32_t> wall_now() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return wall_;
    }

    uint32_t monotonic_now() const override {
        std::lock_guard<std::mutex> lock(mu_);
        return mono_;
    }

    void set_wall(uint32_t wall) {
        std::lock_guard<std::mutex> lock(mu_);
        wall_ = wall;
    }

    void set_monotonic(uint32_t mono) {
        std::lock_guard<std::mutex> lock(mu_);
        mono_ = mono;
    }

    void advance(uint32_t seconds) {
        std::lock_guard<std::mutex> lock(mu_);
        mono_ += seconds;
        if (wall_) *wall_ += seconds;
    }

private:
    mutable std::mutex      mu_;
    std::optional<uint32_t> wall_;
    uint32_t                mono_ = 0;
};

// ---------------------------------------------------------------------------
// Chunk payloads
// ---------------------------------------------------------------------------

/// Length-prefix each frame the way the recorder stores them.
inline std::vector<uint8_t> framed(const std::vector<std::vector<uint8_t>>& frames) {
    std::vector<uint8_t> out;
    for (const auto& f : frames) {
        uint8_t prefix[2];
        put_u16(prefix, static_cast<uint16_t>(f.size()));
        out.insert(out.end(), prefix, prefix + 2);
        out.insert(out.end(), f.begin(), f.end());
    }
    return out;
}

/// PCM16 samples as little-endian bytes.
inline std::vector<uint8_t> pcm16_bytes(const std::vector<int16_t>& samples) {
    std::vector<uint8_t> out;
    out.reserve(samples.size() * 2);
    for (int16_t s : samples) {
        const uint16_t v = static_cast<uint16_t>(s);
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>(v >> 8));
    }
    return out;
}

/// `ms` of a 440 Hz tone (amplitude > 0) or digital silence (amplitude 0).
inline std::vector<int16_t> tone(int ms, uint32_t sample_rate = 16000, double amplitude = 8000.0) {
    const size_t n = static_cast<size_t>(sample_rate) * ms / 1000;
    std::vector<int16_t> out(n, 0);
    if (amplitude == 0.0) return out;
    for (size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i) / sample_rate;
        out[i] = static_cast<int16_t>(amplitude * std::sin(2.0 * 3.14159265358979323846 * 440.0 * t));
    }
    return out;
}

inline std::vector<int16_t> silence(int ms, uint32_t sample_rate = 16000) {
    return tone(ms, sample_rate, 0.0);
}

inline std::vector<int16_t> concat(std::vector<int16_t> a, const std::vector<int16_t>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

/// A codec-0 chunk payload: 20 ms frames (320 samples at 16 kHz).
inline std::vector<uint8_t> pcm16_chunk_payload(const std::vector<int16_t>& samples,
                                                size_t frame_samples = 320) {
    std::vector<std::vector<uint8_t>> frames;
    for (size_t off = 0; off < samples.size(); off += frame_samples) {
        const size_t n = std::min(frame_samples, samples.size() - off);
        frames.push_back(pcm16_bytes(std::vector<int16_t>(samples.begin() + off,
                                                          samples.begin() + off + n)));
    }
    return framed(frames);
}

/// Write a chunk file directly, bypassing the recorder.  `header_data_size`
/// overrides the size recorded in the header (0 models a crash before
/// back-fill).
inline std::string write_chunk_file(const std::string& dir, uint32_t ts,
                                    const std::vector<uint8_t>& payload,
                                    ChunkFileKind kind = ChunkFileKind::finalized,
                                    uint8_t codec_id = 0, uint32_t sample_rate = 16000,
                                    std::optional<uint32_t> header_data_size = std::nullopt) {
    fs::create_directories(dir);

    ChunkFileHeader hdr;
    hdr.timestamp   = ts;
    hdr.codec_id    = codec_id;
    hdr.sample_rate = sample_rate;
    hdr.data_size   = header_data_size ? *header_data_size
                                       : static_cast<uint32_t>(payload.size());

    const std::string path = (fs::path(dir) / chunk_file_name(ts, kind)).string();
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    const auto h = encode_file_header(hdr);
    out.write(reinterpret_cast<const char*>(h.data()), static_cast<std::streamsize>(h.size()));
    out.write(reinterpret_cast<const char*>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
    return path;
}

inline std::vector<uint8_t> read_all(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

/// Split a payload into the packets the peripheral would send for it.
inline std::vector<PacketBytes> packetize(uint32_t ts, uint16_t index, uint16_t total,
                                          const std::vector<uint8_t>& payload,
                                          uint8_t codec_id = 0, uint32_t sample_rate = 16000) {
    std::vector<PacketBytes> out;

    ChunkMeta meta;
    meta.data_size   = static_cast<uint32_t>(payload.size());
    meta.codec_id    = codec_id;
    meta.sample_rate = sample_rate;
    meta.crc32       = crc32(payload.data(), payload.size());

    Packet pkt;
    pkt.type         = PacketType::header;
    pkt.chunk_ts     = ts;
    pkt.chunk_idx    = index;
    pkt.total_chunks = total;
    pkt.seq          = 0;
    pkt.total_seqs   = static_cast<uint16_t>(1 + data_packet_count(meta.data_size));
    const auto m = encode_chunk_meta(meta);
    std::copy(m.begin(), m.end(), pkt.payload.begin());
    pkt.payload_len = static_cast<uint16_t>(m.size());
    out.push_back(encode_packet(pkt));

    pkt.type = PacketType::data;
    uint16_t seq = 1;
    for (size_t off = 0; off < payload.size(); off += kPayloadSize) {
        const size_t n = std::min(kPayloadSize, payload.size() - off);
        pkt.seq         = seq++;
        pkt.payload_len = static_cast<uint16_t>(n);
        pkt.payload.fill(0);
        std::copy(payload.begin() + off, payload.begin() + off + n, pkt.payload.begin());
        out.push_back(encode_packet(pkt));
    }
    return out;
}

inline PacketBytes done_packet() {
    Packet pkt;
    pkt.type = PacketType::done;
    return encode_packet(pkt);
}

} // namespace test
} // namespace reclo

#include "WavFile.hpp"

#include "Logging.hpp"
#include "WireFormat.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace reclo {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("stitcher");
}

bool sync_file(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

} // namespace

std::array<uint8_t, kWavHeaderSize> build_wav_header(const WavFormat& fmt, uint32_t data_size) {
    std::array<uint8_t, kWavHeaderSize> h{};

    std::memcpy(&h[0], "RIFF", 4);
    put_u32(&h[4], 36 + data_size);
    std::memcpy(&h[8], "WAVE", 4);

    std::memcpy(&h[12], "fmt ", 4);
    put_u32(&h[16], 16);                 // PCM fmt chunk size
    put_u16(&h[20], 1);                  // PCM
    put_u16(&h[22], fmt.channels);
    put_u32(&h[24], fmt.sample_rate);
    put_u32(&h[28], fmt.byte_rate());
    put_u16(&h[32], fmt.block_align());
    put_u16(&h[34], fmt.bit_depth);

    std::memcpy(&h[36], "data", 4);
    put_u32(&h[40], data_size);
    return h;
}

std::optional<WavFormat> parse_wav_header(const uint8_t* data, size_t len) {
    if (!data || len < kWavHeaderSize) return std::nullopt;
    if (std::memcmp(&data[0], "RIFF", 4) != 0 ||
        std::memcmp(&data[8], "WAVE", 4) != 0 ||
        std::memcmp(&data[12], "fmt ", 4) != 0 ||
        get_u16(&data[20]) != 1) {
        return std::nullopt;
    }

    WavFormat fmt;
    fmt.channels    = get_u16(&data[22]);
    fmt.sample_rate = get_u32(&data[24]);
    fmt.bit_depth   = get_u16(&data[34]);
    return fmt;
}

bool write_wav(const std::string& path, const WavFormat& fmt,
               const std::vector<uint8_t>& pcm) {
    std::error_code ec;
    const fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        logger()->error("Cannot create {}", path);
        return false;
    }

    const auto header = build_wav_header(fmt, static_cast<uint32_t>(pcm.size()));
    out.write(reinterpret_cast<const char*>(header.data()),
              static_cast<std::streamsize>(header.size()));
    out.write(reinterpret_cast<const char*>(pcm.data()),
              static_cast<std::streamsize>(pcm.size()));
    out.close();
    if (!out) {
        logger()->error("Write to {} failed", path);
        return false;
    }

    // The caller acknowledges the chunk on return, so the bytes must be on disk.
    if (!sync_file(path)) {
        logger()->error("fsync({}) failed", path);
        return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> read_file_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

std::vector<uint8_t> samples_to_pcm(const std::vector<int16_t>& samples, int bit_depth) {
    std::vector<uint8_t> out;

    if (bit_depth == 8) {
        out.reserve(samples.size());
        for (int16_t s : samples) {
            out.push_back(static_cast<uint8_t>((s >> 8) + 128));
        }
        return out;
    }

    out.reserve(samples.size() * 2);
    for (int16_t s : samples) {
        const uint16_t v = static_cast<uint16_t>(s);
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>(v >> 8));
    }
    return out;
}

} // namespace reclo

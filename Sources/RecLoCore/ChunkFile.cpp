#include "ChunkFile.hpp"

#include "Logging.hpp"
#include "WireFormat.hpp"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace reclo {

namespace {

constexpr uint8_t kMagic[4] = {'R', 'C', 'L', 'O'};

std::shared_ptr<spdlog::logger> logger() {
    return log::get("store");
}

} // namespace

// ---------------------------------------------------------------------------
// Header codec
// ---------------------------------------------------------------------------

std::array<uint8_t, kFileHeaderSize> encode_file_header(const ChunkFileHeader& hdr) {
    std::array<uint8_t, kFileHeaderSize> out{};
    std::memcpy(out.data(), kMagic, sizeof(kMagic));
    put_u32(&out[kTimestampOffset], hdr.timestamp);
    out[8] = hdr.codec_id;
    put_u32(&out[9], hdr.sample_rate);
    put_u32(&out[kDataSizeOffset], hdr.data_size);
    return out;
}

std::optional<ChunkFileHeader> decode_file_header(const uint8_t* data, size_t len) {
    if (!data || len < kFileHeaderSize) return std::nullopt;
    if (std::memcmp(data, kMagic, sizeof(kMagic)) != 0) return std::nullopt;

    ChunkFileHeader hdr;
    hdr.timestamp   = get_u32(&data[kTimestampOffset]);
    hdr.codec_id    = data[8];
    hdr.sample_rate = get_u32(&data[9]);
    hdr.data_size   = get_u32(&data[kDataSizeOffset]);
    return hdr;
}

// ---------------------------------------------------------------------------
// Naming
// ---------------------------------------------------------------------------

const char* extension_for(ChunkFileKind kind) {
    switch (kind) {
        case ChunkFileKind::finalized:            return ".bin";
        case ChunkFileKind::in_progress:          return ".part";
        case ChunkFileKind::finalized_unsynced:   return ".ubin";
        case ChunkFileKind::in_progress_unsynced: return ".upart";
    }
    return ".bin";
}

std::string chunk_file_name(uint32_t timestamp, ChunkFileKind kind) {
    char stem[16];
    std::snprintf(stem, sizeof(stem), "%010u", static_cast<unsigned>(timestamp));
    return std::string(stem) + extension_for(kind);
}

std::optional<ParsedChunkName> parse_chunk_file_name(const std::string& name) {
    if (name.size() <= kTimestampDigits) return std::nullopt;

    for (size_t i = 0; i < kTimestampDigits; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) return std::nullopt;
    }

    const std::string ext = name.substr(kTimestampDigits);
    ParsedChunkName parsed;
    if (ext == ".bin") {
        parsed.kind = ChunkFileKind::finalized;
    } else if (ext == ".part") {
        parsed.kind = ChunkFileKind::in_progress;
    } else if (ext == ".ubin") {
        parsed.kind = ChunkFileKind::finalized_unsynced;
    } else if (ext == ".upart") {
        parsed.kind = ChunkFileKind::in_progress_unsynced;
    } else {
        return std::nullopt;
    }

    unsigned long long ts = std::stoull(name.substr(0, kTimestampDigits));
    if (ts > 0xFFFFFFFFull) return std::nullopt;
    parsed.timestamp = static_cast<uint32_t>(ts);
    return parsed;
}

bool chunk_timestamp_taken(const std::string& dir, uint32_t timestamp,
                           const std::string& except) {
    for (ChunkFileKind kind : {ChunkFileKind::finalized, ChunkFileKind::in_progress,
                               ChunkFileKind::finalized_unsynced,
                               ChunkFileKind::in_progress_unsynced}) {
        const std::string path = (fs::path(dir) / chunk_file_name(timestamp, kind)).string();
        if (path == except) continue;
        std::error_code ec;
        if (fs::exists(path, ec)) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// ChunkWriter
// ---------------------------------------------------------------------------

ChunkWriter::~ChunkWriter() {
    // An unfinalized file stays under its in-progress name and is picked up
    // by ChunkStore::recover_in_progress() on the next start.
    if (file_.is_open()) file_.close();
}

bool ChunkWriter::open(const std::string& dir, uint32_t timestamp, bool synced,
                       uint8_t codec_id, uint32_t sample_rate) {
    if (open_) return false;

    std::error_code ec;
    fs::create_directories(dir, ec);

    dir_       = dir;
    timestamp_ = timestamp;
    synced_    = synced;
    data_size_ = 0;
    path_      = (fs::path(dir_) / chunk_file_name(
        timestamp, synced ? ChunkFileKind::in_progress
                          : ChunkFileKind::in_progress_unsynced)).string();

    file_.open(path_, std::ios::in | std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file_.is_open()) {
        logger()->error("open({}) failed", path_);
        return false;
    }

    ChunkFileHeader hdr;
    hdr.timestamp   = timestamp;
    hdr.codec_id    = codec_id;
    hdr.sample_rate = sample_rate;
    hdr.data_size   = 0;   // placeholder until finalize()
    auto bytes = encode_file_header(hdr);
    file_.write(reinterpret_cast<const char*>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
    file_.flush();
    if (!file_) {
        logger()->error("header write to {} failed", path_);
        file_.close();
        return false;
    }

    open_ = true;
    return true;
}

bool ChunkWriter::append(const uint8_t* data, size_t len) {
    if (!open_) return false;
    if (len == 0) return true;

    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    file_.flush();
    if (!file_) {
        logger()->error("write of {} bytes to {} failed", len, path_);
        file_.clear();
        return false;
    }
    data_size_ += static_cast<uint32_t>(len);
    return true;
}

bool ChunkWriter::finalize() {
    if (!open_) return false;
    open_ = false;

    uint32_t ts = timestamp_;
    while (chunk_timestamp_taken(dir_, ts, path_)) ++ts;
    if (ts != timestamp_) {
        logger()->warn("Chunk ts={} already on storage; finalizing as ts={}", timestamp_, ts);
        uint8_t ts_le[4];
        put_u32(ts_le, ts);
        file_.seekp(static_cast<std::streamoff>(kTimestampOffset), std::ios::beg);
        file_.write(reinterpret_cast<const char*>(ts_le), sizeof(ts_le));
        timestamp_ = ts;
    }

    uint8_t size_le[4];
    put_u32(size_le, data_size_);
    file_.seekp(static_cast<std::streamoff>(kDataSizeOffset), std::ios::beg);
    file_.write(reinterpret_cast<const char*>(size_le), sizeof(size_le));
    file_.flush();
    bool ok = static_cast<bool>(file_);
    file_.close();

    if (!ok) {
        // Left as in-progress; recovery reads the true size from file length.
        logger()->error("data_size back-fill failed for {}", path_);
        return false;
    }

    const std::string final_path = (fs::path(dir_) / chunk_file_name(
        timestamp_, synced_ ? ChunkFileKind::finalized
                            : ChunkFileKind::finalized_unsynced)).string();

    std::error_code ec;
    fs::rename(path_, final_path, ec);
    if (ec) {
        logger()->error("rename {} -> {} failed: {}", path_, final_path, ec.message());
        return false;
    }

    logger()->info("Finalized chunk ts={} ({} bytes) -> {}", timestamp_, data_size_, final_path);
    path_ = final_path;
    return true;
}

void ChunkWriter::discard() {
    if (!open_) return;
    open_ = false;
    file_.close();

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        logger()->warn("remove({}) failed: {}", path_, ec.message());
    }
}

bool ChunkWriter::retimestamp(uint32_t new_timestamp) {
    if (!open_) return false;

    const std::string new_path = (fs::path(dir_) /
        chunk_file_name(new_timestamp, ChunkFileKind::in_progress)).string();

    if (chunk_timestamp_taken(dir_, new_timestamp, path_)) {
        logger()->warn("retimestamp target ts={} taken; keeping {}", new_timestamp, path_);
        return false;
    }
    std::error_code ec;
    fs::rename(path_, new_path, ec);
    if (ec) {
        logger()->error("rename {} -> {} failed: {}", path_, new_path, ec.message());
        return false;
    }

    uint8_t ts_le[4];
    put_u32(ts_le, new_timestamp);
    file_.seekp(static_cast<std::streamoff>(kTimestampOffset), std::ios::beg);
    file_.write(reinterpret_cast<const char*>(ts_le), sizeof(ts_le));
    file_.seekp(0, std::ios::end);
    file_.flush();
    if (!file_) {
        logger()->warn("header timestamp patch failed for {}", new_path);
        file_.clear();
        file_.seekp(0, std::ios::end);
    }

    logger()->info("Retimestamped open chunk {} -> {}", timestamp_, new_timestamp);
    path_      = new_path;
    timestamp_ = new_timestamp;
    synced_    = true;
    return true;
}

} // namespace reclo

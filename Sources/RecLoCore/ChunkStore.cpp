#include "ChunkStore.hpp"

#include "Logging.hpp"
#include "WireFormat.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace reclo {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("store");
}

struct DirEntry {
    std::string     path;
    ParsedChunkName name;
};

/// Every chunk file in `dir`, in ascending name order.
std::vector<DirEntry> scan(const std::string& dir) {
    std::vector<DirEntry> entries;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return entries;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        auto parsed = parse_chunk_file_name(it->path().filename().string());
        if (!parsed) continue;
        entries.push_back({it->path().string(), *parsed});
    }

    // Zero-padded stems: lexicographic order == numeric order.
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) {
                  return fs::path(a.path).filename() < fs::path(b.path).filename();
              });
    return entries;
}

bool patch_u32(const std::string& path, size_t offset, uint32_t value) {
    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!f.is_open()) return false;

    uint8_t le[4];
    put_u32(le, value);
    f.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
    f.write(reinterpret_cast<const char*>(le), sizeof(le));
    f.flush();
    return static_cast<bool>(f);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

ChunkStore::ChunkStore(std::string dir) : dir_(std::move(dir)) {}

bool ChunkStore::ensure_dir() const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    return !ec && fs::is_directory(dir_, ec);
}

std::string ChunkStore::path_for(uint32_t timestamp, ChunkFileKind kind) const {
    return (fs::path(dir_) / chunk_file_name(timestamp, kind)).string();
}

// ---------------------------------------------------------------------------
// Enumeration
// ---------------------------------------------------------------------------

std::vector<StoredChunk> ChunkStore::list_finalized(size_t max_count,
                                                    std::optional<uint32_t> after) const {
    std::vector<StoredChunk> results;

    for (const auto& entry : scan(dir_)) {
        if (results.size() >= max_count) break;
        if (!is_finalized(entry.name.kind)) continue;
        if (after && entry.name.timestamp <= *after) continue;

        auto info = read_info(entry.path);
        if (!info) continue;   // logged by read_info; file is kept
        results.push_back(std::move(*info));
    }

    return results;
}

size_t ChunkStore::count_finalized(std::optional<uint32_t> after) const {
    size_t count = 0;
    for (const auto& entry : scan(dir_)) {
        if (!is_finalized(entry.name.kind)) continue;
        if (after && entry.name.timestamp <= *after) continue;
        ++count;
    }
    return count;
}

std::optional<uint32_t> ChunkStore::newest_timestamp(bool synced) const {
    std::optional<uint32_t> newest;
    for (const auto& entry : scan(dir_)) {
        if (is_synced(entry.name.kind) != synced) continue;
        if (!newest || entry.name.timestamp > *newest) newest = entry.name.timestamp;
    }
    return newest;
}

// ---------------------------------------------------------------------------
// read_info / read_payload
// ---------------------------------------------------------------------------

std::optional<StoredChunk> ChunkStore::read_info(const std::string& path) const {
    auto parsed = parse_chunk_file_name(fs::path(path).filename().string());
    if (!parsed) return std::nullopt;

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        logger()->error("Cannot open {}", path);
        return std::nullopt;
    }
    const auto file_size = static_cast<uint64_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    uint8_t raw[kFileHeaderSize];
    if (file_size < kFileHeaderSize ||
        !file.read(reinterpret_cast<char*>(raw), sizeof(raw))) {
        logger()->error("Short header in {}", path);
        return std::nullopt;
    }

    auto hdr = decode_file_header(raw, sizeof(raw));
    if (!hdr) {
        logger()->error("Bad magic in {}", path);
        return std::nullopt;
    }

    StoredChunk chunk;
    chunk.path        = path;
    chunk.timestamp   = parsed->timestamp;
    chunk.synced      = is_synced(parsed->kind);
    chunk.codec_id    = hdr->codec_id;
    chunk.sample_rate = hdr->sample_rate;
    chunk.data_size   = hdr->data_size;

    if (hdr->timestamp != parsed->timestamp) {
        // Interrupted retimestamp: the name was updated, the header was not.
        logger()->warn("Header ts={} disagrees with name ts={} in {}; using name",
                       hdr->timestamp, parsed->timestamp, path);
    }

    const uint64_t actual = file_size - kFileHeaderSize;
    if (chunk.data_size == 0 && actual > 0) {
        chunk.data_size = static_cast<uint32_t>(actual);
        chunk.recovered = true;
        logger()->warn("Unfinalized chunk ts={}: recovered data_size={}",
                       chunk.timestamp, chunk.data_size);
    } else if (chunk.data_size > actual) {
        logger()->warn("Chunk ts={} declares {} bytes but holds {}; truncating",
                       chunk.timestamp, chunk.data_size, actual);
        chunk.data_size = static_cast<uint32_t>(actual);
    }

    return chunk;
}

std::optional<std::vector<uint8_t>> ChunkStore::read_payload(const StoredChunk& chunk) const {
    std::ifstream file(chunk.path, std::ios::binary);
    if (!file.is_open()) {
        logger()->error("Cannot open {}", chunk.path);
        return std::nullopt;
    }

    std::vector<uint8_t> payload(chunk.data_size);
    file.seekg(static_cast<std::streamoff>(kFileHeaderSize), std::ios::beg);
    if (!file.read(reinterpret_cast<char*>(payload.data()),
                   static_cast<std::streamsize>(payload.size()))) {
        logger()->error("Short read of {} payload bytes from {}", chunk.data_size, chunk.path);
        return std::nullopt;
    }
    return payload;
}

// ---------------------------------------------------------------------------
// remove
// ---------------------------------------------------------------------------

bool ChunkStore::remove(uint32_t timestamp) const {
    for (ChunkFileKind kind : {ChunkFileKind::finalized, ChunkFileKind::finalized_unsynced}) {
        std::error_code ec;
        if (fs::remove(path_for(timestamp, kind), ec)) {
            logger()->info("Deleted chunk ts={}", timestamp);
            return true;
        }
        if (ec) {
            logger()->warn("Delete chunk ts={}: {}", timestamp, ec.message());
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// recover_in_progress
// ---------------------------------------------------------------------------

size_t ChunkStore::recover_in_progress() const {
    size_t recovered = 0;

    for (const auto& entry : scan(dir_)) {
        if (is_finalized(entry.name.kind)) continue;

        std::error_code ec;
        const auto file_size = fs::file_size(entry.path, ec);
        if (ec) {
            logger()->error("stat({}) failed: {}", entry.path, ec.message());
            continue;
        }

        if (file_size <= kFileHeaderSize) {
            logger()->warn("Removing empty in-progress chunk {}", entry.path);
            fs::remove(entry.path, ec);
            continue;
        }

        const uint32_t data_size = static_cast<uint32_t>(file_size - kFileHeaderSize);
        if (!patch_u32(entry.path, kDataSizeOffset, data_size)) {
            // Still recoverable at read time from the file length.
            logger()->warn("data_size back-fill failed for {}", entry.path);
        }

        uint32_t ts = entry.name.timestamp;
        while (chunk_timestamp_taken(dir_, ts, entry.path)) ++ts;
        if (ts != entry.name.timestamp) {
            logger()->warn("Recovered chunk ts={} collides; renumbered to ts={}",
                           entry.name.timestamp, ts);
            if (!patch_u32(entry.path, kTimestampOffset, ts)) {
                logger()->warn("header timestamp patch failed for {}", entry.path);
            }
        }

        const ChunkFileKind target = is_synced(entry.name.kind)
                                         ? ChunkFileKind::finalized
                                         : ChunkFileKind::finalized_unsynced;
        const std::string final_path = path_for(ts, target);
        fs::rename(entry.path, final_path, ec);
        if (ec) {
            logger()->error("rename {} -> {} failed: {}", entry.path, final_path, ec.message());
            continue;
        }

        logger()->warn("Recovered in-progress chunk ts={} ({} bytes)", ts, data_size);
        ++recovered;
    }

    return recovered;
}

// ---------------------------------------------------------------------------
// retimestamp_unsynced
// ---------------------------------------------------------------------------

size_t ChunkStore::retimestamp_unsynced(uint32_t wall_now, uint32_t monotonic_now) const {
    size_t   renamed = 0;
    uint32_t last    = 0;

    for (const auto& entry : scan(dir_)) {
        if (entry.name.kind != ChunkFileKind::finalized_unsynced) continue;

        // Chunks opened within the same second keep their relative order.
        uint32_t corrected =
            corrected_timestamp(wall_now, monotonic_now, entry.name.timestamp);
        if (renamed > 0 && corrected <= last) corrected = last + 1;
        while (chunk_timestamp_taken(dir_, corrected, entry.path)) ++corrected;
        const std::string new_path = path_for(corrected, ChunkFileKind::finalized);

        std::error_code ec;

        // Rename first: an interrupted pass leaves the file either under its
        // old recoverable name or its new one, never neither.
        fs::rename(entry.path, new_path, ec);
        if (ec) {
            logger()->error("rename {} -> {} failed: {}", entry.path, new_path, ec.message());
            continue;
        }
        if (!patch_u32(new_path, kTimestampOffset, corrected)) {
            logger()->warn("header timestamp patch failed for {}", new_path);
        }

        logger()->info("Retimestamped chunk {} -> {}", entry.name.timestamp, corrected);
        last = corrected;
        ++renamed;
    }

    return renamed;
}

} // namespace reclo

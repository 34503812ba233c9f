#pragma once

#include "ChunkFile.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace reclo {

/// A finalized chunk as seen by enumeration.
struct StoredChunk {
    std::string path;
    uint32_t    timestamp   = 0;     // from the file name
    bool        synced      = true;
    uint8_t     codec_id    = 0;
    uint32_t    sample_rate = 0;
    uint32_t    data_size   = 0;     // recovered from file length if header says 0
    bool        recovered   = false; // header data_size was a stale placeholder
};

/// Directory of chunk files on the peripheral.
///
/// Chunks are durable until remove() is called for their timestamp, which
/// only happens on a matching acknowledgment.  In-progress files are never
/// enumerated; recover_in_progress() turns leftovers from a power loss into
/// finalized chunks.
class ChunkStore {
public:
    explicit ChunkStore(std::string dir);

    const std::string& dir() const { return dir_; }

    /// Create the directory if needed.
    bool ensure_dir() const;

    /// Finalized chunks sorted ascending by timestamp, at most max_count of
    /// them, optionally only those with a timestamp strictly after `after`.
    std::vector<StoredChunk> list_finalized(
        size_t max_count = std::numeric_limits<size_t>::max(),
        std::optional<uint32_t> after = std::nullopt) const;

    /// Number of finalized chunks stored, optionally only those with a
    /// timestamp strictly after `after`.
    size_t count_finalized(std::optional<uint32_t> after = std::nullopt) const;

    /// Highest timestamp of any chunk file, finalized or in progress, on the
    /// synced (.bin/.part) or unsynced (.ubin/.upart) side.
    std::optional<uint32_t> newest_timestamp(bool synced) const;

    /// Read and validate a chunk's header.  A zero data_size is replaced by
    /// (file length - header size).  Returns nullopt on I/O error or bad magic.
    std::optional<StoredChunk> read_info(const std::string& path) const;

    /// Read the payload bytes (data_size of them) following the header.
    std::optional<std::vector<uint8_t>> read_payload(const StoredChunk& chunk) const;

    /// Delete the finalized chunk with this timestamp.  Returns false if no
    /// such chunk exists.
    bool remove(uint32_t timestamp) const;

    /// Finalize every in-progress file left behind by a crash.  Files with
    /// no payload are deleted; a file whose timestamp is already taken is
    /// renumbered to the next free one.  Returns the number recovered.
    size_t recover_in_progress() const;

    /// Rename every finalized unsynced chunk to its wall-clock timestamp:
    ///   corrected = wall_now - (monotonic_now - monotonic_at_open)
    /// Returns the number of chunks renamed.
    size_t retimestamp_unsynced(uint32_t wall_now, uint32_t monotonic_now) const;

private:
    std::string path_for(uint32_t timestamp, ChunkFileKind kind) const;

    std::string dir_;
};

/// Wall-clock timestamp for a chunk opened at monotonic second `opened_at`.
inline uint32_t corrected_timestamp(uint32_t wall_now, uint32_t monotonic_now,
                                    uint32_t opened_at) {
    uint32_t elapsed = monotonic_now >= opened_at ? monotonic_now - opened_at : 0;
    return wall_now >= elapsed ? wall_now - elapsed : 0;
}

} // namespace reclo

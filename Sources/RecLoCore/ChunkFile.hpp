#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>

namespace reclo {

// ===== Chunk file layout =====
//   [0..3]   magic        'RCLO'
//   [4..7]   timestamp    u32 LE
//   [8]      codec_id
//   [9..12]  sample_rate  u32 LE
//   [13..16] data_size    u32 LE  (0 until finalized)
//   [17..]   [len u16 LE][frame bytes] ...

static constexpr size_t kFileHeaderSize     = 17;
static constexpr size_t kDataSizeOffset     = 13;
static constexpr size_t kTimestampOffset    = 4;
static constexpr size_t kFramePrefixSize    = 2;
static constexpr size_t kMaxFrameSize       = 0xFFFF;
static constexpr size_t kTimestampDigits    = 10;

struct ChunkFileHeader {
    uint32_t timestamp   = 0;
    uint8_t  codec_id    = 0;
    uint32_t sample_rate = 0;
    uint32_t data_size   = 0;
};

std::array<uint8_t, kFileHeaderSize> encode_file_header(const ChunkFileHeader& hdr);

/// Returns nullopt on a short buffer or a bad magic.
std::optional<ChunkFileHeader> decode_file_header(const uint8_t* data, size_t len);

// ---------------------------------------------------------------------------
// File naming
// ---------------------------------------------------------------------------

/// A chunk's on-disk state is encoded in its extension.  The stem is the
/// 10-digit zero-padded timestamp so lexicographic order is numeric order.
enum class ChunkFileKind {
    finalized,              // .bin
    in_progress,            // .part
    finalized_unsynced,     // .ubin   (timestamp is monotonic, not wall)
    in_progress_unsynced    // .upart
};

const char* extension_for(ChunkFileKind kind);

/// "<10-digit ts><ext>"
std::string chunk_file_name(uint32_t timestamp, ChunkFileKind kind);

struct ParsedChunkName {
    uint32_t      timestamp = 0;
    ChunkFileKind kind      = ChunkFileKind::finalized;
};

/// Returns nullopt for names that are not chunk files.
std::optional<ParsedChunkName> parse_chunk_file_name(const std::string& name);

/// True if `dir` holds a chunk file for `timestamp` under any of the four
/// extensions, other than the file at `except`.  A timestamp names at most
/// one chunk, so acknowledgments stay unambiguous.
bool chunk_timestamp_taken(const std::string& dir, uint32_t timestamp,
                           const std::string& except = std::string());

inline bool is_finalized(ChunkFileKind k) {
    return k == ChunkFileKind::finalized || k == ChunkFileKind::finalized_unsynced;
}

inline bool is_synced(ChunkFileKind k) {
    return k == ChunkFileKind::finalized || k == ChunkFileKind::in_progress;
}

// ---------------------------------------------------------------------------
// ChunkWriter
// ---------------------------------------------------------------------------

/// Streams one chunk file to disk.
///
/// The file is created under its in-progress name with a zero data_size.
/// finalize() back-fills data_size and renames it to its finalized name,
/// which is the moment it becomes visible to enumeration.
class ChunkWriter {
public:
    ChunkWriter() = default;
    ~ChunkWriter();

    // Non-copyable.
    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    /// Create <dir>/<ts>.part (or .upart when !synced) and write the header.
    bool open(const std::string& dir, uint32_t timestamp, bool synced,
              uint8_t codec_id, uint32_t sample_rate);

    /// Append already-framed bytes.
    bool append(const uint8_t* data, size_t len);

    /// Back-fill data_size, close, and rename to the finalized name.  If
    /// another chunk already holds the timestamp, the next free one is used
    /// and patched into the header; an existing file is never replaced.
    bool finalize();

    /// Close and delete the in-progress file (a chunk with no frames).
    void discard();

    /// Rename the open file to a synced name for new_timestamp and patch
    /// the header timestamp.  The rename happens first; the name is the
    /// authoritative timestamp if the patch is interrupted.
    bool retimestamp(uint32_t new_timestamp);

    bool               is_open() const { return open_; }
    bool               is_synced() const { return synced_; }
    uint32_t           timestamp() const { return timestamp_; }
    uint32_t           data_size() const { return data_size_; }
    const std::string& path() const { return path_; }

private:
    std::fstream file_;
    std::string  dir_;
    std::string  path_;
    uint32_t     timestamp_ = 0;
    uint32_t     data_size_ = 0;
    bool         synced_    = true;
    bool         open_      = false;
};

} // namespace reclo

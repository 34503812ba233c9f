#pragma once

#include "Types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;

namespace reclo {

/// Central-side record of received chunks and stitched conversations.
///
/// Uses SQLite WAL mode for crash-safe writes.  All mutating operations
/// are wrapped in explicit transactions.  A chunk's row is committed
/// before its acknowledgment is sent, so a chunk deleted on the
/// peripheral is always present here.
class ChunkCatalog {
public:
    explicit ChunkCatalog(const std::string& db_path);
    ~ChunkCatalog();

    // Non-copyable.
    ChunkCatalog(const ChunkCatalog&) = delete;
    ChunkCatalog& operator=(const ChunkCatalog&) = delete;

    /// Open (or create) the database and its tables.  Returns false on failure.
    bool open();

    void close();
    bool is_open() const;

    // ---- Chunks ----

    /// Insert a chunk and its silence segments.  A chunk received again
    /// (its acknowledgment was lost) replaces the earlier row.
    bool add_chunk(const AudioChunk& chunk);

    std::optional<AudioChunk> get_chunk(const std::string& id) const;

    /// All chunks, oldest first.
    std::vector<AudioChunk> get_chunks() const;

    // ---- Conversations ----

    /// Insert a conversation and its ordered member list.
    bool add_conversation(const Conversation& conv);

    /// All conversations with their chunks, most recent first.
    std::vector<Conversation> get_conversations() const;

private:
    bool create_tables();

    /// Callers hold mu_.
    std::optional<AudioChunk> load_chunk(const std::string& id) const;
    void load_segments(AudioChunk& chunk) const;

    static int64_t now_unix();

    std::string        db_path_;
    sqlite3*           db_ = nullptr;
    mutable std::mutex mu_;
};

} // namespace reclo

#include "ChunkCatalog.hpp"

#include "Logging.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

#include <sqlite3.h>

namespace reclo {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("catalog");
}

// ---------------------------------------------------------------------------
// RAII helper for SQLite transactions
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        ok_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
    }
    bool ok() const { return ok_; }
    bool commit() {
        if (!committed_) {
            committed_ = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
        }
        return committed_;
    }
    ~Transaction() {
        if (ok_ && !committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

private:
    sqlite3* db_;
    bool ok_        = false;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// RAII helper for SQLite prepared statements
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        int rc = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            logger()->error("prepare failed: {}", sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }
    bool ok() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return t ? t : "";
}

const char* kChunkColumns =
    "id, start_time, file_path, codec_id, sample_rate, "
    "total_speech_ms, total_silence_ms, longest_silence_ms, entirely_silent";

AudioChunk read_chunk_row(sqlite3_stmt* stmt) {
    AudioChunk c;
    c.id          = column_text(stmt, 0);
    c.start_time  = sqlite3_column_int64(stmt, 1);
    c.file_path   = column_text(stmt, 2);
    c.codec_id    = static_cast<uint8_t>(sqlite3_column_int(stmt, 3));
    c.sample_rate = static_cast<uint32_t>(sqlite3_column_int64(stmt, 4));
    c.analysis.total_speech_ms    = sqlite3_column_int64(stmt, 5);
    c.analysis.total_silence_ms   = sqlite3_column_int64(stmt, 6);
    c.analysis.longest_silence_ms = sqlite3_column_int64(stmt, 7);
    c.analysis.entirely_silent    = sqlite3_column_int(stmt, 8) != 0;
    return c;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

ChunkCatalog::ChunkCatalog(const std::string& db_path)
    : db_path_(db_path) {}

ChunkCatalog::~ChunkCatalog() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

bool ChunkCatalog::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return true;   // already open

    if (db_path_.empty()) return false;

    auto parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        logger()->error("Cannot open catalog {}: {}", db_path_,
                        db_ ? sqlite3_errmsg(db_) : "out of memory");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    // WAL for crash safety; foreign keys for segment / membership rows.
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    logger()->info("Catalog open at {}", db_path_);
    return true;
}

void ChunkCatalog::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool ChunkCatalog::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

// ---------------------------------------------------------------------------
// create_tables
// ---------------------------------------------------------------------------

bool ChunkCatalog::create_tables() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS audio_chunks (
            id TEXT PRIMARY KEY,
            start_time INTEGER NOT NULL,
            file_path TEXT NOT NULL,
            codec_id INTEGER NOT NULL,
            sample_rate INTEGER NOT NULL,
            total_speech_ms INTEGER NOT NULL DEFAULT 0,
            total_silence_ms INTEGER NOT NULL DEFAULT 0,
            longest_silence_ms INTEGER NOT NULL DEFAULT 0,
            entirely_silent INTEGER NOT NULL DEFAULT 1,
            created_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS chunk_segments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            chunk_id TEXT NOT NULL,
            start_ms INTEGER NOT NULL,
            end_ms INTEGER NOT NULL,
            is_silent INTEGER NOT NULL,
            FOREIGN KEY (chunk_id) REFERENCES audio_chunks(id)
        );
        CREATE INDEX IF NOT EXISTS idx_segments_chunk
            ON chunk_segments(chunk_id, start_ms);
        CREATE TABLE IF NOT EXISTS conversations (
            id TEXT PRIMARY KEY,
            start_time INTEGER NOT NULL,
            end_time INTEGER NOT NULL,
            stitched_path TEXT,
            speech_ms INTEGER NOT NULL DEFAULT 0,
            silence_removed_ms INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS conversation_chunks (
            conversation_id TEXT NOT NULL,
            chunk_id TEXT NOT NULL,
            position INTEGER NOT NULL,
            PRIMARY KEY (conversation_id, position),
            FOREIGN KEY (conversation_id) REFERENCES conversations(id),
            FOREIGN KEY (chunk_id) REFERENCES audio_chunks(id)
        );
    )SQL";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        logger()->error("Schema creation failed: {}", err ? err : "unknown error");
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Chunk operations
// ---------------------------------------------------------------------------

bool ChunkCatalog::add_chunk(const AudioChunk& chunk) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    {
        const char* sql =
            "INSERT INTO audio_chunks (id, start_time, file_path, codec_id, sample_rate, "
            "total_speech_ms, total_silence_ms, longest_silence_ms, entirely_silent, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET start_time = excluded.start_time, "
            "file_path = excluded.file_path, codec_id = excluded.codec_id, "
            "sample_rate = excluded.sample_rate, total_speech_ms = excluded.total_speech_ms, "
            "total_silence_ms = excluded.total_silence_ms, "
            "longest_silence_ms = excluded.longest_silence_ms, "
            "entirely_silent = excluded.entirely_silent";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return false;

        sqlite3_bind_text(stmt, 1, chunk.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, chunk.start_time);
        sqlite3_bind_text(stmt, 3, chunk.file_path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 4, chunk.codec_id);
        sqlite3_bind_int64(stmt, 5, chunk.sample_rate);
        sqlite3_bind_int64(stmt, 6, chunk.analysis.total_speech_ms);
        sqlite3_bind_int64(stmt, 7, chunk.analysis.total_silence_ms);
        sqlite3_bind_int64(stmt, 8, chunk.analysis.longest_silence_ms);
        sqlite3_bind_int(stmt, 9, chunk.analysis.entirely_silent ? 1 : 0);
        sqlite3_bind_int64(stmt, 10, now_unix());

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            logger()->error("add_chunk({}): {}", chunk.id, sqlite3_errmsg(db_));
            return false;
        }
    }

    // Replace segments from any earlier copy of this chunk.
    {
        Statement stmt(db_, "DELETE FROM chunk_segments WHERE chunk_id = ?");
        if (!stmt.ok()) return false;
        sqlite3_bind_text(stmt, 1, chunk.id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) return false;
    }

    {
        const char* sql =
            "INSERT INTO chunk_segments (chunk_id, start_ms, end_ms, is_silent) "
            "VALUES (?, ?, ?, ?)";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return false;

        for (const auto& seg : chunk.analysis.segments) {
            sqlite3_reset(stmt);
            sqlite3_bind_text(stmt, 1, chunk.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 2, seg.start_ms);
            sqlite3_bind_int64(stmt, 3, seg.end_ms);
            sqlite3_bind_int(stmt, 4, seg.is_silent ? 1 : 0);
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                logger()->error("add_chunk({}) segment: {}", chunk.id, sqlite3_errmsg(db_));
                return false;
            }
        }
    }

    return txn.commit();
}

std::optional<AudioChunk> ChunkCatalog::get_chunk(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return std::nullopt;
    return load_chunk(id);
}

std::vector<AudioChunk> ChunkCatalog::get_chunks() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<AudioChunk> results;
    if (!db_) return results;

    const std::string sql = std::string("SELECT ") + kChunkColumns +
                            " FROM audio_chunks ORDER BY start_time ASC, id ASC";
    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) return results;

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_chunk_row(stmt));
    }
    for (auto& c : results) {
        load_segments(c);
    }

    return results;
}

std::optional<AudioChunk> ChunkCatalog::load_chunk(const std::string& id) const {
    const std::string sql = std::string("SELECT ") + kChunkColumns +
                            " FROM audio_chunks WHERE id = ?";
    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) return std::nullopt;

    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_ROW) return std::nullopt;

    AudioChunk c = read_chunk_row(stmt);
    load_segments(c);
    return c;
}

void ChunkCatalog::load_segments(AudioChunk& chunk) const {
    const char* sql =
        "SELECT start_ms, end_ms, is_silent FROM chunk_segments "
        "WHERE chunk_id = ? ORDER BY start_ms ASC";
    Statement stmt(db_, sql);
    if (!stmt.ok()) return;

    sqlite3_bind_text(stmt, 1, chunk.id.c_str(), -1, SQLITE_TRANSIENT);

    chunk.analysis.segments.clear();
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AudioSegment seg;
        seg.start_ms  = sqlite3_column_int64(stmt, 0);
        seg.end_ms    = sqlite3_column_int64(stmt, 1);
        seg.is_silent = sqlite3_column_int(stmt, 2) != 0;
        chunk.analysis.segments.push_back(seg);
    }
}

// ---------------------------------------------------------------------------
// Conversation operations
// ---------------------------------------------------------------------------

bool ChunkCatalog::add_conversation(const Conversation& conv) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    {
        const char* sql =
            "INSERT INTO conversations (id, start_time, end_time, stitched_path, "
            "speech_ms, silence_removed_ms, created_at) VALUES (?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET start_time = excluded.start_time, "
            "end_time = excluded.end_time, stitched_path = excluded.stitched_path, "
            "speech_ms = excluded.speech_ms, "
            "silence_removed_ms = excluded.silence_removed_ms";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return false;

        sqlite3_bind_text(stmt, 1, conv.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, conv.start_time);
        sqlite3_bind_int64(stmt, 3, conv.end_time);
        if (conv.stitched_path.empty()) {
            sqlite3_bind_null(stmt, 4);
        } else {
            sqlite3_bind_text(stmt, 4, conv.stitched_path.c_str(), -1, SQLITE_TRANSIENT);
        }
        sqlite3_bind_int64(stmt, 5, conv.speech_ms);
        sqlite3_bind_int64(stmt, 6, conv.silence_removed_ms);
        sqlite3_bind_int64(stmt, 7, now_unix());

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            logger()->error("add_conversation({}): {}", conv.id, sqlite3_errmsg(db_));
            return false;
        }
    }

    // Replace the member list of any earlier copy of this conversation.
    {
        Statement stmt(db_, "DELETE FROM conversation_chunks WHERE conversation_id = ?");
        if (!stmt.ok()) return false;
        sqlite3_bind_text(stmt, 1, conv.id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt) != SQLITE_DONE) return false;
    }

    {
        const char* sql =
            "INSERT INTO conversation_chunks (conversation_id, chunk_id, position) "
            "VALUES (?, ?, ?)";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return false;

        int position = 0;
        for (const auto& c : conv.chunks) {
            sqlite3_reset(stmt);
            sqlite3_bind_text(stmt, 1, conv.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, c.id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 3, position++);
            if (sqlite3_step(stmt) != SQLITE_DONE) {
                logger()->error("add_conversation({}) member {}: {}", conv.id, c.id,
                                sqlite3_errmsg(db_));
                return false;
            }
        }
    }

    return txn.commit();
}

std::vector<Conversation> ChunkCatalog::get_conversations() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<Conversation> results;
    if (!db_) return results;

    {
        const char* sql =
            "SELECT id, start_time, end_time, stitched_path, speech_ms, silence_removed_ms "
            "FROM conversations ORDER BY start_time DESC";
        Statement stmt(db_, sql);
        if (!stmt.ok()) return results;

        while (sqlite3_step(stmt) == SQLITE_ROW) {
            Conversation c;
            c.id                 = column_text(stmt, 0);
            c.start_time         = sqlite3_column_int64(stmt, 1);
            c.end_time           = sqlite3_column_int64(stmt, 2);
            c.stitched_path      = column_text(stmt, 3);
            c.speech_ms          = sqlite3_column_int64(stmt, 4);
            c.silence_removed_ms = sqlite3_column_int64(stmt, 5);
            results.push_back(std::move(c));
        }
    }

    const char* sql =
        "SELECT chunk_id FROM conversation_chunks "
        "WHERE conversation_id = ? ORDER BY position ASC";
    for (auto& conv : results) {
        std::vector<std::string> ids;
        {
            Statement stmt(db_, sql);
            if (!stmt.ok()) continue;
            sqlite3_bind_text(stmt, 1, conv.id.c_str(), -1, SQLITE_TRANSIENT);
            while (sqlite3_step(stmt) == SQLITE_ROW) {
                ids.push_back(column_text(stmt, 0));
            }
        }
        for (const auto& id : ids) {
            if (auto chunk = load_chunk(id)) {
                conv.chunks.push_back(std::move(*chunk));
            }
        }
    }

    return results;
}

// ---------------------------------------------------------------------------
// Utility
// ---------------------------------------------------------------------------

int64_t ChunkCatalog::now_unix() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace reclo

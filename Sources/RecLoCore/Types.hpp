#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace reclo {

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

/// Audio codec identifiers carried in chunk files and HEADER packets.
enum class CodecId : uint8_t {
    pcm16      = 0,
    pcm8       = 1,
    opus       = 20,
    opus_fs320 = 21
};

/// Convert a codec id to the name used in logs and the catalog.
inline const char* codec_to_string(uint8_t id) {
    switch (static_cast<CodecId>(id)) {
        case CodecId::pcm16:      return "pcm16";
        case CodecId::pcm8:       return "pcm8";
        case CodecId::opus:       return "opus";
        case CodecId::opus_fs320: return "opus_fs320";
    }
    return "unknown";
}

/// Bits per decoded sample for a codec (Opus decodes to 16-bit PCM).
inline int codec_bit_depth(uint8_t id) {
    return static_cast<CodecId>(id) == CodecId::pcm8 ? 8 : 16;
}

/// Peripheral upload state machine.
enum class UploadState {
    idle,
    upload_requested,
    uploading,
    done,
    aborted
};

inline const char* upload_state_to_string(UploadState s) {
    switch (s) {
        case UploadState::idle:             return "idle";
        case UploadState::upload_requested: return "upload_requested";
        case UploadState::uploading:        return "uploading";
        case UploadState::done:             return "done";
        case UploadState::aborted:          return "aborted";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Structs
// ---------------------------------------------------------------------------

/// A run of consecutive windows with the same speech/silence label.
struct AudioSegment {
    int64_t start_ms  = 0;
    int64_t end_ms    = 0;
    bool    is_silent = false;

    int64_t duration_ms() const { return end_ms - start_ms; }
};

/// Result of running silence analysis over one decoded chunk.
struct SilenceAnalysis {
    std::vector<AudioSegment> segments;
    int64_t total_silence_ms   = 0;
    int64_t total_speech_ms    = 0;
    int64_t longest_silence_ms = 0;
    bool    entirely_silent    = true;
};

/// A decoded, persisted chunk on the central side.
struct AudioChunk {
    std::string     id;             // "chunk_<ts>"
    int64_t         start_time = 0; // Unix timestamp (seconds)
    std::string     file_path;      // decoded WAV file
    uint8_t         codec_id    = 0;
    uint32_t        sample_rate = 0;
    SilenceAnalysis analysis;

    bool has_speech() const { return !analysis.entirely_silent; }
};

/// A run of speech-bearing chunks bounded by a silence gap.
struct Conversation {
    std::string             id;             // "conv_<start ms>"
    int64_t                 start_time = 0; // Unix timestamp (seconds)
    int64_t                 end_time   = 0;
    std::vector<AudioChunk> chunks;
    std::string             stitched_path;
    int64_t                 speech_ms          = 0;
    int64_t                 silence_removed_ms = 0;

    /// Sum of speech across member chunks.
    int64_t total_speech_ms() const {
        int64_t total = 0;
        for (const auto& c : chunks) total += c.analysis.total_speech_ms;
        return total;
    }
};

/// Incremental upload progress reported by the central side.
struct UploadProgress {
    int  chunks_received = 0;
    int  total_chunks    = 0;
    bool complete        = false;

    double fraction() const {
        return total_chunks == 0 ? 0.0
                                 : static_cast<double>(chunks_received) / total_chunks;
    }
};

// ---------------------------------------------------------------------------
// Callback types
// ---------------------------------------------------------------------------

/// Fired after every completed chunk and once more on DONE.
using ProgressCallback = std::function<void(const UploadProgress&)>;

/// Fired when a conversation has been stitched into its output file.
using ConversationReadyCallback = std::function<void(const Conversation&)>;

} // namespace reclo

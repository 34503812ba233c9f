#pragma once

#include "AudioCodec.hpp"
#include "AudioStitcher.hpp"
#include "ChunkCatalog.hpp"
#include "Config.hpp"
#include "SilenceDetector.hpp"
#include "Types.hpp"
#include "WireFormat.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace reclo {

/// Central end of the transport: the control endpoint on the peripheral.
class CentralLink {
public:
    virtual ~CentralLink() = default;

    /// Write a control command.  Returns false on a transport error.
    virtual bool write_control(const std::vector<uint8_t>& bytes) = 0;
};

/// Reassembles uploaded chunks on the central side.
///
/// Packets must be delivered in order and without duplicates.  Exactly one
/// chunk is in flight at a time: a HEADER opens it, DATA packets fill it,
/// and a new HEADER discards whatever was left unfinished.  A completed
/// chunk is verified, decoded, written as WAV, cataloged and only then
/// acknowledged, which is what lets the peripheral delete it.
class TransferClient {
public:
    using Clock = std::chrono::steady_clock;

    /// `catalog` may be null; chunks are then only written as WAV files.
    TransferClient(ClientConfig config, CentralLink& link, ChunkCatalog* catalog = nullptr);

    // Non-copyable.
    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    void set_progress_callback(ProgressCallback cb);
    void set_conversation_callback(ConversationReadyCallback cb);

    /// Begin a session: reset counters and send REQUEST_UPLOAD.
    bool start();

    /// Send ABORT.  The open accumulator, if any, is discarded.
    void stop();

    /// One notification from the data stream.
    void on_packet(const uint8_t* data, size_t len);

    /// Discard an accumulator that has seen no packet for stall_timeout.
    /// Returns true if one was discarded.
    bool check_stall(Clock::time_point now);

    bool   upload_complete() const;
    bool   chunk_in_flight() const;
    int    chunks_received() const;
    size_t chunks_rejected() const;

    /// Chunks completed in the current session, in arrival order.
    std::vector<AudioChunk> session_chunks() const;

private:
    struct IncomingChunk {
        uint32_t             timestamp    = 0;
        uint16_t             chunk_index  = 0;
        uint16_t             total_chunks = 0;
        uint16_t             total_seqs   = 0;
        ChunkMeta            meta;
        std::vector<uint8_t> buffer;
        uint16_t             seqs_received = 1;   // HEADER is seq 0
        Clock::time_point    last_activity;

        bool complete() const { return seqs_received >= total_seqs; }
    };

    /// Callbacks collected under mu_ and fired after it is released.
    struct Events {
        std::vector<UploadProgress> progress;
        std::vector<Conversation>   conversations;
    };

    void handle_header(const Packet& pkt, Events& ev);
    void handle_data(const Packet& pkt, Events& ev);
    void handle_done(Events& ev);

    /// Verify, decode, persist, acknowledge.  Returns false if the chunk was
    /// rejected (no acknowledgment sent).
    bool finalize_chunk(const IncomingChunk& in, Events& ev);

    /// Decode the length-prefixed frames of a chunk; bad frames are skipped.
    std::vector<int16_t> decode_frames(const IncomingChunk& in, AudioDecoder& decoder);

    /// Group bookkeeping after a chunk completes; stitches on a boundary.
    void add_to_group(const AudioChunk& chunk, Events& ev);
    void close_group(Events& ev);

    /// Release `lock` and deliver the collected events.
    void dispatch(Events& ev, std::unique_lock<std::mutex>& lock);

    ClientConfig    config_;
    CentralLink&    link_;
    ChunkCatalog*   catalog_;
    SilenceDetector detector_;
    AudioStitcher   stitcher_;

    mutable std::mutex           mu_;
    std::optional<IncomingChunk> current_;
    std::vector<AudioChunk>      session_chunks_;
    std::vector<AudioChunk>      group_;
    std::vector<SilenceAnalysis> recent_;
    uint16_t                     announced_total_ = 0;
    size_t                       rejected_ = 0;
    bool                         done_     = false;

    ProgressCallback          on_progress_;
    ConversationReadyCallback on_conversation_;
};

} // namespace reclo

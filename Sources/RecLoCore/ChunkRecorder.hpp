#pragma once

#include "ChunkFile.hpp"
#include "ChunkStore.hpp"
#include "Clock.hpp"
#include "Config.hpp"
#include "FrameChannel.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace reclo {

/// Turns a stream of encoded audio frames into fixed-duration chunk files.
///
/// Architecture: every chunk_duration the current file is finalized and a
/// new one is opened.  Frames are length-prefixed into a small write buffer
/// that is flushed to the open file whenever it would overflow, so RAM use
/// is bounded by write_buffer_size regardless of chunk duration.
///
/// Two threads touch the write buffer: the ingest thread (frames from the
/// channel) and the rotation thread (timer).  Both go through mu_.
class ChunkRecorder {
public:
    ChunkRecorder(RecorderConfig config, const Clock& clock);
    ~ChunkRecorder();

    // Non-copyable.
    ChunkRecorder(const ChunkRecorder&) = delete;
    ChunkRecorder& operator=(const ChunkRecorder&) = delete;

    /// Recover in-progress leftovers, open the first chunk, start consuming
    /// `source` (if given) and arm the rotation timer.  Returns false if
    /// already recording or the first chunk cannot be opened.
    bool start(FrameChannel* source = nullptr);

    /// Disarm the timer, detach from the source, finalize the open chunk.
    void stop();

    /// Append one encoded frame.  Frames that arrive while no chunk is open,
    /// or that can never fit the write buffer, are dropped and counted.
    void on_frame(const uint8_t* data, size_t len);

    /// Finalize the current chunk and open the next one.  Called by the
    /// rotation timer; public so rotation can be driven explicitly.
    bool rotate();

    /// Rewrite unsynced timestamps once wall time is known: the open chunk
    /// and every finalized unsynced chunk.  Returns the number renamed.
    size_t retimestamp();

    bool        is_recording() const;
    int         chunk_count() const;
    size_t      dropped_frames() const;
    std::string current_path() const;

private:
    /// Background thread entry points.
    void ingest_loop();
    void rotation_loop();

    /// Open a new chunk file.  Caller holds mu_.
    bool open_new_chunk();

    /// Flush the write buffer, back-fill data_size, publish.  Caller holds mu_.
    void finalize_chunk();

    /// Write the buffered bytes to the open file.  Caller holds mu_.
    void flush_buffer();

    /// Next chunk timestamp; strictly increasing so names never collide.
    uint32_t next_timestamp(bool& synced);

    RecorderConfig      config_;
    const Clock&        clock_;
    ChunkStore          store_;

    // ---- State ----
    std::atomic<bool>   recording_{false};
    std::atomic<size_t> dropped_{0};
    mutable std::mutex  mu_;

    ChunkWriter          writer_;
    std::vector<uint8_t> write_buf_;
    uint32_t             last_ts_ = 0;
    bool                 have_last_ts_ = false;

    // Threads.
    FrameChannel*           source_ = nullptr;
    std::thread             ingest_thread_;
    std::thread             rotation_thread_;
    std::mutex              timer_mu_;
    std::condition_variable timer_cv_;
    bool                    timer_armed_ = false;
};

} // namespace reclo

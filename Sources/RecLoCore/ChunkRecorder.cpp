#include "ChunkRecorder.hpp"

#include "Logging.hpp"
#include "WireFormat.hpp"

#include <algorithm>
#include <exception>

namespace reclo {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("recorder");
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

ChunkRecorder::ChunkRecorder(RecorderConfig config, const Clock& clock)
    : config_(std::move(config)), clock_(clock), store_(config_.storage_dir) {
    write_buf_.reserve(config_.write_buffer_size);
}

ChunkRecorder::~ChunkRecorder() {
    if (recording_.load()) {
        stop();
    }
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------

bool ChunkRecorder::start(FrameChannel* source) {
    {
        std::lock_guard<std::mutex> lock(mu_);

        if (recording_.load()) {
            return false;   // already recording
        }

        if (!store_.ensure_dir()) {
            logger()->error("Cannot create storage dir {}", config_.storage_dir);
            return false;
        }

        // Leftovers from a power loss become ordinary finalized chunks.
        if (size_t n = store_.recover_in_progress()) {
            logger()->warn("Recovered {} in-progress chunk(s) from a previous run", n);
        }

        // The monotonic clock restarts at boot and wall time may repeat a
        // second, so new names continue after what is already on storage.
        if (auto newest = store_.newest_timestamp(clock_.wall_now().has_value())) {
            if (!have_last_ts_ || *newest > last_ts_) last_ts_ = *newest;
            have_last_ts_ = true;
        }

        if (!open_new_chunk()) {
            logger()->error("Failed to open initial chunk file");
            return false;
        }

        recording_.store(true);
    }

    {
        std::lock_guard<std::mutex> lock(timer_mu_);
        timer_armed_ = true;
    }
    rotation_thread_ = std::thread(&ChunkRecorder::rotation_loop, this);

    if (source) {
        source_ = source;
        source_->reopen();
        ingest_thread_ = std::thread(&ChunkRecorder::ingest_loop, this);
    }

    logger()->info("Recorder started (chunk={}ms, write_buf={} bytes, codec={})",
                   config_.chunk_duration.count(), config_.write_buffer_size,
                   codec_to_string(config_.codec_id));
    return true;
}

void ChunkRecorder::stop() {
    if (!recording_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(timer_mu_);
        timer_armed_ = false;
    }
    timer_cv_.notify_all();
    if (rotation_thread_.joinable()) {
        rotation_thread_.join();
    }

    // Detach from the source; frames already queued are still consumed.
    if (source_) {
        source_->close();
        if (ingest_thread_.joinable()) {
            ingest_thread_.join();
        }
        source_ = nullptr;
    }

    recording_.store(false);

    std::lock_guard<std::mutex> lock(mu_);
    finalize_chunk();

    logger()->info("Recorder stopped ({} frames dropped)", dropped_.load());
}

// ---------------------------------------------------------------------------
// on_frame
// ---------------------------------------------------------------------------

void ChunkRecorder::on_frame(const uint8_t* data, size_t len) {
    if (!recording_.load() || !data || len == 0 || len > kMaxFrameSize) {
        ++dropped_;
        return;
    }

    std::lock_guard<std::mutex> lock(mu_);

    if (!writer_.is_open()) {
        ++dropped_;
        return;
    }

    const size_t needed = kFramePrefixSize + len;

    // A frame larger than the buffer can never be buffered.
    if (needed > config_.write_buffer_size) {
        logger()->warn("Frame too large for write buffer ({} bytes); dropping", len);
        ++dropped_;
        return;
    }

    if (write_buf_.size() + needed > config_.write_buffer_size) {
        flush_buffer();
    }

    uint8_t prefix[kFramePrefixSize];
    put_u16(prefix, static_cast<uint16_t>(len));
    write_buf_.insert(write_buf_.end(), prefix, prefix + kFramePrefixSize);
    write_buf_.insert(write_buf_.end(), data, data + len);
}

// ---------------------------------------------------------------------------
// rotate
// ---------------------------------------------------------------------------

bool ChunkRecorder::rotate() {
    std::lock_guard<std::mutex> lock(mu_);

    if (!recording_.load()) {
        return false;
    }

    finalize_chunk();

    if (!open_new_chunk()) {
        // Frames are dropped until the next rotation manages to open a file.
        logger()->error("rotate: failed to open next chunk");
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// retimestamp
// ---------------------------------------------------------------------------

size_t ChunkRecorder::retimestamp() {
    auto wall = clock_.wall_now();
    if (!wall) {
        return 0;
    }
    const uint32_t mono = clock_.monotonic_now();

    std::lock_guard<std::mutex> lock(mu_);
    size_t renamed = store_.retimestamp_unsynced(*wall, mono);

    // New chunks must stay newer than everything already finalized.
    auto finalized = store_.list_finalized();
    if (!finalized.empty()) {
        last_ts_      = std::max(last_ts_, finalized.back().timestamp);
        have_last_ts_ = true;
    }

    if (writer_.is_open() && !writer_.is_synced()) {
        uint32_t corrected = corrected_timestamp(*wall, mono, writer_.timestamp());
        if (!finalized.empty() && corrected <= finalized.back().timestamp) {
            corrected = finalized.back().timestamp + 1;
        }
        if (writer_.retimestamp(corrected)) {
            last_ts_ = std::max(last_ts_, corrected);
            ++renamed;
        }
    }

    return renamed;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

bool ChunkRecorder::is_recording() const {
    return recording_.load();
}

int ChunkRecorder::chunk_count() const {
    return static_cast<int>(store_.count_finalized());
}

size_t ChunkRecorder::dropped_frames() const {
    return dropped_.load();
}

std::string ChunkRecorder::current_path() const {
    std::lock_guard<std::mutex> lock(mu_);
    return writer_.is_open() ? writer_.path() : std::string();
}

// ---------------------------------------------------------------------------
// Threads
// ---------------------------------------------------------------------------

void ChunkRecorder::ingest_loop() {
    try {
        while (auto frame = source_->pop()) {
            on_frame(frame->data(), frame->size());
        }
    } catch (const std::exception& e) {
        logger()->error("Ingest thread stopped: {}", e.what());
    }
}

void ChunkRecorder::rotation_loop() {
    std::unique_lock<std::mutex> lock(timer_mu_);

    while (timer_armed_) {
        if (timer_cv_.wait_for(lock, config_.chunk_duration,
                               [this] { return !timer_armed_; })) {
            break;
        }

        lock.unlock();
        try {
            rotate();
        } catch (const std::exception& e) {
            logger()->error("Rotation failed: {}", e.what());
        }
        lock.lock();
    }
}

// ---------------------------------------------------------------------------
// Chunk file helpers
// ---------------------------------------------------------------------------

uint32_t ChunkRecorder::next_timestamp(bool& synced) {
    auto wall = clock_.wall_now();
    synced = wall.has_value();

    uint32_t ts = synced ? *wall : clock_.monotonic_now();
    if (have_last_ts_ && ts <= last_ts_) {
        ts = last_ts_ + 1;
    }
    while (chunk_timestamp_taken(config_.storage_dir, ts)) ++ts;
    last_ts_      = ts;
    have_last_ts_ = true;
    return ts;
}

bool ChunkRecorder::open_new_chunk() {
    bool synced = true;
    const uint32_t ts = next_timestamp(synced);

    write_buf_.clear();
    if (!writer_.open(config_.storage_dir, ts, synced,
                      config_.codec_id, config_.sample_rate)) {
        return false;
    }

    if (!synced) {
        logger()->info("Opened unsynced chunk (monotonic ts={})", ts);
    }
    return true;
}

void ChunkRecorder::flush_buffer() {
    if (write_buf_.empty()) {
        return;
    }
    if (!writer_.append(write_buf_.data(), write_buf_.size())) {
        logger()->error("Flush of {} bytes failed; chunk ts={} may be incomplete",
                        write_buf_.size(), writer_.timestamp());
    }
    write_buf_.clear();
}

void ChunkRecorder::finalize_chunk() {
    if (!writer_.is_open()) {
        return;
    }

    flush_buffer();

    if (writer_.data_size() == 0) {
        writer_.discard();   // nothing recorded in this window
        return;
    }

    if (!writer_.finalize()) {
        logger()->error("Failed to finalize chunk ts={}", writer_.timestamp());
    }
    // finalize() may have moved the chunk to a later free timestamp.
    last_ts_ = std::max(last_ts_, writer_.timestamp());
}

} // namespace reclo

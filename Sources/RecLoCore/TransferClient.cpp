#include "TransferClient.hpp"

#include "Logging.hpp"
#include "WavFile.hpp"

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace reclo {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("client");
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TransferClient::TransferClient(ClientConfig config, CentralLink& link, ChunkCatalog* catalog)
    : config_(std::move(config)),
      link_(link),
      catalog_(catalog),
      detector_(config_.analysis_window_ms),
      stitcher_(config_.conversations_dir, config_.analysis_window_ms) {}

void TransferClient::set_progress_callback(ProgressCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    on_progress_ = std::move(cb);
}

void TransferClient::set_conversation_callback(ConversationReadyCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    on_conversation_ = std::move(cb);
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------

bool TransferClient::start() {
    {
        std::lock_guard<std::mutex> lock(mu_);

        std::error_code ec;
        fs::create_directories(config_.chunks_dir, ec);
        if (ec) {
            logger()->error("Cannot create {}: {}", config_.chunks_dir, ec.message());
            return false;
        }

        // Chunks of an interrupted session stay in group_ and join the
        // next conversation.
        current_.reset();
        session_chunks_.clear();
        announced_total_ = 0;
        rejected_        = 0;
        done_            = false;
    }

    if (!link_.write_control(encode_request_upload())) {
        logger()->error("REQUEST_UPLOAD write failed");
        return false;
    }
    logger()->info("Upload requested");
    return true;
}

void TransferClient::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (current_) {
            logger()->info("Discarding partial chunk ts={} on stop", current_->timestamp);
            current_.reset();
        }
    }
    if (!link_.write_control(encode_abort())) {
        logger()->warn("ABORT write failed");
    }
}

// ---------------------------------------------------------------------------
// Packet dispatch
// ---------------------------------------------------------------------------

void TransferClient::on_packet(const uint8_t* data, size_t len) {
    std::unique_lock<std::mutex> lock(mu_);
    Events ev;

    try {
        if (len != kPacketSize) {
            logger()->warn("Unexpected packet size {}; dropped", len);
            return;
        }

        auto pkt = decode_packet(data, len);
        if (!pkt) {
            logger()->warn("Malformed packet (type 0x{:02x}); dropped", data ? data[0] : 0);
            return;
        }

        switch (pkt->type) {
            case PacketType::header: handle_header(*pkt, ev); break;
            case PacketType::data:   handle_data(*pkt, ev);   break;
            case PacketType::done:   handle_done(ev);         break;
        }
    } catch (const std::exception& e) {
        logger()->error("Packet handling failed: {}", e.what());
        current_.reset();
    }

    dispatch(ev, lock);
}

void TransferClient::handle_header(const Packet& pkt, Events& ev) {
    auto meta = decode_chunk_meta(pkt.payload.data(), pkt.payload_len);
    if (!meta) {
        logger()->warn("Header payload too short ({} bytes); dropped", pkt.payload_len);
        return;
    }

    if (current_ && !current_->complete()) {
        logger()->warn("Chunk ts={} superseded after {}/{} seqs", current_->timestamp,
                       current_->seqs_received, current_->total_seqs);
    }

    IncomingChunk in;
    in.timestamp     = pkt.chunk_ts;
    in.chunk_index   = pkt.chunk_idx;
    in.total_chunks  = pkt.total_chunks;
    in.total_seqs    = pkt.total_seqs;
    in.meta          = *meta;
    in.last_activity = Clock::now();
    in.buffer.reserve(meta->data_size);

    announced_total_ = pkt.total_chunks;
    logger()->debug("Chunk {}/{} ts={} size={} seqs={}", pkt.chunk_idx, pkt.total_chunks,
                    pkt.chunk_ts, meta->data_size, pkt.total_seqs);

    current_ = std::move(in);

    if (current_->complete()) {
        IncomingChunk done = std::move(*current_);
        current_.reset();
        finalize_chunk(done, ev);
    }
}

void TransferClient::handle_data(const Packet& pkt, Events& ev) {
    if (!current_) {
        logger()->debug("DATA ts={} seq={} without HEADER; dropped", pkt.chunk_ts, pkt.seq);
        return;
    }
    if (pkt.chunk_ts != current_->timestamp) {
        logger()->warn("DATA ts={} does not match open chunk ts={}; dropped",
                       pkt.chunk_ts, current_->timestamp);
        return;
    }
    current_->buffer.insert(current_->buffer.end(), pkt.payload.begin(),
                            pkt.payload.begin() + pkt.payload_len);
    ++current_->seqs_received;
    current_->last_activity = Clock::now();

    if (current_->complete()) {
        IncomingChunk done = std::move(*current_);
        current_.reset();
        finalize_chunk(done, ev);
    }
}

void TransferClient::handle_done(Events& ev) {
    if (current_) {
        logger()->warn("DONE with chunk ts={} incomplete; discarded", current_->timestamp);
        current_.reset();
    }

    const int received = static_cast<int>(session_chunks_.size());
    logger()->info("Upload done: {} chunk(s) received, {} rejected", received, rejected_);

    UploadProgress p;
    p.chunks_received = received;
    p.total_chunks    = received;
    p.complete        = true;
    ev.progress.push_back(p);

    done_ = true;
    close_group(ev);
}

// ---------------------------------------------------------------------------
// Chunk completion
// ---------------------------------------------------------------------------

bool TransferClient::finalize_chunk(const IncomingChunk& in, Events& ev) {
    if (in.buffer.size() != in.meta.data_size) {
        logger()->warn("Chunk ts={}: {} bytes received, {} declared; not acknowledged",
                       in.timestamp, in.buffer.size(), in.meta.data_size);
        ++rejected_;
        return false;
    }

    const uint32_t crc = crc32(in.buffer.data(), in.buffer.size());
    if (crc != in.meta.crc32) {
        logger()->warn("Chunk ts={}: checksum 0x{:08x} != declared 0x{:08x}; not acknowledged",
                       in.timestamp, crc, in.meta.crc32);
        ++rejected_;
        return false;
    }

    std::unique_ptr<AudioDecoder> decoder;
    try {
        decoder = make_decoder(in.meta.codec_id, in.meta.sample_rate);
    } catch (const std::runtime_error& e) {
        logger()->error("Chunk ts={}: {}", in.timestamp, e.what());
    }
    if (!decoder) {
        logger()->warn("Chunk ts={}: codec {} not decodable; not acknowledged",
                       in.timestamp, in.meta.codec_id);
        ++rejected_;
        return false;
    }

    const std::vector<int16_t> samples = decode_frames(in, *decoder);

    AudioChunk chunk;
    chunk.id          = "chunk_" + std::to_string(in.timestamp);
    chunk.start_time  = in.timestamp;
    chunk.codec_id    = in.meta.codec_id;
    chunk.sample_rate = in.meta.sample_rate;
    chunk.file_path   = (fs::path(config_.chunks_dir) / (chunk.id + ".wav")).string();

    WavFormat fmt;
    fmt.sample_rate = in.meta.sample_rate;
    fmt.bit_depth   = static_cast<uint16_t>(codec_bit_depth(in.meta.codec_id));
    if (!write_wav(chunk.file_path, fmt, samples_to_pcm(samples, fmt.bit_depth))) {
        ++rejected_;
        return false;
    }

    chunk.analysis = detector_.analyze(samples, in.meta.sample_rate,
                                       config_.silence_threshold_db);

    if (catalog_ && !catalog_->add_chunk(chunk)) {
        logger()->error("Chunk ts={}: catalog write failed; not acknowledged", in.timestamp);
        ++rejected_;
        return false;
    }

    // Commit point: the peripheral deletes its copy on this ACK.
    if (!link_.write_control(encode_ack_chunk(in.timestamp))) {
        logger()->warn("ACK write for ts={} failed; chunk will be re-sent", in.timestamp);
    }

    session_chunks_.push_back(chunk);
    logger()->info("Saved {} ({} ms speech, {} ms silence)", chunk.id,
                   chunk.analysis.total_speech_ms, chunk.analysis.total_silence_ms);

    UploadProgress p;
    p.chunks_received = static_cast<int>(session_chunks_.size());
    p.total_chunks    = announced_total_;
    ev.progress.push_back(p);

    add_to_group(chunk, ev);
    return true;
}

std::vector<int16_t> TransferClient::decode_frames(const IncomingChunk& in, AudioDecoder& decoder) {
    std::vector<int16_t> samples;
    const std::vector<uint8_t>& buf = in.buffer;

    size_t offset = 0;
    size_t skipped = 0;
    while (offset + 2 <= buf.size()) {
        const size_t frame_len = get_u16(&buf[offset]);
        offset += 2;

        if (frame_len == 0 || offset + frame_len > buf.size()) {
            logger()->warn("Chunk ts={}: bad frame length {} at offset {}; rest ignored",
                           in.timestamp, frame_len, offset - 2);
            break;
        }

        try {
            auto pcm = decoder.decode(&buf[offset], frame_len);
            samples.insert(samples.end(), pcm.begin(), pcm.end());
        } catch (const std::runtime_error& e) {
            ++skipped;
            logger()->debug("Chunk ts={}: frame at offset {} skipped: {}",
                            in.timestamp, offset, e.what());
        }
        offset += frame_len;
    }

    if (skipped > 0) {
        logger()->warn("Chunk ts={}: {} frame(s) failed to decode", in.timestamp, skipped);
    }
    return samples;
}

// ---------------------------------------------------------------------------
// Conversation grouping
// ---------------------------------------------------------------------------

void TransferClient::add_to_group(const AudioChunk& chunk, Events& ev) {
    group_.push_back(chunk);
    recent_.push_back(chunk.analysis);

    if (SilenceDetector::is_conversation_boundary(recent_, config_.conversation_gap)) {
        logger()->info("Conversation boundary after {}", chunk.id);
        close_group(ev);
    }
}

void TransferClient::close_group(Events& ev) {
    std::vector<AudioChunk> speech;
    for (auto& c : group_) {
        if (c.has_speech()) speech.push_back(std::move(c));
    }
    group_.clear();
    recent_.clear();

    if (speech.empty()) return;

    Conversation conv;
    conv.id         = "conv_" + std::to_string(speech.front().start_time * 1000);
    conv.start_time = speech.front().start_time;
    const auto& last_segments = speech.back().analysis.segments;
    const int64_t last_ms = last_segments.empty() ? 0 : last_segments.back().end_ms;
    conv.end_time   = speech.back().start_time + (last_ms + 999) / 1000;
    conv.chunks     = std::move(speech);

    StitchResult r = stitcher_.stitch(conv, config_.silence_threshold_db);
    if (!r.success) {
        logger()->warn("Stitch of {} failed: {}", conv.id, r.error);
        return;
    }

    conv.stitched_path      = r.output_path;
    conv.speech_ms          = r.speech_ms;
    conv.silence_removed_ms = r.silence_removed_ms;

    if (catalog_ && !catalog_->add_conversation(conv)) {
        logger()->error("Catalog write for {} failed", conv.id);
    }

    logger()->info("Conversation ready: {} ({} chunk(s), {} ms speech)",
                   conv.id, conv.chunks.size(), conv.speech_ms);
    ev.conversations.push_back(std::move(conv));
}

// ---------------------------------------------------------------------------
// check_stall
// ---------------------------------------------------------------------------

bool TransferClient::check_stall(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!current_) return false;
    if (now - current_->last_activity < config_.stall_timeout) return false;

    logger()->warn("Chunk ts={} stalled at {}/{} seqs; discarded", current_->timestamp,
                   current_->seqs_received, current_->total_seqs);
    current_.reset();
    return true;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

bool TransferClient::upload_complete() const {
    std::lock_guard<std::mutex> lock(mu_);
    return done_;
}

bool TransferClient::chunk_in_flight() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_.has_value();
}

int TransferClient::chunks_received() const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(session_chunks_.size());
}

size_t TransferClient::chunks_rejected() const {
    std::lock_guard<std::mutex> lock(mu_);
    return rejected_;
}

std::vector<AudioChunk> TransferClient::session_chunks() const {
    std::lock_guard<std::mutex> lock(mu_);
    return session_chunks_;
}

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------

void TransferClient::dispatch(Events& ev, std::unique_lock<std::mutex>& lock) {
    ProgressCallback          on_progress     = on_progress_;
    ConversationReadyCallback on_conversation = on_conversation_;
    lock.unlock();

    if (on_progress) {
        for (const auto& p : ev.progress) on_progress(p);
    }
    if (on_conversation) {
        for (const auto& c : ev.conversations) on_conversation(c);
    }
}

} // namespace reclo

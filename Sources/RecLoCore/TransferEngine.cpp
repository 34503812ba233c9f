#include "TransferEngine.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <limits>

namespace reclo {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("transfer");
}

uint16_t clamp_u16(size_t v) {
    return static_cast<uint16_t>(std::min<size_t>(v, std::numeric_limits<uint16_t>::max()));
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

TransferEngine::TransferEngine(TransferConfig config)
    : config_(std::move(config)), store_(config_.storage_dir) {}

TransferEngine::~TransferEngine() {
    stop();
}

bool TransferEngine::start() {
    std::lock_guard<std::mutex> lock(mu_);
    if (upload_thread_.joinable()) {
        return false;
    }
    stopping_ = false;
    upload_thread_ = std::thread(&TransferEngine::upload_loop, this);
    logger()->info("Transfer engine started (storage={}, max {} chunks/pass)",
                   store_.dir(), config_.max_chunks_per_pass);
    return true;
}

void TransferEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!upload_thread_.joinable()) {
            return;
        }
        stopping_ = true;
        if (pending_) pending_->upload_active.store(false);
        if (current_) current_->upload_active.store(false);
    }
    cv_.notify_all();
    upload_thread_.join();

    std::lock_guard<std::mutex> lock(mu_);
    pending_.reset();
    idle_cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Connection events
// ---------------------------------------------------------------------------

std::shared_ptr<TransferSession> TransferEngine::on_connected(PeripheralLink& link) {
    logger()->info("Transfer: device connected");
    return std::make_shared<TransferSession>(link);
}

void TransferEngine::on_disconnected(TransferSession& session) {
    // Nothing about a partial upload is persisted: the next REQUEST_UPLOAD
    // re-enumerates, and acknowledged chunks are already gone.
    session.upload_active.store(false);
    session.notify_enabled.store(false);
    session.connected.store(false);
    logger()->info("Transfer: device disconnected");
}

void TransferEngine::on_notify_changed(TransferSession& session, bool enabled) {
    session.notify_enabled.store(enabled);
    logger()->info("Data notifications: {}", enabled ? "on" : "off");
}

// ---------------------------------------------------------------------------
// handle_control
// ---------------------------------------------------------------------------

void TransferEngine::handle_control(TransferSession& session, const uint8_t* data, size_t len) {
    if (!data || len == 0) {
        logger()->warn("Empty control write ignored");
        return;
    }

    auto msg = decode_control(data, len);
    if (!msg) {
        if (data[0] == static_cast<uint8_t>(ControlCommand::ack_chunk)) {
            logger()->warn("Truncated ACK_CHUNK ({} bytes) ignored", len);
        } else {
            logger()->warn("Unknown control command: 0x{:02x}", data[0]);
        }
        return;
    }

    switch (msg->command) {
        case ControlCommand::request_upload: {
            std::unique_lock<std::mutex> lock(mu_);
            if (session.upload_active.load()) {
                lock.unlock();
                logger()->debug("REQUEST_UPLOAD while uploading; ignored");
                break;
            }
            // A run still unwinding from ABORT sees the new id and stops.
            session.upload_active.store(true);
            const uint64_t request = ++session.request_id;
            set_state(session, UploadState::upload_requested);
            pending_ = session.shared_from_this();
            lock.unlock();

            cv_.notify_all();
            logger()->info("Upload requested by central (request {})", request);
            break;
        }

        case ControlCommand::ack_chunk:
            if (!store_.remove(msg->timestamp)) {
                logger()->debug("ACK for unknown chunk ts={}", msg->timestamp);
            }
            break;

        case ControlCommand::abort:
            session.upload_active.store(false);
            logger()->info("Upload aborted by central");
            break;
    }
}

bool TransferEngine::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !pending_ && !busy_; });
}

// ---------------------------------------------------------------------------
// Upload thread
// ---------------------------------------------------------------------------

void TransferEngine::upload_loop() {
    std::unique_lock<std::mutex> lock(mu_);

    while (true) {
        cv_.wait(lock, [this] { return stopping_ || pending_ != nullptr; });
        if (stopping_) break;

        current_ = std::move(pending_);
        busy_ = true;
        auto session = current_;
        const uint64_t request = session->request_id.load();
        lock.unlock();

        try {
            run_upload(*session, request);
        } catch (const std::exception& e) {
            logger()->error("Upload failed: {}", e.what());
            finish_run(*session, request, UploadState::aborted);
        }

        lock.lock();
        current_.reset();
        busy_ = false;
        idle_cv_.notify_all();
    }
}

void TransferEngine::run_upload(TransferSession& session, uint64_t request) {
    if (!session.can_send()) {
        logger()->warn("Upload requested without an open notify stream");
        finish_run(session, request, UploadState::aborted);
        return;
    }

    set_state(session, UploadState::uploading);

    // Multi-pass enumeration: each pass takes the next max_chunks_per_pass
    // chunks after the last one sent, so a backlog larger than one pass is
    // still drained in a single session.
    std::optional<uint32_t> last_sent;
    size_t index = 0;
    bool transport_failed = false;

    while (session.run_wanted(request) && !transport_failed) {
        const auto batch = store_.list_finalized(config_.max_chunks_per_pass, last_sent);
        if (batch.empty()) break;

        const size_t total = index + store_.count_finalized(last_sent);
        logger()->info("Upload pass: {} chunk(s), {} announced", batch.size(), total);

        for (const auto& chunk : batch) {
            if (!session.run_wanted(request)) break;
            last_sent = chunk.timestamp;

            const SendResult r = upload_one(session, request, chunk,
                                            clamp_u16(index), clamp_u16(total));
            ++index;

            if (r == SendResult::cancelled) break;
            if (r == SendResult::transport_error) {
                transport_failed = true;
                break;
            }
            if (r == SendResult::storage_error) {
                logger()->warn("Chunk ts={} upload error; continuing", chunk.timestamp);
            }

            pace(config_.chunk_delay);
        }
    }

    UploadState outcome = UploadState::aborted;
    if (session.run_wanted(request) && !transport_failed) {
        Packet done;
        done.type = PacketType::done;
        if (send(session, done)) {
            logger()->info("Upload complete ({} chunk(s))", index);
            outcome = UploadState::done;
        }
    }

    finish_run(session, request, outcome);
}

void TransferEngine::finish_run(TransferSession& session, uint64_t request,
                                UploadState outcome) {
    std::lock_guard<std::mutex> lock(mu_);
    if (session.request_id.load() != request) {
        logger()->debug("Upload run {} replaced by request {}", request,
                        session.request_id.load());
        return;
    }
    set_state(session, outcome);
    session.upload_active.store(false);
    set_state(session, UploadState::idle);
}

TransferEngine::SendResult TransferEngine::upload_one(TransferSession& session,
                                                      uint64_t request,
                                                      const StoredChunk& chunk,
                                                      uint16_t index, uint16_t total) {
    if (chunk.data_size == 0) {
        logger()->warn("Skipping empty chunk ts={}", chunk.timestamp);
        return SendResult::skipped;
    }

    auto payload = store_.read_payload(chunk);
    if (!payload) {
        return SendResult::storage_error;
    }

    const uint32_t data_size  = static_cast<uint32_t>(payload->size());
    const uint16_t total_seqs = static_cast<uint16_t>(1 + data_packet_count(data_size));

    ChunkMeta meta;
    meta.data_size   = data_size;
    meta.codec_id    = chunk.codec_id;
    meta.sample_rate = chunk.sample_rate;
    meta.crc32       = crc32(payload->data(), payload->size());

    // ---- HEADER ----
    Packet pkt;
    pkt.type         = PacketType::header;
    pkt.chunk_ts     = chunk.timestamp;
    pkt.chunk_idx    = index;
    pkt.total_chunks = total;
    pkt.seq          = 0;
    pkt.total_seqs   = total_seqs;
    const auto meta_bytes = encode_chunk_meta(meta);
    std::memcpy(pkt.payload.data(), meta_bytes.data(), meta_bytes.size());
    pkt.payload_len  = static_cast<uint16_t>(meta_bytes.size());

    if (!session.run_wanted(request)) return SendResult::cancelled;
    if (!send(session, pkt)) return SendResult::transport_error;

    pace(config_.header_delay);

    // ---- DATA ----
    pkt.type = PacketType::data;
    size_t offset = 0;
    uint16_t seq = 1;
    while (offset < payload->size()) {
        if (!session.run_wanted(request)) {
            logger()->info("Upload of chunk ts={} cancelled at seq {}", chunk.timestamp, seq);
            return SendResult::cancelled;
        }

        const size_t n = std::min(kPayloadSize, payload->size() - offset);
        pkt.seq         = seq++;
        pkt.payload_len = static_cast<uint16_t>(n);
        pkt.payload.fill(0);
        std::memcpy(pkt.payload.data(), payload->data() + offset, n);
        offset += n;

        if (!send(session, pkt)) return SendResult::transport_error;
        pace(config_.packet_delay);
    }

    logger()->info("Uploaded chunk {}/{} ts={} ({} seqs{})", index + 1, total,
                   chunk.timestamp, total_seqs, chunk.recovered ? ", recovered" : "");
    return SendResult::ok;
}

bool TransferEngine::send(TransferSession& session, const Packet& pkt) {
    if (!session.can_send()) {
        logger()->warn("Notify stream closed; dropping packet type {}",
                       static_cast<int>(pkt.type));
        return false;
    }
    if (!session.link.notify(encode_packet(pkt))) {
        logger()->error("notify failed (type {}, ts={}, seq={})",
                        static_cast<int>(pkt.type), pkt.chunk_ts, pkt.seq);
        return false;
    }
    return true;
}

void TransferEngine::set_state(TransferSession& session, UploadState state) {
    const UploadState prev = session.state.exchange(state);
    if (prev != state) {
        logger()->debug("Upload state {} -> {}", upload_state_to_string(prev),
                        upload_state_to_string(state));
    }
}

void TransferEngine::pace(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

} // namespace reclo

#pragma once

#include "ChunkStore.hpp"
#include "Config.hpp"
#include "Types.hpp"
#include "WireFormat.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace reclo {

/// Peripheral end of the transport: the notify stream toward the central.
class PeripheralLink {
public:
    virtual ~PeripheralLink() = default;

    /// Deliver one packet.  Returns false on a transport error.
    virtual bool notify(const PacketBytes& packet) = 0;
};

/// State of one connection.  Created by TransferEngine::on_connected and
/// handed back to every handler; the engine keeps no connection globals.
/// The link must outlive the session.
struct TransferSession : std::enable_shared_from_this<TransferSession> {
    explicit TransferSession(PeripheralLink& l) : link(l) {}

    PeripheralLink&           link;
    std::atomic<bool>         connected{true};
    std::atomic<bool>         notify_enabled{false};
    std::atomic<bool>         upload_active{false};
    std::atomic<uint64_t>     request_id{0};   // bumped by each accepted REQUEST_UPLOAD
    std::atomic<UploadState>  state{UploadState::idle};

    bool can_send() const { return connected.load() && notify_enabled.load(); }

    /// True while the upload started for `request` has been neither aborted
    /// nor replaced by a newer request.
    bool run_wanted(uint64_t request) const {
        return upload_active.load() && request_id.load() == request;
    }
};

/// Drives the peripheral side of the chunk transfer protocol.
///
/// Control writes are handled on the caller's thread.  Uploads run on a
/// dedicated thread that sleeps until REQUEST_UPLOAD wakes it, so a slow
/// upload never blocks command handling (ACK_CHUNK and ABORT arrive while
/// packets are still being sent).
class TransferEngine {
public:
    explicit TransferEngine(TransferConfig config);
    ~TransferEngine();

    // Non-copyable.
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /// Start the upload thread.
    bool start();

    /// Cancel any upload and join the upload thread.
    void stop();

    // ---- Connection events ----
    std::shared_ptr<TransferSession> on_connected(PeripheralLink& link);
    void on_disconnected(TransferSession& session);
    void on_notify_changed(TransferSession& session, bool enabled);

    /// A write to the control endpoint.  Malformed writes are logged and
    /// ignored.
    void handle_control(TransferSession& session, const uint8_t* data, size_t len);

    /// Block until no upload is queued or running.  Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    const ChunkStore& store() const { return store_; }

private:
    enum class SendResult { ok, skipped, cancelled, transport_error, storage_error };

    void upload_loop();
    void run_upload(TransferSession& session, uint64_t request);
    SendResult upload_one(TransferSession& session, uint64_t request,
                          const StoredChunk& chunk, uint16_t index, uint16_t total);

    /// End the run for `request`.  A run that a newer request has replaced
    /// leaves the session's flags and state to that request.
    void finish_run(TransferSession& session, uint64_t request, UploadState outcome);
    bool send(TransferSession& session, const Packet& pkt);
    void set_state(TransferSession& session, UploadState state);
    static void pace(std::chrono::milliseconds delay);

    TransferConfig config_;
    ChunkStore     store_;

    std::mutex                       mu_;
    std::condition_variable          cv_;
    std::condition_variable          idle_cv_;
    std::shared_ptr<TransferSession> pending_;
    bool                             busy_     = false;
    bool                             stopping_ = false;
    std::shared_ptr<TransferSession> current_;
    std::thread                      upload_thread_;
};

} // namespace reclo

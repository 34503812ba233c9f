#include "ChunkStore.hpp"
#include "TestSupport.hpp"
#include "TransferEngine.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

using namespace reclo;
using namespace reclo::test;

namespace {

/// Records every packet; an optional hook runs before recording and may
/// report a transport failure by returning false.
class CapturingLink : public PeripheralLink {
public:
    bool notify(const PacketBytes& bytes) override {
        auto pkt = decode_packet(bytes.data(), bytes.size());
        if (!pkt) {
            ADD_FAILURE() << "engine sent an undecodable packet";
            return false;
        }
        if (hook && !hook(*pkt)) return false;
        std::lock_guard<std::mutex> lock(mu);
        packets.push_back(*pkt);
        return true;
    }

    std::vector<Packet> sent() {
        std::lock_guard<std::mutex> lock(mu);
        return packets;
    }

    std::vector<Packet> of_type(PacketType t) {
        std::vector<Packet> out;
        for (const auto& p : sent()) {
            if (p.type == t) out.push_back(p);
        }
        return out;
    }

    std::function<bool(const Packet&)> hook;

private:
    std::mutex          mu;
    std::vector<Packet> packets;
};

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.storage_dir  = tmp_.str("chunks");
        config_.header_delay = std::chrono::milliseconds(0);
        config_.packet_delay = std::chrono::milliseconds(0);
        config_.chunk_delay  = std::chrono::milliseconds(0);
    }

    void TearDown() override {
        if (engine_) engine_->stop();
    }

    TransferSession& connect() {
        engine_ = std::make_unique<TransferEngine>(config_);
        engine_->start();
        session_ = engine_->on_connected(link_);
        engine_->on_notify_changed(*session_, true);
        return *session_;
    }

    void control(const std::vector<uint8_t>& bytes) {
        engine_->handle_control(*session_, bytes.data(), bytes.size());
    }

    void upload() {
        control(encode_request_upload());
        ASSERT_TRUE(engine_->wait_idle(std::chrono::seconds(10)));
    }

    std::vector<uint8_t> payload(size_t n, uint8_t seed = 0) {
        std::vector<uint8_t> p(n);
        for (size_t i = 0; i < n; ++i) p[i] = static_cast<uint8_t>(seed + i * 7);
        return p;
    }

    TempDir                          tmp_;
    TransferConfig                   config_;
    CapturingLink                    link_;
    std::unique_ptr<TransferEngine>  engine_;
    std::shared_ptr<TransferSession> session_;
};

} // namespace

TEST_F(TransferEngineTest, NineHundredBytesIsFourDataPackets) {
    const auto data = payload(900);
    write_chunk_file(config_.storage_dir, 1700000000, data, ChunkFileKind::finalized, 21, 16000);

    connect();
    upload();

    auto pkts = link_.sent();
    ASSERT_EQ(pkts.size(), 6u);   // HEADER, 4 x DATA, DONE

    const Packet& h = pkts[0];
    EXPECT_EQ(h.type, PacketType::header);
    EXPECT_EQ(h.chunk_ts, 1700000000u);
    EXPECT_EQ(h.chunk_idx, 0);
    EXPECT_EQ(h.total_chunks, 1);
    EXPECT_EQ(h.seq, 0);
    EXPECT_EQ(h.total_seqs, 5);
    auto meta = decode_chunk_meta(h.payload.data(), h.payload_len);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->data_size, 900u);
    EXPECT_EQ(meta->codec_id, 21);
    EXPECT_EQ(meta->sample_rate, 16000u);
    EXPECT_EQ(meta->crc32, crc32(data.data(), data.size()));

    const uint16_t lens[] = {229, 229, 229, 213};
    std::vector<uint8_t> joined;
    for (int i = 0; i < 4; ++i) {
        const Packet& d = pkts[1 + i];
        EXPECT_EQ(d.type, PacketType::data);
        EXPECT_EQ(d.seq, i + 1);
        EXPECT_EQ(d.total_seqs, 5);
        EXPECT_EQ(d.payload_len, lens[i]);
        joined.insert(joined.end(), d.payload.begin(), d.payload.begin() + d.payload_len);
    }
    EXPECT_EQ(joined, data);

    EXPECT_EQ(pkts[5].type, PacketType::done);
    EXPECT_EQ(session_->state.load(), UploadState::idle);
    EXPECT_FALSE(session_->upload_active.load());
}

TEST_F(TransferEngineTest, ChunksKeptUntilAcknowledged) {
    write_chunk_file(config_.storage_dir, 100, payload(50));
    write_chunk_file(config_.storage_dir, 200, payload(50));

    connect();
    upload();

    ChunkStore store(config_.storage_dir);
    EXPECT_EQ(store.count_finalized(), 2u);

    control(encode_ack_chunk(100));
    EXPECT_EQ(store.count_finalized(), 1u);
    EXPECT_FALSE(fs::exists(fs::path(config_.storage_dir) / "0000000100.bin"));

    // Unknown timestamps are ignored.
    control(encode_ack_chunk(12345));
    EXPECT_EQ(store.count_finalized(), 1u);
}

TEST_F(TransferEngineTest, RecoveredZeroSizeChunkUploadsFullPayload) {
    const auto data = payload(342);
    write_chunk_file(config_.storage_dir, 100, data, ChunkFileKind::finalized, 0, 16000, 0u);

    connect();
    upload();

    auto headers = link_.of_type(PacketType::header);
    ASSERT_EQ(headers.size(), 1u);
    auto meta = decode_chunk_meta(headers[0].payload.data(), headers[0].payload_len);
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->data_size, 342u);
    EXPECT_EQ(meta->crc32, crc32(data.data(), data.size()));
    EXPECT_EQ(headers[0].total_seqs, 3);
    EXPECT_EQ(link_.of_type(PacketType::data).size(), 2u);
}

TEST_F(TransferEngineTest, EmptyChunkSkipped) {
    write_chunk_file(config_.storage_dir, 100, {});
    write_chunk_file(config_.storage_dir, 200, payload(10));

    connect();
    upload();

    auto headers = link_.of_type(PacketType::header);
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0].chunk_ts, 200u);
    EXPECT_EQ(link_.of_type(PacketType::done).size(), 1u);
}

TEST_F(TransferEngineTest, BacklogDrainedAcrossPasses) {
    config_.max_chunks_per_pass = 2;
    for (uint32_t ts = 100; ts < 105; ++ts) {
        write_chunk_file(config_.storage_dir, ts, payload(30, static_cast<uint8_t>(ts)));
    }

    connect();
    upload();

    auto headers = link_.of_type(PacketType::header);
    ASSERT_EQ(headers.size(), 5u);
    for (uint16_t i = 0; i < 5; ++i) {
        EXPECT_EQ(headers[i].chunk_ts, 100u + i);
        EXPECT_EQ(headers[i].chunk_idx, i);
        EXPECT_EQ(headers[i].total_chunks, 5);
    }
    EXPECT_EQ(link_.sent().back().type, PacketType::done);
}

TEST_F(TransferEngineTest, AcknowledgedChunksShrinkLaterPasses) {
    config_.max_chunks_per_pass = 2;
    for (uint32_t ts = 100; ts < 104; ++ts) {
        write_chunk_file(config_.storage_dir, ts, payload(30));
    }

    connect();
    // The central acknowledges each chunk as its last DATA packet arrives.
    link_.hook = [this](const Packet& p) {
        if (p.type == PacketType::data && p.seq + 1 == p.total_seqs) {
            control(encode_ack_chunk(p.chunk_ts));
        }
        return true;
    };
    upload();

    EXPECT_EQ(link_.of_type(PacketType::header).size(), 4u);
    EXPECT_EQ(ChunkStore(config_.storage_dir).count_finalized(), 0u);
}

TEST_F(TransferEngineTest, RepeatedRequestIsIgnoredWhileUploading) {
    write_chunk_file(config_.storage_dir, 100, payload(900));

    connect();
    link_.hook = [this](const Packet& p) {
        if (p.type == PacketType::header) control(encode_request_upload());
        return true;
    };
    upload();

    EXPECT_EQ(link_.of_type(PacketType::header).size(), 1u);
    EXPECT_EQ(link_.of_type(PacketType::done).size(), 1u);
}

TEST_F(TransferEngineTest, AbortStopsBeforeNextPacket) {
    write_chunk_file(config_.storage_dir, 100, payload(900));
    write_chunk_file(config_.storage_dir, 200, payload(900));

    connect();
    link_.hook = [this](const Packet& p) {
        if (p.type == PacketType::data && p.seq == 1) control(encode_abort());
        return true;
    };
    upload();

    EXPECT_EQ(link_.of_type(PacketType::header).size(), 1u);
    EXPECT_EQ(link_.of_type(PacketType::data).size(), 1u);
    EXPECT_TRUE(link_.of_type(PacketType::done).empty());
    EXPECT_EQ(session_->state.load(), UploadState::idle);
    EXPECT_EQ(ChunkStore(config_.storage_dir).count_finalized(), 2u);

    // A new request starts over.
    link_.hook = nullptr;
    upload();
    EXPECT_EQ(link_.of_type(PacketType::header).size(), 3u);
    EXPECT_EQ(link_.of_type(PacketType::done).size(), 1u);
}

TEST_F(TransferEngineTest, RequestAfterAbortDuringUploadStartsFreshRun) {
    write_chunk_file(config_.storage_dir, 100, payload(900));
    write_chunk_file(config_.storage_dir, 200, payload(900));

    connect();
    // The central aborts and immediately asks again while the first run is
    // still between packets.
    bool restarted = false;
    link_.hook = [this, &restarted](const Packet& p) {
        if (!restarted && p.type == PacketType::data && p.seq == 1) {
            restarted = true;
            control(encode_abort());
            control(encode_request_upload());
        }
        return true;
    };
    upload();

    // First run: HEADER and one DATA of chunk 100.  Second run: both chunks.
    auto headers = link_.of_type(PacketType::header);
    ASSERT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers[0].chunk_ts, 100u);
    EXPECT_EQ(headers[1].chunk_ts, 100u);
    EXPECT_EQ(headers[1].chunk_idx, 0);
    EXPECT_EQ(headers[1].total_chunks, 2);
    EXPECT_EQ(headers[2].chunk_ts, 200u);
    EXPECT_EQ(link_.of_type(PacketType::data).size(), 1u + 4 + 4);

    auto pkts = link_.sent();
    EXPECT_EQ(link_.of_type(PacketType::done).size(), 1u);
    EXPECT_EQ(pkts.back().type, PacketType::done);
    EXPECT_EQ(session_->state.load(), UploadState::idle);
    EXPECT_FALSE(session_->upload_active.load());
}

TEST_F(TransferEngineTest, AbortAndRequestWhilePacingRestartsRun) {
    config_.packet_delay = std::chrono::milliseconds(200);
    write_chunk_file(config_.storage_dir, 100, payload(900));

    connect();
    control(encode_request_upload());

    // Both commands land while the upload thread sleeps between packets.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (link_.of_type(PacketType::data).empty() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    control(encode_abort());
    control(encode_request_upload());
    ASSERT_TRUE(engine_->wait_idle(std::chrono::seconds(30)));

    auto pkts = link_.sent();
    ASSERT_EQ(link_.of_type(PacketType::header).size(), 2u);
    ASSERT_EQ(link_.of_type(PacketType::done).size(), 1u);
    EXPECT_EQ(pkts.back().type, PacketType::done);

    // The aborted run stopped short; the new run sent the whole chunk.
    size_t first_run = 0, second_run = 0, headers = 0;
    for (const auto& p : pkts) {
        if (p.type == PacketType::header) ++headers;
        if (p.type != PacketType::data) continue;
        (headers == 1 ? first_run : second_run)++;
    }
    EXPECT_GE(first_run, 1u);
    EXPECT_LT(first_run, 4u);
    EXPECT_EQ(second_run, 4u);
    EXPECT_EQ(session_->state.load(), UploadState::idle);
    EXPECT_FALSE(session_->upload_active.load());
}

TEST_F(TransferEngineTest, TransportFailureEndsUploadWithoutDone) {
    write_chunk_file(config_.storage_dir, 100, payload(900));

    connect();
    link_.hook = [](const Packet& p) { return p.type != PacketType::data; };
    upload();

    EXPECT_EQ(link_.of_type(PacketType::header).size(), 1u);
    EXPECT_TRUE(link_.of_type(PacketType::done).empty());
    EXPECT_FALSE(session_->upload_active.load());
    EXPECT_EQ(ChunkStore(config_.storage_dir).count_finalized(), 1u);
}

TEST_F(TransferEngineTest, NothingSentWithoutNotifications) {
    write_chunk_file(config_.storage_dir, 100, payload(10));

    connect();
    engine_->on_notify_changed(*session_, false);
    upload();

    EXPECT_TRUE(link_.sent().empty());
    EXPECT_EQ(session_->state.load(), UploadState::idle);
}

TEST_F(TransferEngineTest, EmptyStoreSendsOnlyDone) {
    connect();
    upload();

    auto pkts = link_.sent();
    ASSERT_EQ(pkts.size(), 1u);
    EXPECT_EQ(pkts[0].type, PacketType::done);
}

TEST_F(TransferEngineTest, MalformedControlWritesIgnored) {
    write_chunk_file(config_.storage_dir, 100, payload(10));
    connect();

    const uint8_t unknown[] = {0x09};
    const uint8_t short_ack[] = {0x02, 0x64, 0x00};
    engine_->handle_control(*session_, unknown, sizeof(unknown));
    engine_->handle_control(*session_, short_ack, sizeof(short_ack));
    engine_->handle_control(*session_, nullptr, 0);

    ASSERT_TRUE(engine_->wait_idle(std::chrono::seconds(1)));
    EXPECT_TRUE(link_.sent().empty());
    EXPECT_EQ(ChunkStore(config_.storage_dir).count_finalized(), 1u);
}

TEST_F(TransferEngineTest, DisconnectClearsSession) {
    connect();
    engine_->on_disconnected(*session_);
    EXPECT_FALSE(session_->connected.load());
    EXPECT_FALSE(session_->notify_enabled.load());
    EXPECT_FALSE(session_->can_send());
}

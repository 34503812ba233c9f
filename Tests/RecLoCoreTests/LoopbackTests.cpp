#include "AudioCodec.hpp"
#include "ChunkCatalog.hpp"
#include "ChunkRecorder.hpp"
#include "ChunkStore.hpp"
#include "FrameChannel.hpp"
#include "TestSupport.hpp"
#include "TransferClient.hpp"
#include "TransferEngine.hpp"

#include <gtest/gtest.h>

#include <functional>

using namespace reclo;
using namespace reclo::test;

namespace {

/// Both ends of the transport in one process.  `tamper` sees each packet
/// on its way to the central; it may modify it, or return false to fail
/// the notification.
class Loopback : public PeripheralLink, public CentralLink {
public:
    explicit Loopback(TransferEngine& engine) : engine_(engine) {}

    void attach(std::shared_ptr<TransferSession> session, TransferClient* client) {
        session_ = std::move(session);
        client_  = client;
    }

    bool notify(const PacketBytes& packet) override {
        PacketBytes copy = packet;
        if (tamper && !tamper(copy)) return false;
        client_->on_packet(copy.data(), copy.size());
        return true;
    }

    bool write_control(const std::vector<uint8_t>& bytes) override {
        engine_.handle_control(*session_, bytes.data(), bytes.size());
        return true;
    }

    std::function<bool(PacketBytes&)> tamper;

private:
    TransferEngine&                  engine_;
    std::shared_ptr<TransferSession> session_;
    TransferClient*                  client_ = nullptr;
};

class LoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        xfer_.storage_dir  = tmp_.str("device");
        xfer_.header_delay = std::chrono::milliseconds(0);
        xfer_.packet_delay = std::chrono::milliseconds(0);
        xfer_.chunk_delay  = std::chrono::milliseconds(0);

        cli_.chunks_dir        = tmp_.str("audio_chunks");
        cli_.conversations_dir = tmp_.str("conversations");
        cli_.catalog_path      = tmp_.str("reclo.db");
        cli_.conversation_gap  = std::chrono::milliseconds(1000);

        catalog_ = std::make_unique<ChunkCatalog>(cli_.catalog_path);
        ASSERT_TRUE(catalog_->open());
        engine_ = std::make_unique<TransferEngine>(xfer_);
        link_   = std::make_unique<Loopback>(*engine_);
        client_ = std::make_unique<TransferClient>(cli_, *link_, catalog_.get());
        client_->set_conversation_callback([this](const Conversation& c) {
            conversations_.push_back(c);
        });
        engine_->start();
    }

    void TearDown() override {
        engine_->stop();
    }

    /// One connection: connect, request, wait for the engine to go idle,
    /// disconnect.
    void run_session() {
        auto session = engine_->on_connected(*link_);
        engine_->on_notify_changed(*session, true);
        link_->attach(session, client_.get());
        ASSERT_TRUE(client_->start());
        ASSERT_TRUE(engine_->wait_idle(std::chrono::seconds(30)));
        engine_->on_disconnected(*session);
    }

    size_t on_device() const { return ChunkStore(xfer_.storage_dir).count_finalized(); }

    void seed_chunks(uint32_t first_ts, int count) {
        for (int i = 0; i < count; ++i) {
            write_chunk_file(xfer_.storage_dir, first_ts + static_cast<uint32_t>(i),
                             pcm16_chunk_payload(tone(200 + 20 * i)));
        }
    }

    TempDir                         tmp_;
    TransferConfig                  xfer_;
    ClientConfig                    cli_;
    std::unique_ptr<ChunkCatalog>   catalog_;
    std::unique_ptr<TransferEngine> engine_;
    std::unique_ptr<Loopback>       link_;
    std::unique_ptr<TransferClient> client_;
    std::vector<Conversation>       conversations_;
};

} // namespace

TEST_F(LoopbackTest, UploadMovesEveryChunkToCentral) {
    seed_chunks(1700000000, 3);
    run_session();

    EXPECT_TRUE(client_->upload_complete());
    EXPECT_EQ(client_->chunks_received(), 3);
    EXPECT_EQ(on_device(), 0u);
    EXPECT_EQ(catalog_->get_chunks().size(), 3u);
    for (uint32_t ts = 1700000000; ts < 1700000003; ++ts) {
        EXPECT_TRUE(fs::exists(tmp_.path() / "audio_chunks" /
                               ("chunk_" + std::to_string(ts) + ".wav")));
    }
}

TEST_F(LoopbackTest, InterruptedUploadResumesWithRemainingChunks) {
    seed_chunks(100, 5);

    // The link fails as the third chunk's HEADER goes out.
    int headers = 0;
    link_->tamper = [&headers](PacketBytes& p) {
        if (p[0] == static_cast<uint8_t>(PacketType::header)) ++headers;
        return headers < 3;
    };
    run_session();

    EXPECT_FALSE(client_->upload_complete());
    EXPECT_EQ(client_->chunks_received(), 2);
    EXPECT_EQ(on_device(), 3u);

    std::vector<uint16_t> totals;
    link_->tamper = [&totals](PacketBytes& p) {
        if (p[0] == static_cast<uint8_t>(PacketType::header)) totals.push_back(get_u16(&p[7]));
        return true;
    };
    run_session();

    EXPECT_TRUE(client_->upload_complete());
    EXPECT_EQ(client_->chunks_received(), 3);
    EXPECT_EQ(totals, (std::vector<uint16_t>{3, 3, 3}));
    EXPECT_EQ(on_device(), 0u);
    EXPECT_EQ(catalog_->get_chunks().size(), 5u);
}

TEST_F(LoopbackTest, ClientRestartMidUploadGetsEveryChunk) {
    seed_chunks(300, 2);

    bool restarted = false;
    link_->tamper = [this, &restarted](PacketBytes& p) {
        if (!restarted && p[0] == static_cast<uint8_t>(PacketType::data)) {
            restarted = true;
            client_->stop();
            EXPECT_TRUE(client_->start());
        }
        return true;
    };
    run_session();

    EXPECT_TRUE(restarted);
    EXPECT_TRUE(client_->upload_complete());
    EXPECT_EQ(client_->chunks_received(), 2);
    EXPECT_EQ(client_->chunks_rejected(), 0u);
    EXPECT_EQ(on_device(), 0u);
}

TEST_F(LoopbackTest, CorruptedChunkStaysOnDeviceUntilClean) {
    seed_chunks(200, 2);

    bool corrupted = false;
    link_->tamper = [&corrupted](PacketBytes& p) {
        if (!corrupted && p[0] == static_cast<uint8_t>(PacketType::data) &&
            get_u32(&p[1]) == 200) {
            p[kPacketHeaderSize] ^= 0x01;
            corrupted = true;
        }
        return true;
    };
    run_session();

    EXPECT_EQ(client_->chunks_received(), 1);
    EXPECT_EQ(client_->chunks_rejected(), 1u);
    EXPECT_EQ(on_device(), 1u);
    EXPECT_TRUE(fs::exists(fs::path(xfer_.storage_dir) / "0000000200.bin"));

    link_->tamper = nullptr;
    run_session();
    EXPECT_EQ(client_->chunks_received(), 1);
    EXPECT_EQ(client_->chunks_rejected(), 0u);
    EXPECT_EQ(on_device(), 0u);
}

TEST_F(LoopbackTest, RecordedAudioBecomesConversation) {
    FakeClock clock;
    clock.set_wall(1700000000);

    RecorderConfig rec_cfg;
    rec_cfg.storage_dir    = xfer_.storage_dir;
    rec_cfg.codec_id       = static_cast<uint8_t>(CodecId::pcm16);
    rec_cfg.chunk_duration = std::chrono::hours(1);

    FrameChannel channel(256);
    auto encoder = make_encoder(rec_cfg.codec_id, rec_cfg.sample_rate, channel);
    ASSERT_TRUE(encoder);

    ChunkRecorder recorder(rec_cfg, clock);
    ASSERT_TRUE(recorder.start());

    const std::vector<std::vector<int16_t>> windows = {
        concat(tone(600), silence(400)),   // speech, short pause
        concat(silence(200), tone(500)),   // speech continues
        silence(1500),                     // gap
        tone(300),                         // next conversation
    };
    for (size_t i = 0; i < windows.size(); ++i) {
        encoder->encode(windows[i].data(), windows[i].size());
        encoder->flush();
        while (channel.size() > 0) {
            auto f = channel.pop();
            recorder.on_frame(f->data(), f->size());
        }
        if (i + 1 < windows.size()) ASSERT_TRUE(recorder.rotate());
    }
    recorder.stop();
    ASSERT_EQ(recorder.chunk_count(), 4);

    run_session();

    EXPECT_EQ(client_->chunks_received(), 4);
    ASSERT_EQ(conversations_.size(), 2u);
    EXPECT_EQ(conversations_[0].id, "conv_1700000000000");
    EXPECT_EQ(conversations_[0].chunks.size(), 2u);
    EXPECT_EQ(conversations_[0].speech_ms, 1100);
    EXPECT_EQ(conversations_[1].id, "conv_1700000003000");
    EXPECT_EQ(conversations_[1].speech_ms, 300);

    auto stored = catalog_->get_conversations();
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored[0].id, "conv_1700000003000");
}

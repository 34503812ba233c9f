// reclo-loopback: records synthetic audio through the peripheral pipeline
// and uploads it to an in-process central over a loopback link.

#include "AudioCodec.hpp"
#include "ChunkCatalog.hpp"
#include "ChunkRecorder.hpp"
#include "Clock.hpp"
#include "Config.hpp"
#include "FrameChannel.hpp"
#include "Logging.hpp"
#include "TransferClient.hpp"
#include "TransferEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr double kPi = 3.14159265358979323846;

struct Options {
    std::string dir         = "reclo-data";
    std::string codec       = "opus_fs320";
    std::string pattern     = "SS__S_";   // S = speech chunk, _ = silent chunk
    int         chunk_ms    = 2000;
    int         gap_ms      = 3000;
    double      threshold   = -40.0;
    int         max_per_pass = 64;
    bool        unsynced_first = true;
    bool        verbose     = false;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --dir <path>         working directory (default reclo-data)\n"
              << "  --codec <name>       pcm16 | opus | opus_fs320 (default opus_fs320)\n"
              << "  --pattern <str>      one char per chunk: S speech, _ silence (default SS__S_)\n"
              << "  --chunk-ms <n>       audio per chunk in ms (default 2000)\n"
              << "  --gap-ms <n>         conversation gap in ms (default 3000)\n"
              << "  --threshold <db>     silence threshold in dB (default -40)\n"
              << "  --max-per-pass <n>   chunks per enumeration pass (default 64)\n"
              << "  --synced             stamp chunks with wall time from the start\n"
              << "  --verbose            debug logging\n";
}

/// In-process transport: notifications go straight to the client, control
/// writes straight to the engine.
class LoopbackLink : public reclo::PeripheralLink, public reclo::CentralLink {
public:
    explicit LoopbackLink(reclo::TransferEngine& engine) : engine_(engine) {}

    void attach(std::shared_ptr<reclo::TransferSession> session, reclo::TransferClient* client) {
        session_ = std::move(session);
        client_  = client;
    }

    bool notify(const reclo::PacketBytes& packet) override {
        if (!client_) return false;
        client_->on_packet(packet.data(), packet.size());
        return true;
    }

    bool write_control(const std::vector<uint8_t>& bytes) override {
        if (!session_) return false;
        engine_.handle_control(*session_, bytes.data(), bytes.size());
        return true;
    }

private:
    reclo::TransferEngine&                  engine_;
    std::shared_ptr<reclo::TransferSession> session_;
    reclo::TransferClient*                  client_ = nullptr;
};

/// One chunk of synthetic audio: a 440 Hz tone with a short pause for 'S',
/// low-level noise for '_'.
std::vector<int16_t> synth_chunk(char kind, int chunk_ms, uint32_t sample_rate, unsigned& seed) {
    const size_t n = static_cast<size_t>(sample_rate) * chunk_ms / 1000;
    std::vector<int16_t> out(n);

    const size_t speech_end = kind == 'S' ? n * 7 / 10 : 0;
    for (size_t i = 0; i < n; ++i) {
        if (i < speech_end) {
            const double t = static_cast<double>(i) / sample_rate;
            out[i] = static_cast<int16_t>(9000.0 * std::sin(2.0 * kPi * 440.0 * t));
        } else {
            seed = seed * 1103515245u + 12345u;
            out[i] = static_cast<int16_t>(static_cast<int>((seed >> 16) % 7) - 3);
        }
    }
    return out;
}

/// Move every queued frame into the recorder.
void pump(reclo::FrameChannel& channel, reclo::ChunkRecorder& recorder) {
    while (channel.size() > 0) {
        auto frame = channel.pop();
        if (!frame) break;
        recorder.on_frame(frame->data(), frame->size());
    }
}

uint8_t parse_codec(const std::string& name) {
    if (name == "pcm16") return static_cast<uint8_t>(reclo::CodecId::pcm16);
    if (name == "opus")  return static_cast<uint8_t>(reclo::CodecId::opus);
    if (name == "opus_fs320") return static_cast<uint8_t>(reclo::CodecId::opus_fs320);
    throw std::invalid_argument("unknown codec '" + name + "'");
}

} // namespace

int main(int argc, char** argv) {
    Options opt;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--dir" && i + 1 < argc) opt.dir = argv[++i];
        else if (a == "--codec" && i + 1 < argc) opt.codec = argv[++i];
        else if (a == "--pattern" && i + 1 < argc) opt.pattern = argv[++i];
        else if (a == "--chunk-ms" && i + 1 < argc) opt.chunk_ms = std::atoi(argv[++i]);
        else if (a == "--gap-ms" && i + 1 < argc) opt.gap_ms = std::atoi(argv[++i]);
        else if (a == "--threshold" && i + 1 < argc) opt.threshold = std::atof(argv[++i]);
        else if (a == "--max-per-pass" && i + 1 < argc) opt.max_per_pass = std::atoi(argv[++i]);
        else if (a == "--synced") opt.unsynced_first = false;
        else if (a == "--verbose") opt.verbose = true;
        else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    if (opt.chunk_ms <= 0 || opt.gap_ms < 0 || opt.max_per_pass <= 0) {
        std::cerr << "--chunk-ms and --max-per-pass must be positive\n";
        return 2;
    }

    reclo::log::set_level(opt.verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        const uint8_t codec_id = parse_codec(opt.codec);
        const fs::path root(opt.dir);

        // ---- Peripheral ----
        reclo::SystemClock clock;
        if (!opt.unsynced_first) {
            clock.set_wall_time(static_cast<uint32_t>(std::time(nullptr)));
        }

        reclo::RecorderConfig rec_cfg;
        rec_cfg.storage_dir = (root / "device").string();
        rec_cfg.codec_id    = codec_id;
        // Rotation is driven explicitly below; the timer never fires.
        rec_cfg.chunk_duration = std::chrono::hours(1);

        reclo::FrameChannel channel(1024);
        auto encoder = reclo::make_encoder(codec_id, rec_cfg.sample_rate, channel);
        if (!encoder) {
            std::cerr << "No encoder for codec " << opt.codec << "\n";
            return 1;
        }

        reclo::ChunkRecorder recorder(rec_cfg, clock);
        if (!recorder.start()) {
            std::cerr << "Recorder failed to start in " << rec_cfg.storage_dir << "\n";
            return 1;
        }

        unsigned seed = 1;
        for (size_t i = 0; i < opt.pattern.size(); ++i) {
            auto samples = synth_chunk(opt.pattern[i], opt.chunk_ms, rec_cfg.sample_rate, seed);
            const size_t block = rec_cfg.sample_rate / 50;
            for (size_t off = 0; off < samples.size(); off += block) {
                encoder->encode(samples.data() + off, std::min(block, samples.size() - off));
                pump(channel, recorder);
            }
            encoder->flush();
            pump(channel, recorder);

            if (i + 1 < opt.pattern.size()) {
                recorder.rotate();
            }
            if (i == 0 && opt.unsynced_first) {
                clock.set_wall_time(static_cast<uint32_t>(std::time(nullptr)));
                std::cout << "time sync: " << recorder.retimestamp() << " chunk(s) retimestamped\n";
            }
        }
        recorder.stop();
        std::cout << "recorded " << recorder.chunk_count() << " chunk(s), "
                  << recorder.dropped_frames() << " frame(s) dropped\n";

        // ---- Central ----
        reclo::ClientConfig cli_cfg;
        cli_cfg.chunks_dir           = (root / "audio_chunks").string();
        cli_cfg.conversations_dir    = (root / "conversations").string();
        cli_cfg.catalog_path         = (root / "reclo.db").string();
        cli_cfg.silence_threshold_db = opt.threshold;
        cli_cfg.conversation_gap     = std::chrono::milliseconds(opt.gap_ms);

        reclo::ChunkCatalog catalog(cli_cfg.catalog_path);
        if (!catalog.open()) {
            std::cerr << "Cannot open catalog " << cli_cfg.catalog_path << "\n";
            return 1;
        }

        // ---- Link ----
        reclo::TransferConfig xfer_cfg;
        xfer_cfg.storage_dir         = rec_cfg.storage_dir;
        xfer_cfg.max_chunks_per_pass = static_cast<size_t>(opt.max_per_pass);

        reclo::TransferEngine engine(xfer_cfg);
        LoopbackLink link(engine);
        reclo::TransferClient client(cli_cfg, link, &catalog);

        client.set_progress_callback([](const reclo::UploadProgress& p) {
            std::printf("progress: %d/%d%s\n", p.chunks_received, p.total_chunks,
                        p.complete ? " (complete)" : "");
        });
        client.set_conversation_callback([](const reclo::Conversation& c) {
            std::printf("conversation ready: %s -> %s (%lld ms speech, %lld ms silence removed)\n",
                        c.id.c_str(), c.stitched_path.c_str(),
                        static_cast<long long>(c.speech_ms),
                        static_cast<long long>(c.silence_removed_ms));
        });

        engine.start();
        auto session = engine.on_connected(link);
        engine.on_notify_changed(*session, true);
        link.attach(session, &client);

        if (!client.start()) {
            std::cerr << "Upload request failed\n";
            return 1;
        }
        if (!engine.wait_idle(std::chrono::minutes(5))) {
            std::cerr << "Upload timed out\n";
            client.stop();
        }
        engine.on_disconnected(*session);
        engine.stop();

        std::cout << "uploaded " << client.chunks_received() << " chunk(s), "
                  << client.chunks_rejected() << " rejected, "
                  << engine.store().count_finalized() << " left on device\n";
        return client.upload_complete() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}

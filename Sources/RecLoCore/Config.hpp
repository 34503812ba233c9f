#pragma once

#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace reclo {

/// Peripheral chunk recorder settings.
struct RecorderConfig {
    std::string               storage_dir;
    std::chrono::milliseconds chunk_duration{15000};
    size_t                    write_buffer_size = 4096;
    uint8_t                   codec_id    = static_cast<uint8_t>(CodecId::opus_fs320);
    uint32_t                  sample_rate = 16000;
};

/// Peripheral transfer engine settings.
struct TransferConfig {
    std::string               storage_dir;
    size_t                    max_chunks_per_pass = 64;

    // Fixed pacing; there is no flow control from the central side.
    std::chrono::milliseconds header_delay{10};
    std::chrono::milliseconds packet_delay{8};
    std::chrono::milliseconds chunk_delay{20};
};

/// Central transfer client settings.
struct ClientConfig {
    std::string               chunks_dir;          // decoded chunk WAVs
    std::string               conversations_dir;   // stitched output
    std::string               catalog_path;        // SQLite database
    double                    silence_threshold_db = -40.0;
    std::chrono::milliseconds conversation_gap{120000};
    int                       analysis_window_ms = 100;
    std::chrono::milliseconds stall_timeout{10000};
};

} // namespace reclo

#pragma once

#include "SilenceDetector.hpp"
#include "Types.hpp"

#include <cstdint>
#include <string>

namespace reclo {

struct StitchResult {
    bool        success = false;
    std::string output_path;
    int64_t     speech_ms          = 0;
    int64_t     silence_removed_ms = 0;
    std::string error;
};

/// Concatenates the speech ranges of a conversation's chunk WAVs into one
/// WAV file, dropping silent ranges.
class AudioStitcher {
public:
    explicit AudioStitcher(std::string output_dir, int window_ms = 100);

    /// Stitch `conv` into <output_dir>/conversation_<id>.wav.  Chunks are
    /// taken in the given (chronological) order; chunks without speech are
    /// skipped.  A chunk that carries no segments is analyzed here at
    /// threshold_db.  Fails without creating a file when nothing is left.
    StitchResult stitch(const Conversation& conv, double threshold_db) const;

    const std::string& output_dir() const { return output_dir_; }

private:
    std::string     output_dir_;
    SilenceDetector detector_;
};

} // namespace reclo

#include "SilenceDetector.hpp"

#include <algorithm>
#include <cmath>

namespace reclo {

SilenceDetector::SilenceDetector(int window_ms) : window_ms_(std::max(window_ms, 1)) {}

// ---------------------------------------------------------------------------
// analyze
// ---------------------------------------------------------------------------

SilenceAnalysis SilenceDetector::analyze(const std::vector<int16_t>& samples,
                                         uint32_t sample_rate,
                                         double threshold_db) const {
    SilenceAnalysis result;
    if (samples.empty() || sample_rate == 0) {
        return result;
    }

    const size_t per_window = std::max<size_t>(
        1, static_cast<size_t>(std::lround(sample_rate * window_ms_ / 1000.0)));

    std::vector<bool> silent;
    for (size_t start = 0; start < samples.size(); start += per_window) {
        const size_t n = std::min(per_window, samples.size() - start);
        silent.push_back(rms_db(samples.data() + start, n) < threshold_db);
    }

    bool   state       = silent[0];
    size_t seg_start   = 0;

    for (size_t i = 1; i <= silent.size(); ++i) {
        const bool last    = i == silent.size();
        const bool changed = !last && silent[i] != state;
        if (!changed && !last) continue;

        AudioSegment seg;
        seg.start_ms  = static_cast<int64_t>(seg_start) * window_ms_;
        seg.end_ms    = static_cast<int64_t>(i) * window_ms_;
        seg.is_silent = state;
        result.segments.push_back(seg);

        if (state) {
            result.total_silence_ms  += seg.duration_ms();
            result.longest_silence_ms = std::max(result.longest_silence_ms, seg.duration_ms());
        } else {
            result.total_speech_ms += seg.duration_ms();
        }

        if (!last) {
            state     = silent[i];
            seg_start = i;
        }
    }

    result.entirely_silent = result.total_speech_ms == 0;
    return result;
}

// ---------------------------------------------------------------------------
// is_conversation_boundary
// ---------------------------------------------------------------------------

bool SilenceDetector::is_conversation_boundary(const std::vector<SilenceAnalysis>& recent,
                                               std::chrono::milliseconds threshold) {
    int64_t accumulated = 0;

    for (auto it = recent.rbegin(); it != recent.rend(); ++it) {
        if (it->entirely_silent) {
            accumulated += it->total_silence_ms;
        } else {
            if (!it->segments.empty() && it->segments.back().is_silent) {
                accumulated += it->segments.back().duration_ms();
            }
            break;
        }
        if (accumulated >= threshold.count()) return true;
    }

    return accumulated >= threshold.count();
}

// ---------------------------------------------------------------------------
// rms_db
// ---------------------------------------------------------------------------

double SilenceDetector::rms_db(const int16_t* samples, size_t count) {
    if (!samples || count == 0) return kSilenceFloorDb;

    double sum_squares = 0.0;
    for (size_t i = 0; i < count; ++i) {
        const double s = samples[i] / 32768.0;
        sum_squares += s * s;
    }
    const double rms = std::sqrt(sum_squares / static_cast<double>(count));
    if (rms == 0.0) return kSilenceFloorDb;
    return 20.0 * std::log10(rms);
}

} // namespace reclo

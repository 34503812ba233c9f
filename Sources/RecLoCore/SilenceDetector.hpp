#pragma once

#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace reclo {

/// Level reported for an empty or all-zero window.
static constexpr double kSilenceFloorDb = -100.0;

/// Classifies decoded audio into speech and silence windows.
class SilenceDetector {
public:
    explicit SilenceDetector(int window_ms = 100);

    /// Split `samples` into window_ms windows, label each silent when its
    /// RMS level is below threshold_db, and merge runs of equal labels into
    /// segments.  The last window may be partial; it still spans window_ms.
    SilenceAnalysis analyze(const std::vector<int16_t>& samples,
                            uint32_t sample_rate,
                            double threshold_db) const;

    /// Walk `recent` from the newest chunk backward, summing trailing
    /// silence.  An entirely silent chunk contributes all of its silence; the
    /// first chunk with speech contributes only its trailing silent segment
    /// and ends the walk.  True once the sum reaches `threshold`.
    static bool is_conversation_boundary(const std::vector<SilenceAnalysis>& recent,
                                         std::chrono::milliseconds threshold);

    /// 20*log10(rms) of normalized samples, floored at kSilenceFloorDb.
    static double rms_db(const int16_t* samples, size_t count);

    int window_ms() const { return window_ms_; }

private:
    int window_ms_;
};

} // namespace reclo

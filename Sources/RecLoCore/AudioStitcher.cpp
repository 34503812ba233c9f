#include "AudioStitcher.hpp"

#include "Logging.hpp"
#include "WavFile.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace reclo {

namespace {

std::shared_ptr<spdlog::logger> logger() {
    return log::get("stitcher");
}

std::vector<int16_t> pcm_to_samples(const uint8_t* pcm, size_t len, int bit_depth) {
    std::vector<int16_t> out;
    if (bit_depth == 8) {
        out.reserve(len);
        for (size_t i = 0; i < len; ++i) {
            out.push_back(static_cast<int16_t>((static_cast<int>(pcm[i]) - 128) * 256));
        }
    } else {
        out.reserve(len / 2);
        for (size_t i = 0; i + 1 < len; i += 2) {
            out.push_back(static_cast<int16_t>(pcm[i] | (pcm[i + 1] << 8)));
        }
    }
    return out;
}

} // namespace

AudioStitcher::AudioStitcher(std::string output_dir, int window_ms)
    : output_dir_(std::move(output_dir)), detector_(window_ms) {}

StitchResult AudioStitcher::stitch(const Conversation& conv, double threshold_db) const {
    StitchResult result;

    try {
        std::vector<uint8_t>     combined;
        std::optional<WavFormat> out_fmt;

        for (const auto& chunk : conv.chunks) {
            auto raw = read_file_bytes(chunk.file_path);
            if (!raw) {
                logger()->warn("Chunk {} missing at {}; skipped", chunk.id, chunk.file_path);
                continue;
            }

            auto fmt = parse_wav_header(raw->data(), raw->size());
            if (!fmt || (fmt->bit_depth != 8 && fmt->bit_depth != 16)) {
                logger()->warn("Chunk {} is not a PCM WAV; skipped", chunk.id);
                continue;
            }
            if (out_fmt && (fmt->sample_rate != out_fmt->sample_rate ||
                            fmt->bit_depth != out_fmt->bit_depth)) {
                logger()->warn("Chunk {} format {} Hz/{} bit differs from {} Hz/{} bit; skipped",
                               chunk.id, fmt->sample_rate, fmt->bit_depth,
                               out_fmt->sample_rate, out_fmt->bit_depth);
                continue;
            }

            const uint8_t* pcm = raw->data() + kWavHeaderSize;
            const size_t   len = raw->size() - kWavHeaderSize;

            SilenceAnalysis analysis = chunk.analysis;
            if (analysis.segments.empty()) {
                analysis = detector_.analyze(pcm_to_samples(pcm, len, fmt->bit_depth),
                                             fmt->sample_rate, threshold_db);
            }
            if (analysis.entirely_silent) continue;

            const size_t bytes_per_sample = fmt->bit_depth / 8u;
            const size_t bytes_per_ms = static_cast<size_t>(
                std::lround(fmt->sample_rate * bytes_per_sample / 1000.0));

            size_t taken = 0;
            for (const auto& seg : analysis.segments) {
                if (seg.is_silent) {
                    result.silence_removed_ms += seg.duration_ms();
                    continue;
                }

                size_t start = std::min(static_cast<size_t>(seg.start_ms) * bytes_per_ms, len);
                size_t end   = std::min(static_cast<size_t>(seg.end_ms) * bytes_per_ms, len);
                start -= start % bytes_per_sample;
                end   -= end % bytes_per_sample;
                if (end <= start) continue;

                combined.insert(combined.end(), pcm + start, pcm + end);
                result.speech_ms += seg.duration_ms();
                ++taken;
            }

            if (taken > 0 && !out_fmt) {
                out_fmt = fmt;
                out_fmt->channels = 1;
            }
        }

        if (combined.empty() || !out_fmt) {
            result.speech_ms          = 0;
            result.silence_removed_ms = 0;
            result.error = "No speech segments found";
            return result;
        }

        const std::string path =
            (fs::path(output_dir_) / ("conversation_" + conv.id + ".wav")).string();
        if (!write_wav(path, *out_fmt, combined)) {
            std::error_code ec;
            fs::remove(path, ec);
            result.speech_ms          = 0;
            result.silence_removed_ms = 0;
            result.error = "Cannot write " + path;
            return result;
        }

        result.success     = true;
        result.output_path = path;
        logger()->info("Stitched {} -> {} ({} ms speech, {} ms silence removed)",
                       conv.id, path, result.speech_ms, result.silence_removed_ms);
    } catch (const std::exception& e) {
        result = StitchResult{};
        result.error = e.what();
        logger()->error("Stitch of {} failed: {}", conv.id, e.what());
    }

    return result;
}

} // namespace reclo

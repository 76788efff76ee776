#pragma once

#include "audio_chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

// Stateless whole-buffer rate converter. It always sees a complete session in
// one call; there is no carried filter state, so chunk boundaries from the
// capture callback cannot leak into the output.
class Resampler {
public:
    explicit Resampler(uint32_t target_rate = 16000);

    uint32_t target_rate() const { return target_rate_; }

    // round(input_frames * out_rate / in_rate)
    static size_t expected_length(size_t input_frames, uint32_t in_rate, uint32_t out_rate);

    // Downmixes to mono, then converts to target_rate().
    std::expected<ResampledBuffer, std::string> convert(AccumulatedAudio audio) const;

private:
    uint32_t target_rate_;
};

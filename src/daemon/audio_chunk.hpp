#pragma once

#include "hotkey_event.hpp"

#include <cstdint>
#include <vector>

// One hand-off from the capture channel, at the device's native format.
struct RawAudioChunk {
    std::vector<int16_t> samples; // interleaved when channel_count > 1
    uint32_t native_sample_rate = 0;
    uint8_t channel_count = 1;
    MonotonicTime captured_at{};

    size_t frames() const { return channel_count ? samples.size() / channel_count : 0; }
};

// All chunks of one session, concatenated.
struct AccumulatedAudio {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 0;
    uint8_t channel_count = 1;
};

// Mono PCM at the engine's fixed rate. Produced once per session.
struct ResampledBuffer {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 0;

    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

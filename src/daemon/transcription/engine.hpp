#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct EngineTranscript {
    std::string text;
    double confidence = 1.0;
};

// External speech-to-text service. Implementations must tolerate concurrent
// calls: a superseded session's request can still be in flight.
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;
    virtual std::expected<EngineTranscript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   const std::string& language) = 0;
    virtual std::string name() const = 0;
};

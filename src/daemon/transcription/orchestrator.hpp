#pragma once

#include "audio_chunk.hpp"
#include "transcription/engine.hpp"

#include <cstdint>
#include <expected>
#include <string>

struct TranscriptionResult {
    std::string text;
    double confidence = 0.0; // 0..1
    double elapsed_s = 0.0;
};

// Thin glue between the controller and the engine.
class TranscriptionOrchestrator {
public:
    TranscriptionOrchestrator(TranscriptionEngine& engine, uint32_t required_rate,
                              std::string language);

    std::expected<TranscriptionResult, std::string> transcribe(const ResampledBuffer& audio);

    const std::string& language() const { return language_; }
    std::string engine_name() const { return engine_.name(); }

private:
    TranscriptionEngine& engine_;
    uint32_t required_rate_;
    std::string language_;
};

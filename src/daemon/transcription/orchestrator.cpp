#include "transcription/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <format>

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

} // namespace

TranscriptionOrchestrator::TranscriptionOrchestrator(TranscriptionEngine& engine,
                                                     uint32_t required_rate,
                                                     std::string language)
    : engine_(engine), required_rate_(required_rate), language_(std::move(language)) {}

std::expected<TranscriptionResult, std::string>
TranscriptionOrchestrator::transcribe(const ResampledBuffer& audio) {
    if (audio.sample_rate != required_rate_) {
        return std::unexpected(std::format("engine requires {} Hz, got {} Hz",
                                           required_rate_, audio.sample_rate));
    }
    if (audio.samples.empty()) {
        return std::unexpected("empty audio");
    }

    auto start = std::chrono::steady_clock::now();
    auto result = engine_.transcribe(audio.samples, audio.sample_rate, language_);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!result) {
        return std::unexpected(result.error());
    }

    auto text = trim(result->text);
    if (text.empty()) {
        return std::unexpected("no speech recognized");
    }

    return TranscriptionResult{
        .text = std::move(text),
        .confidence = std::clamp(result->confidence, 0.0, 1.0),
        .elapsed_s = elapsed,
    };
}

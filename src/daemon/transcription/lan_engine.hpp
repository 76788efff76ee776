#pragma once

#include "transcription/engine.hpp"

#include <string>

// whisper.cpp server or any OpenAI-compatible transcription endpoint on the
// local network.
class LanEngine : public TranscriptionEngine {
public:
    // api_format: "whisper.cpp" or "openai"
    explicit LanEngine(std::string url, std::string api_format = "whisper.cpp");
    ~LanEngine() override;

    LanEngine(const LanEngine&) = delete;
    LanEngine& operator=(const LanEngine&) = delete;

    std::expected<EngineTranscript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   const std::string& language) override;

    std::string name() const override { return "lan"; }

    // Exposed for tests: pulls text and confidence out of a server reply.
    static std::expected<EngineTranscript, std::string> parse_response(const std::string& body);

private:
    std::string url_;
    std::string api_format_;
};

#include "transcription/lan_engine.hpp"
#include "wav_encoder.hpp"

#include <cmath>
#include <curl/curl.h>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

LanEngine::LanEngine(std::string url, std::string api_format)
    : url_(std::move(url)), api_format_(std::move(api_format)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanEngine::~LanEngine() {
    curl_global_cleanup();
}

std::expected<EngineTranscript, std::string>
LanEngine::transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                      const std::string& language) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }

    auto wav_data = wav::encode(audio, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    auto add_field = [mime](const char* name, const char* value) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, name);
        curl_mime_data(part, value, CURL_ZERO_TERMINATED);
    };

    curl_mimepart* file = curl_mime_addpart(mime);
    curl_mime_name(file, "file");
    curl_mime_data(file, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(file, "audio.wav");
    curl_mime_type(file, "audio/wav");

    std::string endpoint;
    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        add_field("model", "whisper-1");
    } else {
        endpoint = url_ + "/inference";
        add_field("temperature", "0.0");
    }
    add_field("response_format", "verbose_json");
    if (!language.empty()) {
        add_field("language", language.c_str());
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
        return std::unexpected(std::format("model not loaded: engine unreachable at {} ({})",
                                           url_, curl_easy_strerror(res)));
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("inference failed: ") + curl_easy_strerror(res));
    }
    if (http_status == 503) {
        return std::unexpected("model not loaded: engine reports 503");
    }
    if (http_status >= 400) {
        return std::unexpected(std::format("inference failed: HTTP {}: {}", http_status,
                                           response_body.substr(0, 200)));
    }

    return parse_response(response_body);
}

std::expected<EngineTranscript, std::string> LanEngine::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            const auto& err = j["error"];
            std::string msg = err.is_string() ? err.get<std::string>()
                                              : err.value("message", err.dump());
            return std::unexpected("inference failed: " + msg);
        }
        if (!j.contains("text")) {
            return std::unexpected("unexpected response: " + body.substr(0, 200));
        }

        EngineTranscript out;
        out.text = j["text"].get<std::string>();

        // Mean token log-probability per segment -> probability-like score.
        if (j.contains("segments") && j["segments"].is_array()) {
            double sum = 0.0;
            size_t n = 0;
            for (const auto& seg : j["segments"]) {
                if (seg.contains("avg_logprob") && seg["avg_logprob"].is_number()) {
                    sum += seg["avg_logprob"].get<double>();
                    ++n;
                }
            }
            if (n > 0) out.confidence = std::exp(sum / static_cast<double>(n));
        }

        return out;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

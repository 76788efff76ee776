#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("hotkey")) {
            auto& h = j["hotkey"];
            read_key(h, "combo", cfg.hotkey.combo);
            read_key(h, "enabled", cfg.hotkey.enabled);
        }

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read_key(b, "type", cfg.backend.type);
            read_key(b, "url", cfg.backend.url);
            read_key(b, "api_format", cfg.backend.api_format);
            read_key(b, "language", cfg.backend.language);
        }

        if (j.contains("output")) {
            read_key(j["output"], "default", cfg.output.default_method);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "target_rate", cfg.audio.target_rate);
            read_key(a, "max_seconds", cfg.audio.max_seconds);
            read_key(a, "buffer_seconds", cfg.audio.buffer_seconds);
            read_key(a, "device_timeout_ms", cfg.audio.device_timeout_ms);
            read_key(a, "silence_rms", cfg.audio.silence_rms);
            read_key(a, "inactivity_timeout_ms", cfg.audio.inactivity_timeout_ms);
            read_key(a, "talking_level", cfg.audio.talking_level);
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            read_key(s, "min_hold_ms", cfg.session.min_hold_ms);
            read_key(s, "stale_after_ms", cfg.session.stale_after_ms);
            read_key(s, "transcribe_timeout_ms", cfg.session.transcribe_timeout_ms);
            read_key(s, "timeout_per_audio_second_ms", cfg.session.timeout_per_audio_second_ms);
            read_key(s, "feedback_ms", cfg.session.feedback_ms);
            read_key(s, "pump_interval_ms", cfg.session.pump_interval_ms);
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            read_key(h, "enabled", cfg.history.enabled);
            read_key(h, "path", cfg.history.path);
            read_key(h, "retention_days", cfg.history.retention_days);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.audio.target_rate == 0) {
        std::println(stderr, "config: audio.target_rate must be positive, using 16000");
        cfg.audio.target_rate = 16000;
    }
    if (cfg.audio.buffer_seconds == 0) cfg.audio.buffer_seconds = 1;
    if (cfg.session.pump_interval_ms == 0) cfg.session.pump_interval_ms = 1;

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Hotkey {
        std::string combo = "ctrl+shift+space";
        bool enabled = true;
    } hotkey;

    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
    } backend;

    struct Output {
        std::string default_method = "type"; // "type" or "clipboard"
    } output;

    struct Audio {
        uint32_t target_rate = 16000;
        uint32_t max_seconds = 120;
        uint32_t buffer_seconds = 4;
        uint32_t device_timeout_ms = 1000;
        double silence_rms = 0.0;
        uint32_t inactivity_timeout_ms = 30000; // 0 disables
        double talking_level = 0.02;

        // Sized for the worst native format we accept (192 kHz stereo), since
        // the device rate is only known after the stream negotiates.
        size_t ring_buffer_samples() const {
            return static_cast<size_t>(buffer_seconds) * 192000 * 2;
        }
    } audio;

    struct Session {
        uint32_t min_hold_ms = 100;
        uint32_t stale_after_ms = 10000;
        uint32_t transcribe_timeout_ms = 10000;
        uint32_t timeout_per_audio_second_ms = 500;
        uint32_t feedback_ms = 1500;
        uint32_t pump_interval_ms = 50;
    } session;

    struct History {
        bool enabled = true;
        std::string path; // empty: <data dir>/history.db
        uint32_t retention_days = 7; // 0 keeps everything
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};

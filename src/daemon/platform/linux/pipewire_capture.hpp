#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

class PipeWireCapture : public AudioCapture {
public:
    explicit PipeWireCapture(RingBuffer& ring_buf,
                             std::chrono::milliseconds device_timeout = std::chrono::milliseconds(1000));
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::expected<void, std::string> start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

    uint32_t native_rate() const override { return rate_.load(std::memory_order_acquire); }
    uint8_t channel_count() const override { return channels_.load(std::memory_order_acquire); }
    float level() const override { return level_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);
    static void on_param_changed(void* userdata, uint32_t id, const struct spa_pod* param);

    void teardown();

    RingBuffer& ring_buf_;
    std::chrono::milliseconds device_timeout_;

    std::atomic<bool> capturing_{false};
    std::atomic<uint32_t> rate_{0};
    std::atomic<uint8_t> channels_{0};
    std::atomic<float> level_{0.0f};
    std::atomic<int> stream_state_{PW_STREAM_STATE_UNCONNECTED};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .param_changed = on_param_changed,
        .process = on_process,
    };
};

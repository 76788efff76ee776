#include "platform/linux/pipewire_capture.hpp"

#include <cmath>
#include <format>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, std::chrono::milliseconds device_timeout)
    : ring_buf_(ring_buf), device_timeout_(device_timeout) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

std::expected<void, std::string> PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return {};

    rate_.store(0, std::memory_order_release);
    channels_.store(0, std::memory_order_release);
    level_.store(0.0f, std::memory_order_relaxed);
    stream_state_.store(PW_STREAM_STATE_UNCONNECTED, std::memory_order_relaxed);

    loop_ = pw_thread_loop_new("holdtalk", nullptr);
    if (!loop_) {
        return std::unexpected("failed to create PipeWire thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "holdtalk",
        PW_KEY_APP_NAME, "holdtalk",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "holdtalk-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected("failed to create capture stream");
    }

    // S16_LE, rate and channel count left out so the graph hands us the
    // device's native format untouched.
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(.format = SPA_AUDIO_FORMAT_S16_LE);
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        teardown();
        return std::unexpected(std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    capturing_.store(true, std::memory_order_release);

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        capturing_.store(false, std::memory_order_release);
        teardown();
        return std::unexpected(std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    // Wait, bounded, for the device to actually deliver.
    pw_thread_loop_lock(loop_);
    timespec abstime{};
    pw_thread_loop_get_time(loop_, &abstime,
                            std::chrono::duration_cast<std::chrono::nanoseconds>(device_timeout_).count());
    while (true) {
        int st = stream_state_.load(std::memory_order_acquire);
        if (st == PW_STREAM_STATE_STREAMING || st == PW_STREAM_STATE_ERROR) break;
        if (pw_thread_loop_timed_wait_full(loop_, &abstime) < 0) break;
    }
    pw_thread_loop_unlock(loop_);

    int st = stream_state_.load(std::memory_order_acquire);
    if (st != PW_STREAM_STATE_STREAMING) {
        stop();
        return std::unexpected(st == PW_STREAM_STATE_ERROR
                                   ? "input device error"
                                   : "no input device started streaming");
    }

    return {};
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    teardown();
    level_.store(0.0f, std::memory_order_relaxed);
}

void PipeWireCapture::teardown() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* samples = reinterpret_cast<const int16_t*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(int16_t);

    if (count > 0 && self->capturing_.load(std::memory_order_relaxed)) {
        // Metering reads the frame before it is handed off and never touches
        // the session buffer.
        double sum_sq = 0.0;
        for (size_t i = 0; i < count; ++i) {
            double v = samples[i] / 32768.0;
            sum_sq += v * v;
        }
        self->level_.store(static_cast<float>(std::sqrt(sum_sq / count)),
                           std::memory_order_relaxed);

        self->ring_buf_.write(samples, count,
                              self->channels_.load(std::memory_order_acquire));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    self->stream_state_.store(state, std::memory_order_release);
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
    pw_thread_loop_signal(self->loop_, false);
}

void PipeWireCapture::on_param_changed(void* userdata, uint32_t id, const struct spa_pod* param) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (param == nullptr || id != SPA_PARAM_Format) return;

    spa_audio_info_raw info{};
    if (spa_format_audio_raw_parse(param, &info) < 0) return;

    self->channels_.store(static_cast<uint8_t>(info.channels), std::memory_order_release);
    self->rate_.store(info.rate, std::memory_order_release);
}

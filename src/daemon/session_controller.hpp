#pragma once

#include "hotkey_event.hpp"
#include "output/insertion_coordinator.hpp"
#include "platform/audio_capture.hpp"
#include "resampler.hpp"
#include "ring_buffer.hpp"
#include "session_state.hpp"
#include "streaming_accumulator.hpp"
#include "task_scheduler.hpp"
#include "transcription/orchestrator.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

struct SessionOptions {
    std::chrono::milliseconds min_hold{100};
    std::chrono::milliseconds stale_after{10000};
    std::chrono::milliseconds transcribe_timeout{10000};
    std::chrono::milliseconds timeout_per_audio_second{500};
    std::chrono::milliseconds feedback{1500};
    std::chrono::milliseconds pump_interval{50};
    std::chrono::milliseconds max_recording{120000};
    std::chrono::milliseconds inactivity_timeout{30000}; // 0 never stops on quiet
    double talking_level = 0.02;
    double silence_rms = 0.0; // 0 disables the silence gate
};

// What presentation layers see. duration_s and friends describe the most
// recent session that got past Recording.
struct SessionSnapshot {
    SessionState state;
    uint64_t generation = 0;
    double duration_s = 0.0;
    double confidence = 0.0;
    double processing_s = 0.0;
    std::string last_error;
};

// Sole owner of the recording session. Every method runs on the scheduler
// thread; hotkey and audio threads only reach it through the inbox and the
// ring buffer.
class SessionController {
public:
    using StateObserver = std::function<void(const SessionSnapshot&)>;
    using LevelObserver = std::function<void(float)>;

    SessionController(SessionOptions options, AudioCapture& capture, RingBuffer& ring,
                      const Resampler& resampler, TranscriptionOrchestrator& transcriber,
                      InsertionCoordinator& inserter, TaskScheduler& scheduler,
                      Worker& worker, bool verbose = false);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void handle(const HotkeyEvent& event);

    // Debounces overlapping presses, recovers from a lost release once the
    // active session is older than stale_after.
    void on_press(const HotkeyEvent& event);

    // Only acts while Recording.
    void on_release(const HotkeyEvent& event);

    std::expected<void, std::string> start(MonotonicTime started_at);
    bool stop(MonotonicTime ended_at);

    // Any state -> Idle. Safe to repeat.
    void cancel();

    const SessionGuard& guard() const { return guard_; }
    const SessionState& state() const { return guard_.state; }
    uint64_t generation() const { return guard_.generation; }
    SessionSnapshot snapshot() const;

    float audio_level() const;
    double recording_duration() const;
    const StreamingAccumulator& accumulator() const { return accumulator_; }

    void add_state_observer(StateObserver observer);
    void add_level_observer(LevelObserver observer);

private:
    void transition(SessionState next, MonotonicTime at);
    void transition(SessionState next) { transition(std::move(next), scheduler_.now()); }

    void schedule_pump(uint64_t gen);
    void pump();
    void stop_capture();

    void begin_transcription(uint64_t gen, ResampledBuffer audio, double duration_s);
    void apply_transcription(uint64_t gen, std::expected<TranscriptionResult, std::string> result);
    void apply_insertion(uint64_t gen, std::string text,
                         std::expected<DeliveryMode, std::string> result);

    void fail(FailureKind kind, std::string reason);
    void finish_after_feedback(uint64_t gen);
    void reset_to_idle();

    void drop_timer(TaskScheduler::TimerId& id);
    void drop_timers();

    void log(const std::string& msg);

    SessionOptions options_;
    AudioCapture& capture_;
    RingBuffer& ring_buf_;
    const Resampler& resampler_;
    TranscriptionOrchestrator& transcriber_;
    InsertionCoordinator& inserter_;
    TaskScheduler& scheduler_;
    Worker& worker_;
    bool verbose_;

    SessionGuard guard_;
    StreamingAccumulator accumulator_;

    TaskScheduler::TimerId pump_timer_ = 0;
    TaskScheduler::TimerId timeout_timer_ = 0;
    TaskScheduler::TimerId feedback_timer_ = 0;

    // Last pump that heard the capture level above talking_level.
    MonotonicTime last_voice_at_{};

    double last_duration_s_ = 0.0;
    double last_confidence_ = 0.0;
    double last_processing_s_ = 0.0;
    std::string last_error_;

    std::vector<StateObserver> state_observers_;
    std::vector<LevelObserver> level_observers_;
};

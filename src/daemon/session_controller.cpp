#include "session_controller.hpp"

#include <format>
#include <print>

namespace {

double ms_between(MonotonicTime from, MonotonicTime to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

SessionController::SessionController(SessionOptions options, AudioCapture& capture,
                                     RingBuffer& ring, const Resampler& resampler,
                                     TranscriptionOrchestrator& transcriber,
                                     InsertionCoordinator& inserter, TaskScheduler& scheduler,
                                     Worker& worker, bool verbose)
    : options_(options), capture_(capture), ring_buf_(ring), resampler_(resampler),
      transcriber_(transcriber), inserter_(inserter), scheduler_(scheduler),
      worker_(worker), verbose_(verbose) {
    guard_.last_transition_at = scheduler_.now();
}

SessionController::~SessionController() {
    drop_timers();
    stop_capture();
}

void SessionController::handle(const HotkeyEvent& event) {
    switch (event.kind) {
        case HotkeyKind::Pressed:
            on_press(event);
            break;
        case HotkeyKind::Released:
            on_release(event);
            break;
    }
}

void SessionController::on_press(const HotkeyEvent& event) {
    if (is_active(guard_.state)) {
        auto age = event.source_timestamp - guard_.last_transition_at;
        if (age < options_.stale_after) {
            log(std::format("press ignored, session {} still {}", guard_.generation,
                            state_name(guard_.state)));
            return;
        }
        log(std::format("session {} stuck in {} for {:.0f}ms, forcing reset",
                        guard_.generation, state_name(guard_.state),
                        ms_between(guard_.last_transition_at, event.source_timestamp)));
        cancel();
    } else if (is_terminal(guard_.state)) {
        // A finished session showing its result never blocks a new one.
        reset_to_idle();
    }

    auto res = start(event.source_timestamp);
    if (!res) {
        std::println(stderr, "session: cannot start recording: {}", res.error());
    }
}

void SessionController::on_release(const HotkeyEvent& event) {
    if (!holds<state::Recording>(guard_.state)) {
        log(std::format("release ignored while {}", state_name(guard_.state)));
        return;
    }
    stop(event.source_timestamp);
}

std::expected<void, std::string> SessionController::start(MonotonicTime started_at) {
    if (!holds<state::Idle>(guard_.state)) {
        return std::unexpected(std::format("session is {}", state_name(guard_.state)));
    }

    ++guard_.generation;
    accumulator_.clear();
    ring_buf_.reset();

    auto res = capture_.start();
    if (!res) {
        last_error_ = res.error();
        return std::unexpected(res.error());
    }

    last_error_.clear();
    last_voice_at_ = scheduler_.now();
    transition(state::Recording{started_at}, started_at);
    schedule_pump(guard_.generation);
    log(std::format("session {} recording", guard_.generation));
    return {};
}

bool SessionController::stop(MonotonicTime ended_at) {
    auto* rec = std::get_if<state::Recording>(&guard_.state);
    if (!rec) return false;

    const auto started_at = rec->started_at;
    if (ended_at < started_at) ended_at = started_at;

    drop_timer(pump_timer_);
    capture_.stop();
    pump();

    auto held = ended_at - started_at;
    if (held < options_.min_hold) {
        log(std::format("hold of {:.0f}ms is below {}ms, cancelling",
                        ms_between(started_at, ended_at), options_.min_hold.count()));
        cancel();
        return false;
    }

    if (ring_buf_.dropped() > 0) {
        std::println(stderr, "session: capture channel overflowed, {} samples dropped",
                     ring_buf_.dropped());
    }

    state::Transcribing transcribing{started_at, ended_at};
    const double duration_s = transcribing.duration_s();
    last_duration_s_ = duration_s;
    last_confidence_ = 0.0;
    last_processing_s_ = 0.0;

    if (options_.silence_rms > 0.0 && accumulator_.rms() < options_.silence_rms) {
        log(std::format("no speech above {:.3f} RMS, cancelling", options_.silence_rms));
        cancel();
        return false;
    }

    transition(std::move(transcribing));

    auto audio = accumulator_.take();
    ring_buf_.reset();
    if (!audio) {
        fail(FailureKind::Capture, audio.error());
        return false;
    }

    auto native_rate = audio->sample_rate;
    auto resampled = resampler_.convert(std::move(*audio));
    if (!resampled) {
        fail(FailureKind::Conversion, resampled.error());
        return false;
    }

    log(std::format("session {} stopped after {:.2f}s, {} samples {} Hz -> {} Hz",
                    guard_.generation, duration_s, resampled->samples.size(), native_rate,
                    resampled->sample_rate));

    begin_transcription(guard_.generation, std::move(*resampled), duration_s);
    return true;
}

void SessionController::cancel() {
    ++guard_.generation;
    drop_timers();
    stop_capture();
    accumulator_.clear();
    ring_buf_.reset();

    if (holds<state::Idle>(guard_.state)) {
        return;
    }

    log(std::format("session cancelled from {}", state_name(guard_.state)));
    transition(state::Cancelled{});
    transition(state::Idle{});
}

SessionSnapshot SessionController::snapshot() const {
    return SessionSnapshot{
        .state = guard_.state,
        .generation = guard_.generation,
        .duration_s = last_duration_s_,
        .confidence = last_confidence_,
        .processing_s = last_processing_s_,
        .last_error = last_error_,
    };
}

float SessionController::audio_level() const {
    return holds<state::Recording>(guard_.state) ? capture_.level() : 0.0f;
}

double SessionController::recording_duration() const {
    auto* rec = std::get_if<state::Recording>(&guard_.state);
    if (!rec) return 0.0;
    return std::chrono::duration<double>(scheduler_.now() - rec->started_at).count();
}

void SessionController::add_state_observer(StateObserver observer) {
    state_observers_.push_back(std::move(observer));
}

void SessionController::add_level_observer(LevelObserver observer) {
    level_observers_.push_back(std::move(observer));
}

void SessionController::transition(SessionState next, MonotonicTime at) {
    guard_.transition(std::move(next), at);
    if (state_observers_.empty()) return;

    auto snap = snapshot();
    for (auto& obs : state_observers_) obs(snap);
}

void SessionController::schedule_pump(uint64_t gen) {
    pump_timer_ = scheduler_.schedule_after(options_.pump_interval, [this, gen] {
        pump_timer_ = 0;
        auto* rec = std::get_if<state::Recording>(&guard_.state);
        if (!guard_.is_current(gen) || !rec) return;

        pump();

        if (scheduler_.now() - rec->started_at >= options_.max_recording) {
            log(std::format("recording reached {}s limit, stopping",
                            std::chrono::duration_cast<std::chrono::seconds>(
                                options_.max_recording).count()));
            stop(scheduler_.now());
            return;
        }
        if (options_.inactivity_timeout.count() > 0 &&
            scheduler_.now() - last_voice_at_ >= options_.inactivity_timeout) {
            log(std::format("nothing above {:.2f} for {}ms, stopping", options_.talking_level,
                            options_.inactivity_timeout.count()));
            stop(scheduler_.now());
            return;
        }
        schedule_pump(gen);
    });
}

void SessionController::pump() {
    uint32_t rate = capture_.native_rate();
    uint8_t channels = capture_.channel_count();
    if (rate == 0 || channels == 0) return;

    auto samples = ring_buf_.drain_all(channels);
    if (!samples.empty()) {
        accumulator_.append(RawAudioChunk{
            .samples = std::move(samples),
            .native_sample_rate = rate,
            .channel_count = channels,
            .captured_at = scheduler_.now(),
        });
    }

    float level = capture_.level();
    if (level > options_.talking_level) last_voice_at_ = scheduler_.now();
    for (auto& obs : level_observers_) obs(level);
}

void SessionController::stop_capture() {
    if (capture_.is_capturing()) capture_.stop();
}

void SessionController::begin_transcription(uint64_t gen, ResampledBuffer audio,
                                            double duration_s) {
    auto timeout = options_.transcribe_timeout +
                   std::chrono::milliseconds(static_cast<int64_t>(
                       duration_s * static_cast<double>(options_.timeout_per_audio_second.count())));

    timeout_timer_ = scheduler_.schedule_after(timeout, [this, gen, timeout] {
        timeout_timer_ = 0;
        if (!guard_.is_current(gen) || !holds<state::Transcribing>(guard_.state)) return;
        fail(FailureKind::Timeout,
             std::format("transcription did not finish within {}ms", timeout.count()));
    });

    worker_.submit([this, gen, audio = std::move(audio)] {
        auto result = transcriber_.transcribe(audio);
        scheduler_.post([this, gen, result = std::move(result)]() mutable {
            apply_transcription(gen, std::move(result));
        });
    });
}

void SessionController::apply_transcription(uint64_t gen,
                                            std::expected<TranscriptionResult, std::string> result) {
    if (!guard_.is_current(gen) || !holds<state::Transcribing>(guard_.state)) {
        log(std::format("discarding transcription for session {} (now {}, {})", gen,
                        guard_.generation, state_name(guard_.state)));
        return;
    }
    drop_timer(timeout_timer_);

    if (!result) {
        fail(FailureKind::Transcription, result.error());
        return;
    }

    last_confidence_ = result->confidence;
    last_processing_s_ = result->elapsed_s;
    log(std::format("transcribed in {:.2f}s, {} chars, confidence {:.2f}",
                    result->elapsed_s, result->text.size(), result->confidence));

    std::string text = std::move(result->text);
    transition(state::Inserting{text});

    worker_.submit([this, gen, text] {
        auto delivered = inserter_.insert(text);
        scheduler_.post([this, gen, text, delivered] {
            apply_insertion(gen, text, delivered);
        });
    });
}

void SessionController::apply_insertion(uint64_t gen, std::string text,
                                        std::expected<DeliveryMode, std::string> result) {
    if (!guard_.is_current(gen) || !holds<state::Inserting>(guard_.state)) {
        log(std::format("discarding insertion result for session {}", gen));
        return;
    }

    if (!result) {
        fail(FailureKind::Insertion, result.error());
        return;
    }

    if (*result == DeliveryMode::CopiedToClipboardFallback) {
        log("text is on the clipboard only");
    }
    transition(state::Completed{std::move(text), *result});
    finish_after_feedback(gen);
}

void SessionController::fail(FailureKind kind, std::string reason) {
    std::println(stderr, "session: {} failure: {}", failure_name(kind), reason);

    drop_timers();
    stop_capture();
    accumulator_.clear();

    last_error_ = reason;
    transition(state::Failed{kind, std::move(reason)});
    finish_after_feedback(guard_.generation);
}

void SessionController::finish_after_feedback(uint64_t gen) {
    drop_timer(feedback_timer_);
    feedback_timer_ = scheduler_.schedule_after(options_.feedback, [this, gen] {
        feedback_timer_ = 0;
        if (!guard_.is_current(gen) || !is_terminal(guard_.state)) return;
        reset_to_idle();
    });
}

void SessionController::reset_to_idle() {
    drop_timer(feedback_timer_);
    if (holds<state::Idle>(guard_.state)) return;
    transition(state::Idle{});
}

void SessionController::drop_timer(TaskScheduler::TimerId& id) {
    if (id != 0) {
        scheduler_.cancel(id);
        id = 0;
    }
}

void SessionController::drop_timers() {
    drop_timer(pump_timer_);
    drop_timer(timeout_timer_);
    drop_timer(feedback_timer_);
}

void SessionController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[holdtalk] {}", msg);
    }
}

#pragma once

#include "hotkey_event.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

enum class DeliveryMode { InsertedDirectly, CopiedToClipboardFallback };

enum class FailureKind { Capture, Conversion, Transcription, Timeout, Insertion };

namespace state {

struct Idle {};

struct Recording {
    MonotonicTime started_at;
};

struct Transcribing {
    MonotonicTime started_at;
    MonotonicTime ended_at;

    double duration_s() const {
        return std::chrono::duration<double>(ended_at - started_at).count();
    }
};

struct Inserting {
    std::string text;
};

struct Completed {
    std::string text;
    DeliveryMode delivery = DeliveryMode::InsertedDirectly;
};

struct Cancelled {};

struct Failed {
    FailureKind kind = FailureKind::Transcription;
    std::string reason;
};

} // namespace state

using SessionState = std::variant<state::Idle, state::Recording, state::Transcribing,
                                  state::Inserting, state::Completed, state::Cancelled,
                                  state::Failed>;

std::string_view state_name(const SessionState& s);
std::string_view delivery_name(DeliveryMode mode);
std::string_view failure_name(FailureKind kind);

// Completed, Cancelled and Failed.
bool is_terminal(const SessionState& s);

// Recording, Transcribing and Inserting: a session owns the controller.
bool is_active(const SessionState& s);

template <typename T>
bool holds(const SessionState& s) {
    return std::holds_alternative<T>(s);
}

// The single mutable cell behind the controller. generation moves forward on
// every start and every cancel; continuations compare against it before they
// touch anything.
struct SessionGuard {
    SessionState state = state::Idle{};
    uint64_t generation = 0;
    MonotonicTime last_transition_at{};

    void transition(SessionState next, MonotonicTime at) {
        state = std::move(next);
        last_transition_at = at;
    }

    bool is_current(uint64_t gen) const { return gen == generation; }
};

#pragma once

#include <chrono>

using MonotonicClock = std::chrono::steady_clock;
using MonotonicTime = MonotonicClock::time_point;

enum class HotkeyKind { Pressed, Released };

// source_timestamp is taken where the event enters the process (X11 listener
// thread, IPC accept path), never where the controller eventually handles it.
struct HotkeyEvent {
    HotkeyKind kind = HotkeyKind::Pressed;
    MonotonicTime source_timestamp{};
};

inline HotkeyEvent make_press(MonotonicTime ts = MonotonicClock::now()) {
    return {HotkeyKind::Pressed, ts};
}

inline HotkeyEvent make_release(MonotonicTime ts = MonotonicClock::now()) {
    return {HotkeyKind::Released, ts};
}

#pragma once

#include "hotkey_event.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <vector>

// Multi-producer, single-consumer queue that serializes hotkey events from every
// source into one arrival-ordered timeline. push() is safe from any thread and
// only holds the lock long enough to append.
class HotkeyInbox {
public:
    using WakeFn = std::function<void()>;

    explicit HotkeyInbox(WakeFn wake = {});

    HotkeyInbox(const HotkeyInbox&) = delete;
    HotkeyInbox& operator=(const HotkeyInbox&) = delete;

    void set_wake(WakeFn wake);

    void push(const HotkeyEvent& event);

    // Consumer: everything queued so far, oldest first.
    std::vector<HotkeyEvent> drain();

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<HotkeyEvent> queue_;
    WakeFn wake_;
};

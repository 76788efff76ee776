#include "hotkey_inbox.hpp"

HotkeyInbox::HotkeyInbox(WakeFn wake) : wake_(std::move(wake)) {}

void HotkeyInbox::set_wake(WakeFn wake) {
    std::lock_guard lock(mutex_);
    wake_ = std::move(wake);
}

void HotkeyInbox::push(const HotkeyEvent& event) {
    std::lock_guard lock(mutex_);
    queue_.push_back(event);
    // The wake hook is a non-blocking eventfd write in the daemon.
    if (wake_) wake_();
}

std::vector<HotkeyEvent> HotkeyInbox::drain() {
    std::lock_guard lock(mutex_);
    std::vector<HotkeyEvent> events(queue_.begin(), queue_.end());
    queue_.clear();
    return events;
}

size_t HotkeyInbox::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

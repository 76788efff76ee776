#pragma once

#include "platform/hotkey_source.hpp"

#include <X11/Xlib.h>
#include <atomic>
#include <thread>

class X11HotkeySource : public HotkeySource {
public:
    X11HotkeySource() = default;
    ~X11HotkeySource() override;

    X11HotkeySource(const X11HotkeySource&) = delete;
    X11HotkeySource& operator=(const X11HotkeySource&) = delete;

    std::expected<void, HotkeyError> start(const HotkeyCombo& combo, HotkeyInbox& inbox) override;
    void stop() override;
    bool is_active() const override { return active_.load(std::memory_order_relaxed); }

private:
    void listen(std::stop_token stop, HotkeyInbox& inbox);
    void grab(bool enable);
    bool is_autorepeat(const XEvent& release);

    Display* display_ = nullptr;
    Window root_ = 0;
    int keycode_ = 0;
    unsigned int mask_ = 0;
    int wake_fd_ = -1;
    std::atomic<bool> active_{false};
    std::jthread listener_;
};

#include "platform/linux/x11_hotkey_source.hpp"

#include <X11/XKBlib.h>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <string>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_grab_refused{false};

int on_x_error(Display*, XErrorEvent* ev) {
    if (ev->error_code == BadAccess) {
        g_grab_refused.store(true, std::memory_order_relaxed);
    }
    return 0;
}

KeySym lookup_keysym(const std::string& key) {
    KeySym sym = XStringToKeysym(key.c_str());
    if (sym != NoSymbol) return sym;

    // Accept "f9" for "F9" and "Space" for "space".
    std::string alt = key;
    alt[0] = static_cast<char>(std::isupper(static_cast<unsigned char>(alt[0]))
                                   ? std::tolower(static_cast<unsigned char>(alt[0]))
                                   : std::toupper(static_cast<unsigned char>(alt[0])));
    return XStringToKeysym(alt.c_str());
}

// True when a local display's socket accepts a connection. Remote displays
// are reported unreachable.
bool local_server_reachable(const char* display) {
    if (!display || display[0] != ':') return false;
    std::string number = display + 1;
    number = number.substr(0, number.find('.'));
    if (number.empty()) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::string path = "/tmp/.X11-unix/X" + number;
    if (path.size() >= sizeof(addr.sun_path)) return false;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    bool ok = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return ok;
}

// NumLock and CapsLock must not change whether the combo matches.
constexpr unsigned int kLockVariants[] = {0, LockMask, Mod2Mask, LockMask | Mod2Mask};

} // namespace

X11HotkeySource::~X11HotkeySource() {
    stop();
}

std::expected<void, HotkeyError> X11HotkeySource::start(const HotkeyCombo& combo,
                                                        HotkeyInbox& inbox) {
    if (active_.load(std::memory_order_relaxed)) stop();

    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        const char* name = std::getenv("DISPLAY");
        bool named = name && name[0] != '\0';
        return std::unexpected(display_open_error(named, local_server_reachable(name)));
    }
    root_ = DefaultRootWindow(display_);

    KeySym sym = lookup_keysym(combo.key);
    keycode_ = sym != NoSymbol ? XKeysymToKeycode(display_, sym) : 0;
    if (keycode_ == 0) {
        XCloseDisplay(display_);
        display_ = nullptr;
        return std::unexpected(HotkeyError::InvalidCombo);
    }

    mask_ = 0;
    if (combo.modifiers & kModCtrl) mask_ |= ControlMask;
    if (combo.modifiers & kModShift) mask_ |= ShiftMask;
    if (combo.modifiers & kModAlt) mask_ |= Mod1Mask;
    if (combo.modifiers & kModSuper) mask_ |= Mod4Mask;

    Bool detectable = False;
    XkbSetDetectableAutoRepeat(display_, True, &detectable);

    g_grab_refused.store(false, std::memory_order_relaxed);
    auto* previous = XSetErrorHandler(on_x_error);
    grab(true);
    XSync(display_, False);
    XSetErrorHandler(previous);

    if (g_grab_refused.load(std::memory_order_relaxed)) {
        grab(false);
        XCloseDisplay(display_);
        display_ = nullptr;
        return std::unexpected(HotkeyError::AlreadyBound);
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        grab(false);
        XCloseDisplay(display_);
        display_ = nullptr;
        return std::unexpected(HotkeyError::DisplayUnavailable);
    }

    active_.store(true, std::memory_order_release);
    listener_ = std::jthread([this, &inbox](std::stop_token st) { listen(st, inbox); });
    return {};
}

void X11HotkeySource::stop() {
    if (!active_.exchange(false)) return;

    listener_.request_stop();
    uint64_t one = 1;
    [[maybe_unused]] auto n = ::write(wake_fd_, &one, sizeof(one));
    if (listener_.joinable()) listener_.join();

    grab(false);
    XCloseDisplay(display_);
    display_ = nullptr;
    ::close(wake_fd_);
    wake_fd_ = -1;
}

void X11HotkeySource::grab(bool enable) {
    for (unsigned int extra : kLockVariants) {
        if (enable) {
            XGrabKey(display_, keycode_, mask_ | extra, root_, True, GrabModeAsync, GrabModeAsync);
        } else {
            XUngrabKey(display_, keycode_, mask_ | extra, root_);
        }
    }
    XFlush(display_);
}

bool X11HotkeySource::is_autorepeat(const XEvent& release) {
    // Without detectable auto-repeat the server sends Release+Press pairs with
    // the same timestamp while the key is held.
    if (XEventsQueued(display_, QueuedAfterReading) == 0) return false;

    XEvent next;
    XPeekEvent(display_, &next);
    return next.type == KeyPress && next.xkey.keycode == release.xkey.keycode &&
           next.xkey.time == release.xkey.time;
}

void X11HotkeySource::listen(std::stop_token stop, HotkeyInbox& inbox) {
    bool held = false;
    pollfd fds[2] = {
        {.fd = ConnectionNumber(display_), .events = POLLIN, .revents = 0},
        {.fd = wake_fd_, .events = POLLIN, .revents = 0},
    };

    while (!stop.stop_requested()) {
        while (XPending(display_) > 0) {
            XEvent ev;
            XNextEvent(display_, &ev);
            auto now = MonotonicClock::now();

            if (ev.type == KeyPress && static_cast<int>(ev.xkey.keycode) == keycode_) {
                if (!held) {
                    held = true;
                    inbox.push(make_press(now));
                }
            } else if (ev.type == KeyRelease && static_cast<int>(ev.xkey.keycode) == keycode_) {
                if (is_autorepeat(ev)) {
                    XEvent repeat;
                    XNextEvent(display_, &repeat);
                    continue;
                }
                if (held) {
                    held = false;
                    inbox.push(make_release(now));
                }
            }
        }

        int n = ::poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (fds[1].revents & POLLIN) break;
    }
}

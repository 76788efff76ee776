#pragma once

#include "hotkey_combo.hpp"
#include "hotkey_inbox.hpp"

#include <expected>
#include <string_view>

enum class HotkeyError { InvalidCombo, DisplayUnavailable, AlreadyBound, PermissionDenied };

inline std::string_view hotkey_error_message(HotkeyError e) {
    switch (e) {
        case HotkeyError::InvalidCombo: return "key combination is not valid on this system";
        case HotkeyError::DisplayUnavailable: return "no display to grab keys on";
        case HotkeyError::AlreadyBound: return "key combination is already bound by another client";
        case HotkeyError::PermissionDenied: return "not permitted to grab global keys";
    }
    return "unknown hotkey error";
}

// Why no display connection could be made. A server that accepts the socket
// but refuses the X handshake is rejecting our credentials.
inline HotkeyError display_open_error(bool display_named, bool server_reachable) {
    if (display_named && server_reachable) return HotkeyError::PermissionDenied;
    return HotkeyError::DisplayUnavailable;
}

// Global shortcut registration. Once started, the implementation's callback
// context does nothing but stamp each press/release and push it to the inbox.
// A failed registration is final until the user changes the binding.
class HotkeySource {
public:
    virtual ~HotkeySource() = default;
    virtual std::expected<void, HotkeyError> start(const HotkeyCombo& combo, HotkeyInbox& inbox) = 0;
    virtual void stop() = 0;
    virtual bool is_active() const = 0;
};

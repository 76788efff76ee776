#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

enum HotkeyModifier : uint8_t {
    kModCtrl = 1 << 0,
    kModShift = 1 << 1,
    kModAlt = 1 << 2,
    kModSuper = 1 << 3,
};

struct HotkeyCombo {
    uint8_t modifiers = 0;
    std::string key; // platform key name, e.g. "space", "F9", "r"

    std::string to_string() const;
};

// "ctrl+shift+space" -> {kModCtrl | kModShift, "space"}. Case-insensitive for
// modifiers, exactly one non-modifier key.
std::expected<HotkeyCombo, std::string> parse_hotkey(std::string_view text);

#include "hotkey_combo.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <vector>

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(" \t");
    return std::string(s.substr(first, last - first + 1));
}

uint8_t modifier_bit(const std::string& name) {
    if (name == "ctrl" || name == "control") return kModCtrl;
    if (name == "shift") return kModShift;
    if (name == "alt" || name == "mod1") return kModAlt;
    if (name == "super" || name == "meta" || name == "mod4") return kModSuper;
    return 0;
}

} // namespace

std::string HotkeyCombo::to_string() const {
    std::string out;
    if (modifiers & kModCtrl) out += "ctrl+";
    if (modifiers & kModShift) out += "shift+";
    if (modifiers & kModAlt) out += "alt+";
    if (modifiers & kModSuper) out += "super+";
    return out + key;
}

std::expected<HotkeyCombo, std::string> parse_hotkey(std::string_view text) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (true) {
        auto plus = text.find('+', pos);
        parts.push_back(trim(text.substr(pos, plus == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : plus - pos)));
        if (plus == std::string_view::npos) break;
        pos = plus + 1;
    }

    HotkeyCombo combo;
    for (const auto& part : parts) {
        if (part.empty()) {
            return std::unexpected(std::format("empty component in \"{}\"", text));
        }
        if (uint8_t bit = modifier_bit(lower(part)); bit != 0) {
            if (combo.modifiers & bit) {
                return std::unexpected(std::format("modifier \"{}\" repeated", part));
            }
            combo.modifiers |= bit;
            continue;
        }
        if (!combo.key.empty()) {
            return std::unexpected(std::format("more than one key in \"{}\" ({} and {})",
                                               text, combo.key, part));
        }
        combo.key = part;
    }

    if (combo.key.empty()) {
        return std::unexpected(std::format("no key in \"{}\"", text));
    }
    return combo;
}

#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

// $XDG_<X>/holdtalk, else $HOME/<fallback>/holdtalk.
std::string xdg_app_dir(const char* xdg_var, const char* home_fallback) {
    if (const char* xdg = std::getenv(xdg_var); xdg && *xdg) {
        return std::string(xdg) + "/holdtalk";
    }
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/" + home_fallback + "/holdtalk";
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    auto dir = xdg_app_dir("XDG_DATA_HOME", ".local/share");
    return dir.empty() ? "/tmp/holdtalk" : dir;
}

std::string ipc_endpoint() {
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) {
        return std::string(xdg) + "/holdtalk.sock";
    }
    return "/tmp/holdtalk.sock";
}

} // namespace platform

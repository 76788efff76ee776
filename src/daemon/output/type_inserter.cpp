#include "output/type_inserter.hpp"

#include <unistd.h>

TypeInserter::TypeInserter(DisplayServer server) : server_(server), clipboard_(server) {}

std::expected<void, std::string> TypeInserter::deliver(const std::string& text) {
    auto res = clipboard_.deliver(text);
    if (!res) return res;

    // Give the clipboard owner time to take the selection before pasting.
    ::usleep(50000);
    return send_paste();
}

std::expected<void, std::string> TypeInserter::send_paste() {
    if (server_ == DisplayServer::Wayland) {
        return run_tool({"wtype", "-M", "ctrl", "-k", "v"});
    }
    return run_tool({"xdotool", "key", "--clearmodifiers", "ctrl+v"});
}

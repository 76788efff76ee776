#include "output/clipboard_inserter.hpp"

ClipboardInserter::ClipboardInserter(DisplayServer server) : server_(server) {}

std::expected<void, std::string> ClipboardInserter::deliver(const std::string& text) {
    if (server_ == DisplayServer::Wayland) {
        return run_tool({"wl-copy"}, &text);
    }
    return run_tool({"xclip", "-selection", "clipboard"}, &text);
}

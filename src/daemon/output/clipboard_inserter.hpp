#pragma once

#include "output/inserter.hpp"
#include "output/process.hpp"

// Puts the text on the clipboard and nothing else (wl-copy / xclip).
class ClipboardInserter : public TextInserter {
public:
    explicit ClipboardInserter(DisplayServer server = detect_display_server());
    std::expected<void, std::string> deliver(const std::string& text) override;

private:
    DisplayServer server_;
};

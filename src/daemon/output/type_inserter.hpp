#pragma once

#include "output/clipboard_inserter.hpp"
#include "output/inserter.hpp"
#include "output/process.hpp"

// Inserts into the focused window: clipboard, then a synthetic paste shortcut.
// Direct character typing is mangled by too many toolkits and layouts, so the
// clipboard is always the carrier.
class TypeInserter : public TextInserter {
public:
    explicit TypeInserter(DisplayServer server = detect_display_server());
    std::expected<void, std::string> deliver(const std::string& text) override;

private:
    std::expected<void, std::string> send_paste();

    DisplayServer server_;
    ClipboardInserter clipboard_;
};

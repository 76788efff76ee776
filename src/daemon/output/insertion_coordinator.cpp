#include "output/insertion_coordinator.hpp"

#include <print>

InsertionCoordinator::InsertionCoordinator(TextInserter* direct, TextInserter& clipboard)
    : direct_(direct), clipboard_(clipboard) {}

std::expected<DeliveryMode, std::string> InsertionCoordinator::insert(const std::string& text) {
    std::string direct_error;
    if (direct_) {
        auto res = direct_->deliver(text);
        if (res) return DeliveryMode::InsertedDirectly;
        direct_error = res.error();
        std::println(stderr, "output: direct insertion failed ({}), using clipboard", direct_error);
    }

    auto res = clipboard_.deliver(text);
    if (!res) {
        if (direct_error.empty()) return std::unexpected(res.error());
        return std::unexpected(direct_error + "; " + res.error());
    }
    return DeliveryMode::CopiedToClipboardFallback;
}

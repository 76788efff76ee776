#pragma once

#include "output/inserter.hpp"
#include "session_state.hpp"

#include <expected>
#include <string>

// Direct insertion first, clipboard second. direct may be null (clipboard-only
// preference); the result always says which path delivered the text.
class InsertionCoordinator {
public:
    InsertionCoordinator(TextInserter* direct, TextInserter& clipboard);

    std::expected<DeliveryMode, std::string> insert(const std::string& text);

private:
    TextInserter* direct_;
    TextInserter& clipboard_;
};

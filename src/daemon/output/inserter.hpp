#pragma once

#include <expected>
#include <string>

// External text delivery mechanism.
class TextInserter {
public:
    virtual ~TextInserter() = default;
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};

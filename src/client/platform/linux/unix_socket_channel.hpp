#pragma once

#include "platform/control_channel.hpp"

#include <optional>
#include <string>

class UnixSocketChannel : public ControlChannel {
public:
    UnixSocketChannel() = default;
    ~UnixSocketChannel() override;

    UnixSocketChannel(const UnixSocketChannel&) = delete;
    UnixSocketChannel& operator=(const UnixSocketChannel&) = delete;

    std::expected<void, std::string> open(const std::string& endpoint) override;
    std::expected<void, std::string> send(const nlohmann::json& cmd) override;
    std::expected<nlohmann::json, std::string> receive(int timeout_ms) override;
    void close() override;

private:
    std::optional<std::expected<nlohmann::json, std::string>> take_line();

    int fd_ = -1;
    // Bytes past the last returned line; watch streams several lines per read.
    std::string pending_;
};

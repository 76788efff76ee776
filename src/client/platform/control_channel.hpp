#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Caller's end of the daemon control socket: JSON objects, one per line.
class ControlChannel {
public:
    virtual ~ControlChannel() = default;
    virtual std::expected<void, std::string> open(const std::string& endpoint) = 0;
    virtual std::expected<void, std::string> send(const nlohmann::json& cmd) = 0;
    // Next line from the daemon. timeout_ms < 0 waits forever.
    virtual std::expected<nlohmann::json, std::string> receive(int timeout_ms) = 0;
    virtual void close() = 0;

    std::expected<nlohmann::json, std::string> request(const nlohmann::json& cmd,
                                                       int timeout_ms) {
        if (auto sent = send(cmd); !sent) return std::unexpected(sent.error());
        return receive(timeout_ms);
    }
};

#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

enum class ReadStatus {
    Command,    // one full line parsed into cmd
    Incomplete, // partial line buffered, keep the client
    Closed,     // peer hung up or sent garbage
};

// Listening end of the control socket: one JSON object per line in each
// direction. Every call happens on the loop thread.
class ControlServer {
public:
    virtual ~ControlServer() = default;
    virtual std::expected<void, std::string> listen(const std::string& endpoint) = 0;
    virtual void shutdown() = 0;
    virtual int listen_fd() const = 0;
    // -1 when nothing is pending or the peer was refused.
    virtual int accept_client() = 0;
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    // False when the line could not be written whole without blocking.
    virtual bool send_line(int client_fd, const nlohmann::json& msg) = 0;
    virtual void close_client(int client_fd) = 0;
};

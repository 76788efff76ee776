#pragma once

#include "platform/control_server.hpp"

#include <string>
#include <sys/types.h>
#include <unordered_map>

// AF_UNIX stream socket, mode 0600, accepting peers of the daemon's own uid only.
class UnixSocketServer : public ControlServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    std::expected<void, std::string> listen(const std::string& endpoint) override;
    void shutdown() override;
    int listen_fd() const override { return listen_fd_; }
    int accept_client() override;
    ReadStatus read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_line(int client_fd, const nlohmann::json& msg) override;
    void close_client(int client_fd) override;

    size_t client_count() const { return inbound_.size(); }

private:
    enum class LineResult { Parsed, NoLine, Garbage };
    LineResult take_line(int client_fd, std::string& buf, nlohmann::json& cmd);

    int listen_fd_ = -1;
    uid_t owner_uid_;
    std::string socket_path_;
    // Bytes received from each client that do not yet end in a newline.
    std::unordered_map<int, std::string> inbound_;
};

#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

constexpr size_t kMaxLine = 64 * 1024;
constexpr int kBacklog = 8;

std::string errno_text(const char* what) {
    return std::format("{} failed: {}", what, std::strerror(errno));
}

} // namespace

UnixSocketServer::UnixSocketServer() : owner_uid_(::getuid()) {}

UnixSocketServer::~UnixSocketServer() {
    shutdown();
}

std::expected<void, std::string> UnixSocketServer::listen(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        return std::unexpected(std::format("socket path too long: {}", endpoint));
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // A daemon that died without cleaning up leaves its socket behind.
    ::unlink(endpoint.c_str());

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) return std::unexpected(errno_text("socket()"));

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = std::format("bind({}) failed: {}", endpoint, std::strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return std::unexpected(err);
    }
    socket_path_ = endpoint;

    if (::chmod(endpoint.c_str(), 0600) < 0) {
        auto err = errno_text("chmod()");
        shutdown();
        return std::unexpected(err);
    }

    if (::listen(listen_fd_, kBacklog) < 0) {
        auto err = errno_text("listen()");
        shutdown();
        return std::unexpected(err);
    }
    return {};
}

void UnixSocketServer::shutdown() {
    for (auto& [fd, buf] : inbound_) {
        ::close(fd);
    }
    inbound_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;

    ucred cred{};
    socklen_t len = sizeof(cred);
    if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &cred, &len) < 0 ||
        cred.uid != owner_uid_) {
        std::println(stderr, "ipc: refusing connection from uid {} (pid {})", cred.uid, cred.pid);
        ::close(fd);
        return -1;
    }

    inbound_.emplace(fd, std::string{});
    return fd;
}

ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto it = inbound_.find(client_fd);
    if (it == inbound_.end()) return ReadStatus::Closed;
    auto& buf = it->second;

    // A previous recv may have brought in more than one line.
    switch (take_line(client_fd, buf, cmd)) {
        case LineResult::Parsed: return ReadStatus::Command;
        case LineResult::Garbage: return ReadStatus::Closed;
        case LineResult::NoLine: break;
    }

    char chunk[4096];
    ssize_t n = ::recv(client_fd, chunk, sizeof(chunk), 0);
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return ReadStatus::Incomplete;
    }
    if (n <= 0) return ReadStatus::Closed;

    buf.append(chunk, static_cast<size_t>(n));

    switch (take_line(client_fd, buf, cmd)) {
        case LineResult::Parsed: return ReadStatus::Command;
        case LineResult::Garbage: return ReadStatus::Closed;
        case LineResult::NoLine: break;
    }
    if (buf.size() > kMaxLine) {
        std::println(stderr, "ipc: fd {} sent {} bytes without a newline", client_fd, buf.size());
        return ReadStatus::Closed;
    }
    return ReadStatus::Incomplete;
}

UnixSocketServer::LineResult UnixSocketServer::take_line(int client_fd, std::string& buf,
                                                         nlohmann::json& cmd) {
    auto pos = buf.find('\n');
    if (pos == std::string::npos) return LineResult::NoLine;

    std::string line = buf.substr(0, pos);
    buf.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "ipc: malformed command from fd {}: {}", client_fd, e.what());
        return LineResult::Garbage;
    }
    if (!cmd.is_object()) {
        std::println(stderr, "ipc: fd {} sent a non-object command", client_fd);
        return LineResult::Garbage;
    }
    auto it = cmd.find("cmd");
    if (it == cmd.end() || !it->is_string()) {
        std::println(stderr, "ipc: fd {} sent a command without a string \"cmd\"", client_fd);
        return LineResult::Garbage;
    }
    return LineResult::Parsed;
}

bool UnixSocketServer::send_line(int client_fd, const nlohmann::json& msg) {
    std::string line = msg.dump() + "\n";
    ssize_t sent = ::send(client_fd, line.data(), line.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
    return sent == static_cast<ssize_t>(line.size());
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    inbound_.erase(client_fd);
}

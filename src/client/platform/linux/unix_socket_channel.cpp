#include "platform/linux/unix_socket_channel.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketChannel::~UnixSocketChannel() {
    close();
}

std::expected<void, std::string> UnixSocketChannel::open(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        return std::unexpected(std::format("socket path too long: {}", endpoint));
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return std::unexpected(std::format("socket(): {}", std::strerror(errno)));

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = std::format("connect({}): {}", endpoint, std::strerror(errno));
        close();
        return std::unexpected(err);
    }
    return {};
}

std::expected<void, std::string> UnixSocketChannel::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return std::unexpected("not connected");

    std::string line = cmd.dump() + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::send(fd_, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return std::unexpected(std::format("send: {}", std::strerror(errno)));
        off += static_cast<size_t>(n);
    }
    return {};
}

std::expected<nlohmann::json, std::string> UnixSocketChannel::receive(int timeout_ms) {
    if (fd_ < 0) return std::unexpected("not connected");
    if (auto line = take_line()) return std::move(*line);

    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
    while (true) {
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) return std::unexpected(std::format("poll: {}", std::strerror(errno)));
        if (ret == 0) return std::unexpected(std::format("no reply within {}ms", timeout_ms));

        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) return std::unexpected(std::format("recv: {}", std::strerror(errno)));
        if (n == 0) return std::unexpected("daemon closed the connection");

        pending_.append(chunk, static_cast<size_t>(n));
        if (auto line = take_line()) return std::move(*line);
    }
}

std::optional<std::expected<nlohmann::json, std::string>> UnixSocketChannel::take_line() {
    auto pos = pending_.find('\n');
    if (pos == std::string::npos) return std::nullopt;

    std::string line = pending_.substr(0, pos);
    pending_.erase(0, pos + 1);
    using Reply = std::expected<nlohmann::json, std::string>;
    try {
        return Reply(nlohmann::json::parse(line));
    } catch (const nlohmann::json::exception& e) {
        return Reply(std::unexpect, std::format("bad reply from daemon: {}", e.what()));
    }
}

void UnixSocketChannel::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}

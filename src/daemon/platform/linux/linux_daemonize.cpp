#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

std::expected<void, std::string> redirect_stdio() {
    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0) {
        return std::unexpected(std::format("open /dev/null: {}", std::strerror(errno)));
    }
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (::dup2(null_fd, fd) < 0) {
            int err = errno;
            ::close(null_fd);
            return std::unexpected(std::format("dup2: {}", std::strerror(err)));
        }
    }
    ::close(null_fd);
    return {};
}

} // namespace

std::expected<void, std::string> daemonize() {
    pid_t pid = ::fork();
    if (pid < 0) return std::unexpected(std::format("fork: {}", std::strerror(errno)));
    if (pid > 0) _exit(0);

    if (::setsid() < 0) return std::unexpected(std::format("setsid: {}", std::strerror(errno)));

    // Second fork: never reacquire a controlling terminal.
    pid = ::fork();
    if (pid < 0) return std::unexpected(std::format("fork: {}", std::strerror(errno)));
    if (pid > 0) _exit(0);

    ::umask(077);
    if (::chdir("/") < 0) return std::unexpected(std::format("chdir: {}", std::strerror(errno)));

    return redirect_stdio();
}

} // namespace platform

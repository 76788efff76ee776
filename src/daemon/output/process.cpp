#include "output/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

std::expected<void, std::string> run_tool(const std::vector<std::string>& argv,
                                          const std::string* stdin_text) {
    if (argv.empty()) {
        return std::unexpected("no command");
    }

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    // Close-on-exec, so a tool started concurrently never holds our write end.
    if (stdin_text && ::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        if (stdin_text) {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        if (stdin_text) {
            ::close(pipefd[1]);
            if (pipefd[0] == STDIN_FILENO) {
                ::fcntl(STDIN_FILENO, F_SETFD, 0);
            } else {
                ::dup2(pipefd[0], STDIN_FILENO);
                ::close(pipefd[0]);
            }
        }
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    if (stdin_text) {
        ::close(pipefd[0]);
        size_t total_written = 0;
        while (total_written < stdin_text->size()) {
            ssize_t n = ::write(pipefd[1], stdin_text->data() + total_written,
                                stdin_text->size() - total_written);
            if (n < 0) {
                if (errno == EINTR) continue;
                ::close(pipefd[1]);
                ::waitpid(pid, nullptr, 0);
                return std::unexpected(std::string("write() failed: ") + std::strerror(errno));
            }
            total_written += static_cast<size_t>(n);
        }
        ::close(pipefd[1]);
    }

    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        if (WEXITSTATUS(status) == 127) {
            return std::unexpected(argv[0] + " not found");
        }
        return std::unexpected(argv[0] + " exited with code " + std::to_string(WEXITSTATUS(status)));
    }
    if (WIFSIGNALED(status)) {
        return std::unexpected(argv[0] + " killed by signal " + std::to_string(WTERMSIG(status)));
    }

    return {};
}

DisplayServer detect_display_server() {
    const char* wl = std::getenv("WAYLAND_DISPLAY");
    return (wl && *wl) ? DisplayServer::Wayland : DisplayServer::X11;
}

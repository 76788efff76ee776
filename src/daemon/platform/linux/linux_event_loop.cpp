#include "platform/linux/linux_event_loop.hpp"

#include "hotkey_combo.hpp"
#include "output/clipboard_inserter.hpp"
#include "output/type_inserter.hpp"
#include "platform/platform_paths.hpp"
#include "transcription/lan_engine.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <utility>
#include <vector>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(config_.audio.ring_buffer_samples()),
      audio_capture_(ring_buf_, std::chrono::milliseconds(config_.audio.device_timeout_ms)),
      core_(config_, verbose_, ring_buf_, audio_capture_,
            control_, inbox_, *this, worker_,
            // EngineFactory
            [](const Config::Backend& backend) -> std::unique_ptr<TranscriptionEngine> {
                if (backend.type == "lan") {
                    return std::make_unique<LanEngine>(backend.url, backend.api_format);
                }
                return nullptr;
            },
            // InserterFactory
            [](const std::string& method) -> std::unique_ptr<TextInserter> {
                if (method == "type") return std::make_unique<TypeInserter>();
                if (method == "clipboard") return std::make_unique<ClipboardInserter>();
                return nullptr;
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    hotkey_source_.stop();
    worker_.join_all();

    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (task_event_fd_ >= 0) ::close(task_event_fd_);
    if (hotkey_event_fd_ >= 0) ::close(hotkey_event_fd_);
}

bool LinuxEventLoop::init() {
    auto endpoint = platform::ipc_endpoint();
    if (auto res = control_.listen(endpoint); !res) {
        std::println(stderr, "ipc: {}", res.error());
        return false;
    }
    log("Control socket at " + endpoint);

    // Core init (engine, inserters, controller, history db)
    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    task_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    hotkey_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (task_event_fd_ < 0 || hotkey_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    inbox_.set_wake([this] {
        uint64_t val = 1;
        ::write(hotkey_event_fd_, &val, sizeof(val));
    });

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(control_.listen_fd(), EPOLLIN) ||
        !add_fd(task_event_fd_, EPOLLIN) || !add_fd(hotkey_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    start_hotkey();

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::start_hotkey() {
    if (!config_.hotkey.enabled) {
        log("Global hotkey disabled, waiting for press/release over IPC");
        return;
    }

    auto combo = parse_hotkey(config_.hotkey.combo);
    if (!combo) {
        std::println(stderr, "hotkey: '{}' is not a valid combination: {}",
                     config_.hotkey.combo, combo.error());
        return;
    }

    auto res = hotkey_source_.start(*combo, inbox_);
    if (!res) {
        std::println(stderr, "hotkey: cannot register {}: {}",
                     combo->to_string(), hotkey_error_message(res.error()));
        return;
    }
    log("Hotkey " + combo->to_string() + " registered");
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, next_timeout_ms());
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == control_.listen_fd()) {
                int client_fd = control_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == task_event_fd_) {
                uint64_t val;
                ::read(task_event_fd_, &val, sizeof(val));
                continue;
            }

            if (fd == hotkey_event_fd_) {
                uint64_t val;
                ::read(hotkey_event_fd_, &val, sizeof(val));
                core_.drain_inbox();
                continue;
            }

            handle_client(fd);
        }

        run_posted();
        run_due_timers();
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    nlohmann::json cmd;
    ReadStatus st;
    while ((st = control_.read_command(fd, cmd)) == ReadStatus::Command) {
        std::string cmd_str = cmd.value("cmd", "");
        auto response = core_.handle_command(cmd_str, cmd);
        auto status = response.value("status", "");

        if (status == "transcribing") {
            core_.add_waiting_client(fd);
            continue;
        }
        control_.send_line(fd, response);
        if (status == "watching") {
            core_.add_watcher(fd);
        }
    }

    if (st == ReadStatus::Closed) {
        drop_client(fd);
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    core_.remove_client(fd);
    control_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    wake();
}

void LinuxEventLoop::post(Task task) {
    {
        std::lock_guard lock(task_mutex_);
        tasks_.push_back(std::move(task));
    }
    wake();
}

TaskScheduler::TimerId LinuxEventLoop::schedule_after(std::chrono::milliseconds delay, Task task) {
    std::lock_guard lock(task_mutex_);
    TimerId id = next_timer_id_++;
    timers_.emplace(id, Timer{now() + delay, std::move(task)});
    return id;
}

void LinuxEventLoop::cancel(TimerId id) {
    std::lock_guard lock(task_mutex_);
    timers_.erase(id);
}

void LinuxEventLoop::run_posted() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(task_mutex_);
        batch.swap(tasks_);
    }
    for (auto& task : batch) {
        task();
    }
}

void LinuxEventLoop::run_due_timers() {
    const auto t = now();

    std::vector<std::pair<MonotonicTime, TimerId>> due;
    {
        std::lock_guard lock(task_mutex_);
        for (const auto& [id, timer] : timers_) {
            if (timer.deadline <= t) due.emplace_back(timer.deadline, id);
        }
    }
    std::ranges::sort(due);

    for (const auto& [deadline, id] : due) {
        Task task;
        {
            std::lock_guard lock(task_mutex_);
            // An earlier timer in this batch may have cancelled it.
            auto it = timers_.find(id);
            if (it == timers_.end()) continue;
            task = std::move(it->second.task);
            timers_.erase(it);
        }
        task();
    }
}

int LinuxEventLoop::next_timeout_ms() const {
    std::lock_guard lock(task_mutex_);
    if (!tasks_.empty()) return 0;
    if (timers_.empty()) return -1;

    auto earliest = std::ranges::min_element(timers_, {}, [](const auto& entry) {
        return entry.second.deadline;
    })->second.deadline;

    auto wait = std::chrono::ceil<std::chrono::milliseconds>(earliest - now()).count();
    return wait > 0 ? static_cast<int>(wait) : 0;
}

void LinuxEventLoop::wake() {
    if (task_event_fd_ < 0) return;
    uint64_t val = 1;
    ::write(task_event_fd_, &val, sizeof(val));
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[holdtalk] {}", msg);
    }
}

#pragma once

#include "background_worker.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "hotkey_inbox.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/x11_hotkey_source.hpp"
#include "ring_buffer.hpp"
#include "task_scheduler.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>

// epoll loop that is also the application's task scheduler: posted tasks wake it
// through an eventfd and the earliest timer deadline bounds every epoll_wait.
class LinuxEventLoop : public TaskScheduler {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop() override;

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    void post(Task task) override;
    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;
    MonotonicTime now() const override { return MonotonicClock::now(); }

private:
    struct Timer {
        MonotonicTime deadline;
        Task task;
    };

    void start_hotkey();
    void handle_client(int fd);
    void drop_client(int fd);
    void run_posted();
    void run_due_timers();
    int next_timeout_ms() const;
    void wake();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Scheduler state; post() may be called from worker threads.
    mutable std::mutex task_mutex_;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int task_event_fd_ = -1;
    int hotkey_event_fd_ = -1;

    // Outlives the hotkey listener that pushes into it.
    HotkeyInbox inbox_;

    // Platform implementations (constructed before core_)
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    X11HotkeySource hotkey_source_;
    UnixSocketServer control_;

    // Portable business logic
    DaemonCore core_;

    // Destroyed first: joining here lets in-flight jobs finish against a live core.
    BackgroundWorker worker_;

    std::atomic<bool> running_{false};
};

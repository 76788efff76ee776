#pragma once

#include "hotkey_event.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

// The application-level scheduler every controller continuation runs on.
// post() may be called from any thread; timers fire on the scheduler thread.
class TaskScheduler {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    virtual ~TaskScheduler() = default;

    virtual void post(Task task) = 0;
    virtual TimerId schedule_after(std::chrono::milliseconds delay, Task task) = 0;
    virtual void cancel(TimerId id) = 0;
    virtual MonotonicTime now() const = 0;
};

// Runs blocking jobs (HTTP, subprocesses) away from the scheduler thread. Jobs
// report back through TaskScheduler::post only.
class Worker {
public:
    using Job = std::function<void()>;

    virtual ~Worker() = default;
    virtual void submit(Job job) = 0;
};

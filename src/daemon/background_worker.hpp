#pragma once

#include "task_scheduler.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

// One jthread per job. A job that hangs past its session's timeout keeps its
// thread until it returns, but never blocks the next session's job.
class BackgroundWorker : public Worker {
public:
    BackgroundWorker() = default;
    ~BackgroundWorker() override;

    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    void submit(Job job) override;

    size_t running() const;

    // Blocks until every submitted job has returned.
    void join_all();

private:
    struct Slot {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    void reap_locked();

    mutable std::mutex mutex_;
    std::list<Slot> slots_;
};

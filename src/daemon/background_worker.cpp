#include "background_worker.hpp"

BackgroundWorker::~BackgroundWorker() {
    join_all();
}

void BackgroundWorker::join_all() {
    std::list<Slot> slots;
    {
        std::lock_guard lock(mutex_);
        slots.swap(slots_);
    }
    // jthread destructors join.
    slots.clear();
}

void BackgroundWorker::submit(Job job) {
    std::lock_guard lock(mutex_);
    reap_locked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    slots_.push_back(Slot{
        .done = done,
        .thread = std::jthread([job = std::move(job), done] {
            job();
            done->store(true, std::memory_order_release);
        }),
    });
}

size_t BackgroundWorker::running() const {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& s : slots_) {
        if (!s.done->load(std::memory_order_acquire)) ++n;
    }
    return n;
}

void BackgroundWorker::reap_locked() {
    slots_.remove_if([](const Slot& s) { return s.done->load(std::memory_order_acquire); });
}

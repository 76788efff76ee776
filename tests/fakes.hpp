#pragma once

#include "output/inserter.hpp"
#include "platform/audio_capture.hpp"
#include "platform/control_server.hpp"
#include "ring_buffer.hpp"
#include "task_scheduler.hpp"
#include "transcription/engine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

// Virtual clock, starting at the real one so events stamped with
// MonotonicClock::now() line up. Nothing runs until the test advances time or
// drains posts.
class ManualScheduler : public TaskScheduler {
public:
    ManualScheduler() : now_(MonotonicClock::now()) {}

    void post(Task task) override { posted_.push_back(std::move(task)); }

    TimerId schedule_after(std::chrono::milliseconds delay, Task task) override {
        TimerId id = next_id_++;
        timers_.emplace(id, Timer{now_ + delay, std::move(task)});
        return id;
    }

    void cancel(TimerId id) override { timers_.erase(id); }

    MonotonicTime now() const override { return now_; }

    void run_pending() {
        while (!posted_.empty()) {
            auto task = std::move(posted_.front());
            posted_.pop_front();
            task();
        }
    }

    // Moves the clock forward, firing timers at their own deadlines.
    void advance(std::chrono::milliseconds by) {
        const auto target = now_ + by;
        while (true) {
            run_pending();
            auto it = std::ranges::min_element(timers_, {}, [](const auto& entry) {
                return entry.second.deadline;
            });
            if (it == timers_.end() || it->second.deadline > target) break;

            now_ = std::max(now_, it->second.deadline);
            auto task = std::move(it->second.task);
            timers_.erase(it);
            task();
        }
        now_ = target;
        run_pending();
    }

    size_t pending_timers() const { return timers_.size(); }
    size_t pending_posts() const { return posted_.size(); }

private:
    struct Timer {
        MonotonicTime deadline;
        Task task;
    };

    MonotonicTime now_;
    std::deque<Task> posted_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
};

// Jobs wait until the test runs them, on the test thread.
class ManualWorker : public Worker {
public:
    void submit(Job job) override { jobs_.push_back(std::move(job)); }

    bool run_next() {
        if (jobs_.empty()) return false;
        auto job = std::move(jobs_.front());
        jobs_.pop_front();
        job();
        return true;
    }

    // Newest job first, for results that overtake older ones.
    bool run_last() {
        if (jobs_.empty()) return false;
        auto job = std::move(jobs_.back());
        jobs_.pop_back();
        job();
        return true;
    }

    size_t pending() const { return jobs_.size(); }

private:
    std::deque<Job> jobs_;
};

// Stands in for the device: the test writes frames into the real ring.
class FakeCapture : public AudioCapture {
public:
    explicit FakeCapture(RingBuffer& ring) : ring_(ring) {}

    std::expected<void, std::string> start() override {
        ++start_count;
        if (!fail_with.empty()) return std::unexpected(fail_with);
        capturing_ = true;
        return {};
    }

    void stop() override {
        ++stop_count;
        capturing_ = false;
    }

    bool is_capturing() const override { return capturing_; }
    uint32_t native_rate() const override { return rate; }
    uint8_t channel_count() const override { return channels; }
    float level() const override { return level_value; }

    void feed(size_t samples, int16_t value = 1000) {
        std::vector<int16_t> buf(samples, value);
        ring_.write(buf.data(), buf.size(), channels);
    }

    // One second of audio at the current format.
    void feed_seconds(double seconds, int16_t value = 1000) {
        feed(static_cast<size_t>(seconds * rate) * channels, value);
    }

    uint32_t rate = 48000;
    uint8_t channels = 1;
    float level_value = 0.25f;
    std::string fail_with;
    int start_count = 0;
    int stop_count = 0;

private:
    RingBuffer& ring_;
    bool capturing_ = false;
};

class ScriptedEngine : public TranscriptionEngine {
public:
    std::expected<EngineTranscript, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                   const std::string& language) override {
        ++calls;
        last_sample_count = audio.size();
        last_rate = sample_rate;
        last_language = language;
        return reply;
    }

    std::string name() const override { return "scripted"; }

    std::expected<EngineTranscript, std::string> reply = EngineTranscript{"hello world", 0.9};
    int calls = 0;
    size_t last_sample_count = 0;
    uint32_t last_rate = 0;
    std::string last_language;
};

class FakeInserter : public TextInserter {
public:
    std::expected<void, std::string> deliver(const std::string& text) override {
        if (!fail_with.empty()) return std::unexpected(fail_with);
        delivered.push_back(text);
        return {};
    }

    std::string fail_with;
    std::vector<std::string> delivered;
};

// Records what would have gone out on each client socket.
class FakeControlServer : public ControlServer {
public:
    std::expected<void, std::string> listen(const std::string&) override { return {}; }
    void shutdown() override {}
    int listen_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_command(int, nlohmann::json&) override { return ReadStatus::Closed; }

    bool send_line(int client_fd, const nlohmann::json& msg) override {
        if (std::ranges::find(broken, client_fd) != broken.end()) return false;
        sent[client_fd].push_back(msg);
        return true;
    }

    void close_client(int) override {}

    std::map<int, std::vector<nlohmann::json>> sent;
    std::vector<int> broken;
};

#pragma once

#include "config.hpp"
#include "hotkey_inbox.hpp"
#include "output/inserter.hpp"
#include "output/insertion_coordinator.hpp"
#include "platform/audio_capture.hpp"
#include "platform/control_server.hpp"
#include "resampler.hpp"
#include "ring_buffer.hpp"
#include "session_controller.hpp"
#include "storage/history_db.hpp"
#include "task_scheduler.hpp"
#include "transcription/engine.hpp"
#include "transcription/orchestrator.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Portable half of the daemon: builds the session pipeline from the config,
// answers control commands and fans state out to waiting clients and watchers.
// Platform code owns the sockets, threads and devices and calls in from the
// loop thread only.
class DaemonCore {
public:
    using EngineFactory =
        std::function<std::unique_ptr<TranscriptionEngine>(const Config::Backend&)>;
    using InserterFactory = std::function<std::unique_ptr<TextInserter>(const std::string&)>;

    DaemonCore(Config config, bool verbose,
               RingBuffer& ring_buf, AudioCapture& audio,
               ControlServer& control, HotkeyInbox& inbox,
               TaskScheduler& scheduler, Worker& worker,
               EngineFactory engine_factory, InserterFactory inserter_factory);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    void drain_inbox();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Reply deferred until the current session ends.
    void add_waiting_client(int fd);
    void add_watcher(int fd);
    void remove_client(int fd);

    SessionController& controller() { return *controller_; }
    HistoryDb& history() { return history_db_; }

    void shutdown();

private:
    nlohmann::json handle_press(const nlohmann::json& cmd);
    nlohmann::json handle_release(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_clear_history(const nlohmann::json& cmd);
    nlohmann::json handle_watch(const nlohmann::json& cmd);

    void on_state(const SessionSnapshot& snap);
    void on_level(float level);
    void record_history(const SessionSnapshot& snap);
    void broadcast(const nlohmann::json& msg);

    static nlohmann::json outcome_json(const SessionSnapshot& snap);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    RingBuffer& ring_buf_;
    AudioCapture& audio_;
    ControlServer& control_;
    HotkeyInbox& inbox_;
    TaskScheduler& scheduler_;
    Worker& worker_;

    EngineFactory engine_factory_;
    InserterFactory inserter_factory_;

    Resampler resampler_;
    std::unique_ptr<TranscriptionEngine> engine_;
    std::unique_ptr<TranscriptionOrchestrator> transcriber_;
    std::unique_ptr<TextInserter> direct_;
    std::unique_ptr<TextInserter> clipboard_;
    std::unique_ptr<InsertionCoordinator> coordinator_;
    std::unique_ptr<SessionController> controller_;
    HistoryDb history_db_;

    std::vector<int> waiting_clients_;
    std::vector<int> watchers_;

    // Last Completed/Cancelled/Failed seen, and how many have been seen.
    std::optional<SessionSnapshot> last_outcome_;
    uint64_t outcome_seq_ = 0;
};

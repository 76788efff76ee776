#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

SessionOptions session_options(const Config& cfg) {
    using std::chrono::milliseconds;
    return SessionOptions{
        .min_hold = milliseconds(cfg.session.min_hold_ms),
        .stale_after = milliseconds(cfg.session.stale_after_ms),
        .transcribe_timeout = milliseconds(cfg.session.transcribe_timeout_ms),
        .timeout_per_audio_second = milliseconds(cfg.session.timeout_per_audio_second_ms),
        .feedback = milliseconds(cfg.session.feedback_ms),
        .pump_interval = milliseconds(cfg.session.pump_interval_ms),
        .max_recording = std::chrono::seconds(cfg.audio.max_seconds),
        .inactivity_timeout = milliseconds(cfg.audio.inactivity_timeout_ms),
        .talking_level = cfg.audio.talking_level,
        .silence_rms = cfg.audio.silence_rms,
    };
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       RingBuffer& ring_buf, AudioCapture& audio,
                       ControlServer& control, HotkeyInbox& inbox,
                       TaskScheduler& scheduler, Worker& worker,
                       EngineFactory engine_factory, InserterFactory inserter_factory)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(ring_buf), audio_(audio),
      control_(control), inbox_(inbox),
      scheduler_(scheduler), worker_(worker),
      engine_factory_(std::move(engine_factory)),
      inserter_factory_(std::move(inserter_factory)),
      resampler_(config_.audio.target_rate) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    engine_ = engine_factory_(config_.backend);
    if (!engine_) {
        std::println(stderr, "Unknown backend type: {}", config_.backend.type);
        return false;
    }
    transcriber_ = std::make_unique<TranscriptionOrchestrator>(
        *engine_, config_.audio.target_rate, config_.backend.language);

    clipboard_ = inserter_factory_("clipboard");
    if (!clipboard_) {
        std::println(stderr, "No clipboard inserter available");
        return false;
    }
    if (config_.output.default_method != "clipboard") {
        direct_ = inserter_factory_(config_.output.default_method);
        if (!direct_) {
            std::println(stderr, "Unknown output method '{}', using clipboard only",
                         config_.output.default_method);
        }
    }
    coordinator_ = std::make_unique<InsertionCoordinator>(direct_.get(), *clipboard_);

    controller_ = std::make_unique<SessionController>(
        session_options(config_), audio_, ring_buf_, resampler_, *transcriber_,
        *coordinator_, scheduler_, worker_, verbose_);
    controller_->add_state_observer([this](const SessionSnapshot& snap) { on_state(snap); });
    controller_->add_level_observer([this](float level) { on_level(level); });

    if (config_.history.enabled) {
        std::string db_path = config_.history.path;
        if (db_path.empty()) db_path = platform::data_dir() + "/history.db";
        if (auto res = history_db_.open(db_path, config_.history.retention_days); !res) {
            std::println(stderr, "db: {}, history disabled", res.error());
        } else {
            log("History at " + db_path);
        }
    }

    return true;
}

void DaemonCore::drain_inbox() {
    for (const auto& event : inbox_.drain()) {
        controller_->handle(event);
    }
}

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd) {
    if (!controller_) return {{"status", "error"}, {"message", "daemon not initialized"}};

    if (cmd_str == "press") return handle_press(cmd);
    if (cmd_str == "release") return handle_release(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "cancel") return handle_cancel(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "clear-history") return handle_clear_history(cmd);
    if (cmd_str == "watch") return handle_watch(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

json DaemonCore::handle_press(const json& /*cmd*/) {
    const uint64_t before = controller_->generation();

    inbox_.push(make_press());
    drain_inbox();

    const auto& st = controller_->state();
    if (holds<state::Recording>(st) && controller_->generation() != before) {
        return {{"status", "ok"}, {"state", "recording"},
                {"generation", controller_->generation()}};
    }
    if (is_active(st)) {
        return {{"status", "error"},
                {"message", std::format("session already {}", state_name(st))}};
    }
    return {{"status", "error"},
            {"message", "cannot start recording: " + controller_->snapshot().last_error}};
}

json DaemonCore::handle_release(const json& /*cmd*/) {
    const uint64_t seen = outcome_seq_;

    inbox_.push(make_release());
    drain_inbox();

    if (outcome_seq_ != seen && last_outcome_) {
        return outcome_json(*last_outcome_);
    }

    const auto& st = controller_->state();
    if (holds<state::Transcribing>(st) || holds<state::Inserting>(st)) {
        return {{"status", "transcribing"}, {"duration", controller_->snapshot().duration_s}};
    }
    return {{"status", "error"}, {"message", "not recording"}};
}

json DaemonCore::handle_toggle(const json& cmd) {
    if (holds<state::Recording>(controller_->state())) {
        return handle_release(cmd);
    }
    return handle_press(cmd);
}

json DaemonCore::handle_cancel(const json& /*cmd*/) {
    controller_->cancel();
    return {{"status", "ok"}, {"state", state_name(controller_->state())}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    auto snap = controller_->snapshot();
    json resp = {
        {"status", "ok"},
        {"state", state_name(snap.state)},
        {"generation", snap.generation},
        {"level", controller_->audio_level()},
    };
    if (holds<state::Recording>(snap.state)) {
        resp["duration"] = controller_->recording_duration();
    } else if (snap.duration_s > 0.0) {
        resp["last_duration"] = snap.duration_s;
    }
    if (!snap.last_error.empty()) {
        resp["last_error"] = snap.last_error;
    }
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    int limit = 10;
    if (cmd.contains("limit")) {
        const auto& l = cmd["limit"];
        if (!l.is_number_integer() || l.get<int64_t>() <= 0) {
            return {{"status", "error"}, {"message", "limit must be a positive integer"}};
        }
        limit = static_cast<int>(std::min<int64_t>(l.get<int64_t>(), 10000));
    }
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.record.text},
            {"audio_duration", e.record.audio_duration},
            {"processing_time", e.record.processing_time},
            {"confidence", e.record.confidence},
            {"delivery", e.record.delivery},
            {"backend", e.record.backend},
            {"language", e.record.language},
        });
    }
    return resp;
}

json DaemonCore::handle_clear_history(const json& /*cmd*/) {
    if (!history_db_.is_open()) return {{"status", "error"}, {"message", "history is disabled"}};

    auto removed = history_db_.clear();
    if (!removed) return {{"status", "error"}, {"message", removed.error()}};
    log(std::format("History cleared, {} entries removed", *removed));
    return {{"status", "ok"}, {"removed", *removed}};
}

json DaemonCore::handle_watch(const json& /*cmd*/) {
    return {{"status", "watching"},
            {"state", state_name(controller_->state())},
            {"generation", controller_->generation()}};
}

void DaemonCore::on_state(const SessionSnapshot& snap) {
    json event = {
        {"event", "state"},
        {"state", state_name(snap.state)},
        {"generation", snap.generation},
    };
    if (auto* done = std::get_if<state::Completed>(&snap.state)) {
        event["text"] = done->text;
        event["delivery"] = delivery_name(done->delivery);
    } else if (auto* failed = std::get_if<state::Failed>(&snap.state)) {
        event["kind"] = failure_name(failed->kind);
        event["message"] = failed->reason;
    }
    broadcast(event);

    if (!is_terminal(snap.state)) return;

    last_outcome_ = snap;
    ++outcome_seq_;

    if (holds<state::Completed>(snap.state)) {
        record_history(snap);
    }

    if (!waiting_clients_.empty()) {
        auto response = outcome_json(snap);
        for (int fd : waiting_clients_) {
            control_.send_line(fd, response);
        }
        waiting_clients_.clear();
    }
}

void DaemonCore::on_level(float level) {
    if (watchers_.empty()) return;
    broadcast({{"event", "level"}, {"level", level}});
}

void DaemonCore::record_history(const SessionSnapshot& snap) {
    if (!history_db_.is_open()) return;

    const auto& done = std::get<state::Completed>(snap.state);
    auto id = history_db_.insert(HistoryRecord{
        .text = done.text,
        .audio_duration = snap.duration_s,
        .processing_time = snap.processing_s,
        .confidence = snap.confidence,
        .delivery = std::string(delivery_name(done.delivery)),
        .backend = transcriber_->engine_name(),
        .language = transcriber_->language(),
    });
    if (!id) {
        std::println(stderr, "db: {}", id.error());
    }
}

void DaemonCore::broadcast(const json& msg) {
    // A watcher whose socket is full or gone is dropped; the loop closes it on hangup.
    std::erase_if(watchers_, [this, &msg](int fd) { return !control_.send_line(fd, msg); });
}

json DaemonCore::outcome_json(const SessionSnapshot& snap) {
    if (auto* done = std::get_if<state::Completed>(&snap.state)) {
        return {
            {"status", "ok"},
            {"state", "completed"},
            {"text", done->text},
            {"delivery", delivery_name(done->delivery)},
            {"duration", snap.duration_s},
            {"processing_time", snap.processing_s},
            {"confidence", snap.confidence},
        };
    }
    if (auto* failed = std::get_if<state::Failed>(&snap.state)) {
        return {
            {"status", "error"},
            {"state", "failed"},
            {"kind", failure_name(failed->kind)},
            {"message", failed->reason},
        };
    }
    return {{"status", "cancelled"}, {"state", state_name(snap.state)}};
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::add_watcher(int fd) {
    watchers_.push_back(fd);
}

void DaemonCore::remove_client(int fd) {
    std::erase(waiting_clients_, fd);
    std::erase(watchers_, fd);
}

void DaemonCore::shutdown() {
    if (controller_ && !holds<state::Idle>(controller_->state())) {
        log("Shutting down, cancelling session in " +
            std::string(state_name(controller_->state())));
        controller_->cancel();
    }
    watchers_.clear();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[holdtalk] {}", msg);
    }
}

#include "platform/linux/unix_socket_channel.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdio>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <string_view>
#include <system_error>

using json = nlohmann::json;

namespace {

// Longest a release can wait: the daemon's transcription timeout plus insertion.
constexpr int kOutcomeTimeoutMs = 180000;
constexpr int kReplyTimeoutMs = 30000;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  press                 Start recording (hotkey down)");
    std::println(stderr, "  release               Stop recording, wait for the transcript");
    std::println(stderr, "  toggle                Press when idle, release when recording");
    std::println(stderr, "  cancel                Abandon the current session");
    std::println(stderr, "  status                Show daemon status");
    std::println(stderr, "  history [--limit N]   Show recent transcripts");
    std::println(stderr, "  clear-history         Delete every stored transcript");
    std::println(stderr, "  watch                 Stream state changes and input level");
}

int print_outcome(const json& response) {
    auto status = response.value("status", "");
    if (status == "ok") {
        if (response.contains("text")) {
            std::println("{}", response["text"].get<std::string>());
            if (response.value("delivery", "") == "clipboard") {
                std::println(stderr, "(copied to clipboard, paste manually)");
            }
        } else {
            std::println("{}", response.value("state", "OK"));
        }
        return 0;
    }
    if (status == "cancelled") {
        std::println(stderr, "Cancelled");
        return 1;
    }
    if (status == "error") {
        if (response.contains("kind")) {
            std::println(stderr, "Error ({}): {}", response["kind"].get<std::string>(),
                         response.value("message", "unknown error"));
        } else {
            std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        }
        return 1;
    }
    std::println("{}", response.dump(2));
    return 0;
}

void print_status(const json& response) {
    std::println("State: {} (session {})", response.value("state", "unknown"),
                 response.value("generation", uint64_t{0}));
    if (response.contains("duration")) {
        std::println("Recording: {:.1f}s, level {:.2f}", response["duration"].get<double>(),
                     response.value("level", 0.0));
    } else if (response.contains("last_duration")) {
        std::println("Last recording: {:.1f}s", response["last_duration"].get<double>());
    }
    if (response.contains("last_error")) {
        std::println("Last error: {}", response["last_error"].get<std::string>());
    }
}

void print_history(const json& response) {
    if (!response.contains("entries")) return;
    for (auto& entry : response["entries"]) {
        std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
        std::println("  {:.1f}s audio, {:.1f}s processing, confidence {:.2f}, {}",
                     entry.value("audio_duration", 0.0), entry.value("processing_time", 0.0),
                     entry.value("confidence", 0.0), entry.value("delivery", ""));
    }
}

int watch(ControlChannel& channel) {
    bool meter = false;
    while (true) {
        auto next = channel.receive(-1);
        if (!next) {
            if (meter) std::println("");
            std::println(stderr, "Watch ended: {}", next.error());
            return 1;
        }
        const json& msg = *next;
        auto event = msg.value("event", "");
        if (event == "level") {
            int bars = static_cast<int>(msg.value("level", 0.0) * 40.0);
            if (bars > 40) bars = 40;
            std::print("\r[{:<40}]", std::string(static_cast<size_t>(bars), '#'));
            std::fflush(stdout);
            meter = true;
            continue;
        }
        if (meter) {
            std::println("");
            meter = false;
        }
        if (event == "state") {
            std::print("{} (session {})", msg.value("state", ""), msg.value("generation", uint64_t{0}));
            if (msg.contains("text")) {
                std::print(": {} [{}]", msg["text"].get<std::string>(), msg.value("delivery", ""));
            } else if (msg.contains("message")) {
                std::print(": {} failure: {}", msg.value("kind", ""), msg["message"].get<std::string>());
            }
            std::println("");
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            std::string_view value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), limit);
            if (ec != std::errc() || limit <= 0) {
                std::println(stderr, "--limit needs a positive number");
                return 1;
            }
        }
    }

    json cmd;
    if (command == "press" || command == "release" || command == "toggle" ||
        command == "cancel" || command == "status" || command == "watch" ||
        command == "clear-history") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketChannel channel;
    auto sock_path = platform::ipc_endpoint();

    if (auto opened = channel.open(sock_path); !opened) {
        std::println(stderr, "Cannot reach daemon: {}", opened.error());
        std::println(stderr, "Is holdtalkd running?");
        return 1;
    }

    // release/toggle may be answered only when the session finishes.
    int timeout = (command == "release" || command == "toggle") ? kOutcomeTimeoutMs
                                                                : kReplyTimeoutMs;

    auto reply = channel.request(cmd, timeout);
    if (!reply) {
        std::println(stderr, "{}: {}", command, reply.error());
        return 1;
    }
    const json& response = *reply;

    if (command == "watch") {
        std::println("{} (session {})", response.value("state", "unknown"),
                     response.value("generation", uint64_t{0}));
        return watch(channel);
    }
    if (command == "status") {
        print_status(response);
        return 0;
    }
    if (command == "history") {
        print_history(response);
        return 0;
    }
    if (command == "clear-history" && response.value("status", "") == "ok") {
        std::println("Removed {} entries", response.value("removed", 0));
        return 0;
    }
    return print_outcome(response);
}

#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_channel.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/ht_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server socket is non-blocking, so poll briefly for data to arrive.
ReadStatus read_with_retry(UnixSocketServer& server, int fd, json& cmd) {
    ReadStatus st = ReadStatus::Incomplete;
    for (int i = 0; i < 100 && st == ReadStatus::Incomplete; ++i) {
        st = server.read_command(fd, cmd);
        if (st == ReadStatus::Incomplete) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return st;
}

// Raw connection for sending bytes the real client never would.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.shutdown();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("StaleSocketIsReplaced") {
        {
            UnixSocketServer first;
            REQUIRE(first.listen(sock_path));
        }
        // Simulate a crashed daemon's leftover file.
        std::FILE* f = std::fopen(sock_path.c_str(), "w");
        REQUIRE(f != nullptr);
        std::fclose(f);

        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));
        UnixSocketChannel channel;
        REQUIRE(channel.open(sock_path));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));

        UnixSocketChannel channel;
        REQUIRE(channel.open(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(channel.send({{"cmd", "status"}}));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadStatus::Command);
        REQUIRE(received["cmd"] == "status");

        REQUIRE(server.send_line(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        auto reply = channel.receive(1000);
        REQUIRE(reply);
        REQUIRE((*reply)["state"] == "idle");
    }

    SECTION("BackToBackCommandsInOneRead") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));

        int fd = raw_connect(sock_path);
        REQUIRE(fd >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string two = "{\"cmd\":\"press\"}\n{\"cmd\":\"release\"}\n";
        REQUIRE(::send(fd, two.data(), two.size(), 0) == static_cast<ssize_t>(two.size()));

        json first, second;
        REQUIRE(read_with_retry(server, client_fd, first) == ReadStatus::Command);
        REQUIRE(server.read_command(client_fd, second) == ReadStatus::Command);
        REQUIRE(first["cmd"] == "press");
        REQUIRE(second["cmd"] == "release");
        ::close(fd);
    }

    SECTION("PartialLineWaits") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));

        int fd = raw_connect(sock_path);
        REQUIRE(fd >= 0);
        int client_fd = server.accept_client();

        std::string head = "{\"cmd\":";
        ::send(fd, head.data(), head.size(), 0);
        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Incomplete);

        std::string tail = "\"cancel\"}\n";
        ::send(fd, tail.data(), tail.size(), 0);
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["cmd"] == "cancel");
        ::close(fd);
    }

    SECTION("GarbageClosesClient") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));

        int fd = raw_connect(sock_path);
        int client_fd = server.accept_client();

        std::string junk = "not json at all\n";
        ::send(fd, junk.data(), junk.size(), 0);
        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Closed);
        ::close(fd);
    }

    SECTION("CommandNameMustBeAString") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));

        for (std::string line : {"{\"cmd\":5}\n", "{}\n", "{\"cmd\":null}\n"}) {
            int fd = raw_connect(sock_path);
            REQUIRE(fd >= 0);
            int client_fd = server.accept_client();
            REQUIRE(client_fd >= 0);

            ::send(fd, line.data(), line.size(), 0);
            json cmd;
            REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Closed);
            server.close_client(client_fd);
            ::close(fd);
        }

        // Argument types are the handler's to check.
        int fd = raw_connect(sock_path);
        int client_fd = server.accept_client();
        std::string line = "{\"cmd\":\"history\",\"limit\":\"5\"}\n";
        ::send(fd, line.data(), line.size(), 0);
        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["cmd"] == "history");
        REQUIRE(cmd["limit"].is_string());
        ::close(fd);
    }

    SECTION("StreamedLinesReachClient") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));

        UnixSocketChannel channel;
        REQUIRE(channel.open(sock_path));
        int client_fd = server.accept_client();

        for (int i = 0; i < 5; ++i) {
            REQUIRE(server.send_line(client_fd, {{"event", "level"}, {"seq", i}}));
        }
        for (int i = 0; i < 5; ++i) {
            auto msg = channel.receive(1000);
            REQUIRE(msg);
            REQUIRE((*msg)["seq"] == i);
        }
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));

        UnixSocketChannel channel;
        REQUIRE(channel.open(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        channel.close();

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Closed);
        server.close_client(client_fd);
    }

    SECTION("ListenRejectsOverlongPath") {
        UnixSocketServer server;
        auto res = server.listen("/tmp/" + std::string(200, 'x'));
        REQUIRE_FALSE(res);
        REQUIRE(res.error().starts_with("socket path too long"));
    }

    SECTION("SameUserPeerIsAccepted") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));
        REQUIRE(std::filesystem::status(sock_path).permissions() ==
                (std::filesystem::perms::owner_read | std::filesystem::perms::owner_write));

        UnixSocketChannel channel;
        REQUIRE(channel.open(sock_path));
        REQUIRE(server.accept_client() >= 0);
        REQUIRE(server.client_count() == 1);
    }

    SECTION("ReceiveTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));
        UnixSocketChannel channel;
        REQUIRE(channel.open(sock_path));

        auto reply = channel.receive(20);
        REQUIRE_FALSE(reply);
        REQUIRE(reply.error() == "no reply within 20ms");
    }

    SECTION("RequestAnsweredByServerThread") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));
        UnixSocketChannel channel;
        REQUIRE(channel.open(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::jthread responder([&] {
            json cmd;
            if (read_with_retry(server, client_fd, cmd) == ReadStatus::Command) {
                server.send_line(client_fd, {{"status", "ok"}, {"echo", cmd["cmd"]}});
            }
        });

        auto reply = channel.request({{"cmd", "cancel"}}, 2000);
        REQUIRE(reply);
        REQUIRE((*reply)["echo"] == "cancel");
    }

    SECTION("DaemonHangupEndsReceive") {
        UnixSocketServer server;
        REQUIRE(server.listen(sock_path));
        UnixSocketChannel channel;
        REQUIRE(channel.open(sock_path));
        int client_fd = server.accept_client();
        server.close_client(client_fd);

        auto reply = channel.receive(1000);
        REQUIRE_FALSE(reply);
        REQUIRE(reply.error() == "daemon closed the connection");
    }

    SECTION("ConnectWithoutServerFails") {
        std::filesystem::remove(sock_path);
        UnixSocketChannel channel;
        REQUIRE_FALSE(channel.open(sock_path));
    }
}

#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;
using ReadStatus = IpcServer::ReadStatus;

namespace {

std::string tmp_socket_path() {
    return "/tmp/inkwell_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Polls the non-blocking server socket until a read yields something other
// than Incomplete, or 50 ms pass.
ReadStatus read_until_ready(UnixSocketServer& server, int fd, std::vector<json>& cmds) {
    ReadStatus st = ReadStatus::Incomplete;
    for (int i = 0; i < 50 && st == ReadStatus::Incomplete; ++i) {
        st = server.read_commands(fd, cmds);
        if (st == ReadStatus::Incomplete) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return st;
}

int accept_soon(UnixSocketServer& server) {
    for (int i = 0; i < 50; ++i) {
        int fd = server.accept_client();
        if (fd >= 0) return fd;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return -1;
}

// Bare socket for sending hand-crafted bytes.
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

void raw_send(int fd, const std::string& bytes) {
    REQUIRE(::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL) ==
            static_cast<ssize_t>(bytes.size()));
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("PathTooLong") {
        UnixSocketServer server;
        REQUIRE_FALSE(server.start("/tmp/" + std::string(200, 'x') + ".sock"));

        UnixSocketClient client;
        REQUIRE_FALSE(client.connect("/tmp/" + std::string(200, 'x') + ".sock"));
    }

    SECTION("NoDaemonListening") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path + ".absent"));
        REQUIRE_FALSE(client.send({{"command", "status"}}));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_soon(server);
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"command", "status"}}));

        std::vector<json> cmds;
        REQUIRE(read_until_ready(server, client_fd, cmds) == ReadStatus::Ok);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["command"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000) == RecvStatus::Ok);
        REQUIRE(resp["state"] == "idle");

        server.close_client(client_fd);
    }

    SECTION("SequentialMessages") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_soon(server);
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"command", "status"}, {"seq", i}}));

            std::vector<json> cmds;
            REQUIRE(read_until_ready(server, client_fd, cmds) == ReadStatus::Ok);
            REQUIRE(cmds.size() == 1);
            REQUIRE(cmds[0]["seq"] == i);

            REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", i}}));

            json resp;
            REQUIRE(client.recv(resp, 1000) == RecvStatus::Ok);
            REQUIRE(resp["seq"] == i);
        }
    }

    SECTION("SeveralLinesInOneWrite") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = accept_soon(server);
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"command\":\"status\"}\n\n{\"command\":\"history\"}\n");

        std::vector<json> cmds;
        REQUIRE(read_until_ready(server, client_fd, cmds) == ReadStatus::Ok);
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[1]["command"] == "history");
        ::close(raw);
    }

    SECTION("PartialLineIsBuffered") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = accept_soon(server);
        REQUIRE(client_fd >= 0);

        raw_send(raw, "{\"command\":");
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        std::vector<json> cmds;
        REQUIRE(server.read_commands(client_fd, cmds) == ReadStatus::Incomplete);
        REQUIRE(cmds.empty());

        raw_send(raw, "\"stop\"}\n");
        REQUIRE(read_until_ready(server, client_fd, cmds) == ReadStatus::Ok);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["command"] == "stop");
        ::close(raw);
    }

    SECTION("MalformedLineIsDiscarded") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = accept_soon(server);
        REQUIRE(client_fd >= 0);

        raw_send(raw, "not json\n");
        std::vector<json> cmds;
        REQUIRE(read_until_ready(server, client_fd, cmds) == ReadStatus::Ok);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0].is_discarded());
        ::close(raw);
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_soon(server);
        REQUIRE(client_fd >= 0);

        client.close();

        std::vector<json> cmds;
        REQUIRE(read_until_ready(server, client_fd, cmds) == ReadStatus::Closed);
        server.close_client(client_fd);

        // Unknown fds read as closed.
        REQUIRE(server.read_commands(client_fd, cmds) == ReadStatus::Closed);
    }

    SECTION("RecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        REQUIRE(accept_soon(server) >= 0);

        json resp;
        REQUIRE(client.recv(resp, 20) == RecvStatus::Timeout);
    }

    SECTION("RecvReportsClosedConnection") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_soon(server);
        REQUIRE(client_fd >= 0);
        server.close_client(client_fd);

        json resp;
        REQUIRE(client.recv(resp, 1000) == RecvStatus::Closed);
    }

    SECTION("RecvReportsMalformedReply") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = accept_soon(server);
        REQUIRE(client_fd >= 0);

        std::string garbage = "not json\n{\"status\":\"ok\"}\n";
        REQUIRE(::send(client_fd, garbage.data(), garbage.size(), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(garbage.size()));

        json resp;
        REQUIRE(client.recv(resp, 1000) == RecvStatus::Malformed);
        // The next buffered line is still delivered.
        REQUIRE(client.recv(resp, 1000) == RecvStatus::Ok);
        REQUIRE(resp["status"] == "ok");
    }
}

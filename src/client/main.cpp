#include "commands.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <print>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        client::usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args[0] == "--help" || args[0] == "-h") {
        client::usage(argv[0]);
        return 0;
    }

    auto req = client::build_request(args);
    if (!req) {
        std::println(stderr, "{}", req.error());
        client::usage(argv[0]);
        return 1;
    }

    UnixSocketClient conn;
    auto sock_path = platform::ipc_endpoint();

    if (!conn.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is inkwell running?");
        return 1;
    }

    if (!conn.send(req->cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    nlohmann::json response;
    switch (conn.recv(response, req->timeout_ms)) {
    case RecvStatus::Ok:
        break;
    case RecvStatus::Timeout:
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    case RecvStatus::Closed:
        std::println(stderr, "Daemon closed the connection");
        return 1;
    case RecvStatus::Malformed:
        std::println(stderr, "Malformed response from daemon");
        return 1;
    }

    if (req->raw_output) {
        std::println("{}", response.dump(2));
        return response.value("status", "") == "error" ? 1 : 0;
    }
    return client::print_response(args[0], response);
}

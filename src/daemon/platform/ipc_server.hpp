#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Newline-delimited JSON over a local stream socket.
class IpcServer {
public:
    enum class ReadStatus {
        Ok,         // at least one command parsed
        Incomplete, // data buffered, no full line yet
        Closed,     // peer gone or socket error
    };

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;

    // Appends one JSON value per complete line. A line that isn't valid JSON
    // yields a discarded value (is_discarded() is true).
    virtual ReadStatus read_commands(int client_fd, std::vector<nlohmann::json>& cmds) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};

#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class RecvStatus { Ok, Timeout, Closed, Malformed };

// One request/response connection to the daemon. Replies are single
// newline-terminated JSON objects.
class IpcClient {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 30000;

    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    virtual RecvStatus recv(nlohmann::json& response, int timeout_ms = DEFAULT_TIMEOUT_MS) = 0;
    virtual void close() = 0;
};

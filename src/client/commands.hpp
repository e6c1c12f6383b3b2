#pragma once

#include "platform/ipc_client.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace client {

struct Request {
    nlohmann::json cmd;
    int timeout_ms = IpcClient::DEFAULT_TIMEOUT_MS;
    bool raw_output = false; // --json: print the reply verbatim
};

// args excludes the program name: {"transcribe", "a.wav", "--model", "small"}.
std::expected<Request, std::string> build_request(const std::vector<std::string>& args);

// Prints the reply for a human. Returns the process exit code.
int print_response(const std::string& command, const nlohmann::json& response);

void usage(const char* prog);

} // namespace client

#include "commands.hpp"

#include <charconv>
#include <print>

using json = nlohmann::json;

namespace client {

namespace {

// Jobs that finish in the background can take a while on CPU-only machines.
constexpr int JOB_TIMEOUT_MS = 10 * 60 * 1000;

std::expected<int, std::string> parse_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || value <= 0) {
        return std::unexpected("expected a positive number, got \"" + s + "\"");
    }
    return value;
}

} // namespace

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start                     Start recording");
    std::println(stderr, "  stop                      Stop recording and transcribe");
    std::println(stderr, "  toggle                    Start or stop recording");
    std::println(stderr, "  cancel                    Cancel recording or transcription");
    std::println(stderr, "  status                    Show daemon status");
    std::println(stderr, "  history [--limit N]       Show transcription history");
    std::println(stderr, "  transcribe FILE           Transcribe a WAV file");
    std::println(stderr, "  load [MODEL]              Load a local model");
    std::println(stderr, "  unload [MODEL]            Unload a local model");
    std::println(stderr, "  models                    List installed and loaded models");
    std::println(stderr, "Options for stop, toggle and transcribe:");
    std::println(stderr, "  --provider NAME           local, lan, groq, mistral or custom");
    std::println(stderr, "  --model NAME              Model name");
    std::println(stderr, "  --language CODE           Language hint (\"auto\" to detect)");
    std::println(stderr, "  --prompt TEXT             Prompt override");
    std::println(stderr, "  --json                    Print the raw reply");
}

std::expected<Request, std::string> build_request(const std::vector<std::string>& args) {
    if (args.empty()) return std::unexpected("missing command");

    const std::string& command = args[0];
    Request req;
    req.cmd = {{"cmd", command}};

    std::vector<std::string> positional;
    for (size_t i = 1; i < args.size(); i++) {
        const std::string& arg = args[i];
        auto value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= args.size()) return std::unexpected(arg + " needs a value");
            return args[++i];
        };

        if (arg == "--json") {
            req.raw_output = true;
        } else if (arg == "--limit") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            auto n = parse_int(*v);
            if (!n) return std::unexpected(n.error());
            req.cmd["limit"] = *n;
        } else if (arg == "--provider" || arg == "--model" || arg == "--language" ||
                   arg == "--prompt") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            req.cmd[arg.substr(2)] = *v;
        } else if (arg.starts_with("--")) {
            return std::unexpected("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (command == "start" || command == "cancel" || command == "status" ||
        command == "models" || command == "history") {
        if (!positional.empty()) return std::unexpected(command + " takes no arguments");
        if (command == "history" && !req.cmd.contains("limit")) req.cmd["limit"] = 10;
        return req;
    }

    if (command == "stop" || command == "toggle") {
        if (!positional.empty()) return std::unexpected(command + " takes no arguments");
        req.timeout_ms = JOB_TIMEOUT_MS;
        return req;
    }

    if (command == "transcribe") {
        if (positional.size() != 1) return std::unexpected("transcribe needs exactly one FILE");
        req.cmd["file"] = positional[0];
        req.timeout_ms = JOB_TIMEOUT_MS;
        return req;
    }

    if (command == "load" || command == "unload") {
        if (positional.size() > 1) return std::unexpected(command + " takes at most one MODEL");
        if (!positional.empty()) req.cmd["model"] = positional[0];
        if (command == "load") req.timeout_ms = JOB_TIMEOUT_MS;
        return req;
    }

    return std::unexpected("unknown command: " + command);
}

int print_response(const std::string& command, const json& response) {
    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        if (response.value("retryable", false)) {
            std::println(stderr, "(temporary, try again)");
        }
        return 1;
    }
    if (status != "ok") {
        std::println("{}", response.dump(2));
        return 0;
    }

    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        std::println("Provider: {} ({})", response.value("provider", "?"),
                     response.value("model", "?"));
        if (response.contains("loaded")) {
            for (const auto& m : response["loaded"]) {
                std::println("Loaded: {} (in use: {})", m.value("model", ""), m.value("in_use", 0));
            }
        }
        if (response.contains("loading")) {
            for (const auto& m : response["loading"]) {
                std::println("Loading: {}", m.get<std::string>());
            }
        }
    } else if (command == "history") {
        for (const auto& entry : response.value("entries", json::array())) {
            std::println("[{}] {}", entry.value("timestamp", ""),
                         entry.value("enhanced_text", entry.value("text", "")));
            std::println("  {:.1f}s audio, {:.2f}s with {}", entry.value("audio_duration", 0.0),
                         entry.value("transcription_duration", 0.0), entry.value("model", ""));
        }
    } else if (command == "models") {
        std::println("Models directory: {}", response.value("models_dir", ""));
        for (const auto& m : response.value("installed", json::array())) {
            std::println("Installed: {}", m.get<std::string>());
        }
        for (const auto& m : response.value("loaded", json::array())) {
            std::println("Loaded: {}", m.get<std::string>());
        }
        std::string providers;
        for (const auto& p : response.value("providers", json::array())) {
            if (!providers.empty()) providers += ", ";
            providers += p.get<std::string>();
        }
        std::println("Providers: {}", providers);
    } else if (response.contains("text")) {
        std::println("{}", response.value("enhanced_text", response["text"].get<std::string>()));
    } else if (response.contains("state")) {
        std::println("{}", response["state"].get<std::string>());
    } else {
        std::println("OK");
    }
    return 0;
}

} // namespace client

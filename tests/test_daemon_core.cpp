#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using json = nlohmann::json;
using test_support::FakeEngine;
using test_support::TmpDir;

namespace {

struct FakeIpc : IpcServer {
    std::vector<std::pair<int, json>> sent;

    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_commands(int, std::vector<json>&) override { return ReadStatus::Incomplete; }
    bool send_response(int fd, const json& response) override {
        sent.emplace_back(fd, response);
        return true;
    }
    void close_client(int) override {}
};

struct WavRecorder : AudioRecorder {
    bool recording = false;
    std::filesystem::path output;

    std::expected<void, Error> start(const std::filesystem::path& out) override {
        output = out;
        recording = true;
        return {};
    }
    std::expected<void, Error> stop() override {
        recording = false;
        test_support::write_wav(output, 1.0);
        return {};
    }
    bool is_recording() const override { return recording; }
};

// Everything DaemonCore needs, wired to fakes, with scratch directories.
struct Harness {
    TmpDir dir{"daemon"};
    FakeEngine engine;
    WavRecorder recorder;
    FakeIpc ipc;
    std::atomic<int> notified{0};
    std::unique_ptr<DaemonCore> core;

    explicit Harness(Config cfg = {}) {
        cfg.models_dir = (dir / "models").string();
        cfg.recordings_dir = (dir / "recordings").string();
        core = std::make_unique<DaemonCore>(std::move(cfg), engine, recorder, ipc,
                                            [this] { ++notified; });
        REQUIRE(core->init((dir / "history.db").string()));
    }

    ~Harness() { core->shutdown(); }

    json call(const json& cmd, int fd = 7) {
        auto resp = core->handle_command(fd, cmd);
        REQUIRE(resp.has_value());
        return *resp;
    }

    // Waits for the next background job to signal, then collects it.
    void complete_job(int seen) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (notified.load() <= seen) {
            REQUIRE(std::chrono::steady_clock::now() < deadline);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        core->on_job_complete();
    }

    json deferred(const json& cmd, int fd = 7) {
        int seen = notified.load();
        size_t before = ipc.sent.size();
        REQUIRE_FALSE(core->handle_command(fd, cmd).has_value());
        complete_job(seen);
        REQUIRE(ipc.sent.size() == before + 1);
        REQUIRE(ipc.sent.back().first == fd);
        return ipc.sent.back().second;
    }
};

} // namespace

TEST_CASE("DaemonCore commands", "[daemon]") {
    Harness h;

    SECTION("StatusWhenIdle") {
        auto resp = h.call({{"cmd", "status"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["state"] == "idle");
        REQUIRE(resp["provider"] == "local");
        REQUIRE(resp["model"] == "base.en");
        REQUIRE(resp["loaded"].empty());
    }

    SECTION("MalformedAndUnknown") {
        auto bad = h.call(json::parse("nope", nullptr, false));
        REQUIRE(bad["status"] == "error");
        REQUIRE(bad["code"] == "invalid command");
        REQUIRE(bad["retryable"] == false);

        auto unknown = h.call({{"cmd", "dance"}});
        REQUIRE(unknown["status"] == "error");
        REQUIRE(unknown["code"] == "invalid command");
        REQUIRE(unknown["message"] == "unknown command: dance");
        REQUIRE(unknown["retryable"] == false);

        auto array = h.call(json::array({"status"}));
        REQUIRE(array["code"] == "invalid command");
    }

    SECTION("MistypedFieldsAreRejected") {
        const std::vector<json> payloads = {
            json{{"cmd", 5}},
            json{{"cmd", "history"}, {"limit", "x"}},
            json{{"cmd", "history"}, {"limit", -1}},
            json{{"cmd", "history"}, {"limit", 2.5}},
            json{{"cmd", "load"}, {"model", 3}},
            json{{"cmd", "unload"}, {"model", json::array()}},
            json{{"cmd", "transcribe"}, {"file", "/tmp/a.wav"}, {"language", true}},
            json{{"cmd", "stop"}, {"provider", nullptr}},
        };
        for (const auto& payload : payloads) {
            INFO(payload.dump());
            auto resp = h.call(payload);
            REQUIRE(resp["status"] == "error");
            REQUIRE(resp["code"] == "invalid command");
            REQUIRE(resp["retryable"] == false);
        }
        REQUIRE(h.engine.loads.load() == 0);

        // Still serving after the bad input.
        REQUIRE(h.call({{"cmd", "status"}})["status"] == "ok");
        REQUIRE(h.call({{"cmd", "history"}, {"limit", 3}})["status"] == "ok");
    }

    SECTION("TranscribeFile") {
        auto clip = test_support::write_wav(h.dir / "clip.wav", 2.0);
        auto resp = h.deferred({{"cmd", "transcribe"}, {"file", clip.string()}});

        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["text"] == "hello world");
        REQUIRE(resp["duration"] == 2.0);
        REQUIRE(resp["model"] == "base.en");
        REQUIRE(resp["path"] == clip.string());
        REQUIRE_FALSE(h.core->has_pending_jobs());

        auto history = h.call({{"cmd", "history"}, {"limit", 5}});
        REQUIRE(history["entries"].size() == 1);
        REQUIRE(history["entries"][0]["text"] == "hello world");
        REQUIRE(history["entries"][0]["model"] == "base.en");
    }

    SECTION("TranscribeWithOverrides") {
        auto clip = test_support::write_wav(h.dir / "clip.wav", 1.0);
        auto resp = h.deferred({{"cmd", "transcribe"}, {"file", clip.string()},
                                {"model", "small"}, {"language", "fr"}, {"prompt", "Bonjour."}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["model"] == "small");
        REQUIRE(h.engine.last_language == "fr");
        REQUIRE(h.engine.last_prompt == "Bonjour.");
    }

    SECTION("TranscribeErrors") {
        auto no_file = h.call({{"cmd", "transcribe"}});
        REQUIRE(no_file["status"] == "error");
        REQUIRE(no_file["code"] == "audio file not found");
        REQUIRE(no_file["retryable"] == false);

        auto bad_provider = h.call({{"cmd", "transcribe"}, {"file", "/tmp/x.wav"}, {"provider", "acme"}});
        REQUIRE(bad_provider["status"] == "error");
        REQUIRE(bad_provider["code"] == "service unavailable");

        auto missing = h.deferred({{"cmd", "transcribe"}, {"file", (h.dir / "gone.wav").string()}});
        REQUIRE(missing["status"] == "error");
        REQUIRE(missing["code"] == "audio file not found");
        REQUIRE(h.call({{"cmd", "history"}})["entries"].empty());
    }

    SECTION("MissingCloudKey") {
        auto clip = test_support::write_wav(h.dir / "clip.wav", 1.0);
        auto resp = h.deferred({{"cmd", "transcribe"}, {"file", clip.string()},
                                {"provider", "groq"}, {"model", "whisper-large-v3"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "missing api key");
    }

    SECTION("RecordStopTranscribe") {
        auto started = h.call({{"cmd", "start"}});
        REQUIRE(started["status"] == "ok");
        REQUIRE(started["state"] == "recording");
        REQUIRE(h.call({{"cmd", "status"}})["state"] == "recording");

        auto again = h.call({{"cmd", "start"}});
        REQUIRE(again["code"] == "invalid state");
        REQUIRE(again["retryable"] == true);

        auto resp = h.deferred({{"cmd", "stop"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["text"] == "hello world");
        REQUIRE(resp["duration"] == 1.0);
        REQUIRE(resp["path"] == started["path"]);
        REQUIRE(h.core->session_state() == SessionState::Idle);
    }

    SECTION("Toggle") {
        auto started = h.call({{"cmd", "toggle"}});
        REQUIRE(started["state"] == "recording");

        auto resp = h.deferred({{"cmd", "toggle"}});
        REQUIRE(resp["text"] == "hello world");
    }

    SECTION("StopWhenIdle") {
        auto resp = h.call({{"cmd", "stop"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "invalid state");
    }

    SECTION("CancelRecording") {
        auto started = h.call({{"cmd", "start"}});
        auto resp = h.call({{"cmd", "cancel"}});
        REQUIRE(resp["cancelled"] == "recording");
        REQUIRE(h.core->session_state() == SessionState::Idle);
        REQUIRE_FALSE(std::filesystem::exists(started["path"].get<std::string>()));
    }

    SECTION("CancelWithNothingRunning") {
        auto resp = h.call({{"cmd", "cancel"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "invalid state");
    }

    SECTION("LoadAndUnload") {
        auto loaded = h.deferred({{"cmd", "load"}});
        REQUIRE(loaded["status"] == "ok");
        REQUIRE(loaded["model"] == "base.en");

        auto again = h.call({{"cmd", "load"}});
        REQUIRE(again["loaded"] == true);
        REQUIRE(h.engine.loads.load() == 1);

        auto status = h.call({{"cmd", "status"}});
        REQUIRE(status["loaded"].size() == 1);
        REQUIRE(status["loaded"][0]["model"] == "base.en");

        auto unloaded = h.call({{"cmd", "unload"}});
        REQUIRE(unloaded["unloaded"] == true);
        REQUIRE(h.call({{"cmd", "unload"}})["unloaded"] == false);
    }

    SECTION("LoadFailure") {
        auto resp = h.deferred({{"cmd", "load"}, {"model", "missing"}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "model load failed");
    }

    SECTION("Models") {
        std::filesystem::create_directories(h.dir / "models");
        test_support::write_bytes(h.dir / "models" / "ggml-tiny.bin", {0});
        auto resp = h.call({{"cmd", "models"}});
        REQUIRE(resp["installed"] == json::array({"tiny"}));
        REQUIRE(resp["providers"] == json::array({"local", "lan", "groq", "mistral", "custom"}));
    }
}

TEST_CASE("DaemonCore background jobs", "[daemon]") {
    Harness h;
    auto clip = test_support::write_wav(h.dir / "clip.wav", 1.0);
    std::promise<void> release;
    h.engine.gate = release.get_future().share();

    int seen = h.notified.load();
    REQUIRE_FALSE(h.core->handle_command(3, {{"cmd", "transcribe"}, {"file", clip.string()}}).has_value());
    REQUIRE(h.core->has_pending_jobs());

    SECTION("SecondTranscriptionIsRejected") {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (h.call({{"cmd", "status"}})["state"] != "transcribing") {
            REQUIRE(std::chrono::steady_clock::now() < deadline);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        auto busy = h.call({{"cmd", "transcribe"}, {"file", clip.string()}}, 4);
        REQUIRE(busy["code"] == "transcription already in progress");
        REQUIRE(busy["retryable"] == true);

        release.set_value();
        h.complete_job(seen);
        REQUIRE(h.ipc.sent.size() == 1);
        REQUIRE(h.ipc.sent[0].first == 3);
        REQUIRE(h.ipc.sent[0].second["text"] == "hello world");
    }

    SECTION("CancelAnswersWaitingClient") {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (h.call({{"cmd", "status"}})["state"] != "transcribing") {
            REQUIRE(std::chrono::steady_clock::now() < deadline);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        auto resp = h.call({{"cmd", "cancel"}});
        REQUIRE(resp["cancelled"] == "transcription");
        REQUIRE(h.ipc.sent.size() == 1);
        REQUIRE(h.ipc.sent[0].first == 3);
        REQUIRE(h.ipc.sent[0].second["code"] == "cancelled");

        release.set_value();
        h.complete_job(seen);
        // No second reply, and nothing stored.
        REQUIRE(h.ipc.sent.size() == 1);
        REQUIRE(h.call({{"cmd", "history"}})["entries"].empty());
        REQUIRE_FALSE(h.core->has_pending_jobs());
    }

    SECTION("DisconnectedClientGetsNoReply") {
        h.core->remove_waiting_client(3);
        release.set_value();
        h.complete_job(seen);
        REQUIRE(h.ipc.sent.empty());
        // The result is still recorded.
        REQUIRE(h.call({{"cmd", "history"}})["entries"].size() == 1);
    }
}

TEST_CASE("DaemonCore remote model defaults", "[daemon]") {
    Config cfg;
    cfg.transcription.provider = "custom";
    cfg.remote.url = "http://127.0.0.1:1";
    cfg.remote.api_model = "whisper-small";
    Harness h(cfg);
    auto clip = test_support::write_wav(h.dir / "clip.wav", 1.0);

    SECTION("StatusReportsConfiguredApiModel") {
        REQUIRE(h.call({{"cmd", "status"}})["model"] == "whisper-small");
    }

    SECTION("CustomProviderUsesApiModel") {
        auto resp = h.deferred({{"cmd", "transcribe"}, {"file", clip.string()}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["code"] == "network error");
        REQUIRE(resp["model"] == "whisper-small");
    }

    SECTION("CloudProviderUsesItsOwnDefault") {
        auto resp = h.deferred({{"cmd", "transcribe"}, {"file", clip.string()}, {"provider", "groq"}});
        REQUIRE(resp["code"] == "missing api key");
        REQUIRE(resp["model"] == ModelCatalog::DEFAULT_GROQ_MODEL);
    }

    SECTION("ExplicitModelWins") {
        auto resp = h.deferred({{"cmd", "transcribe"}, {"file", clip.string()}, {"model", "distil"}});
        REQUIRE(resp["model"] == "distil");
    }

    SECTION("LocalOverrideUsesConfiguredLocalModel") {
        auto resp = h.deferred({{"cmd", "transcribe"}, {"file", clip.string()}, {"provider", "local"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["model"] == "base.en");
    }
}

TEST_CASE("DaemonCore responses", "[daemon]") {
    auto err = DaemonCore::error_response(make_error(ErrorCode::NetworkError, "timed out"));
    REQUIRE(err["status"] == "error");
    REQUIRE(err["code"] == "network error");
    REQUIRE(err["message"] == "timed out");
    REQUIRE(err["retryable"] == true);

    Config cfg;
    cfg.transcription.provider = "openai";
    TmpDir dir("badprovider");
    FakeEngine engine;
    WavRecorder recorder;
    FakeIpc ipc;
    cfg.models_dir = (dir / "models").string();
    cfg.recordings_dir = (dir / "recordings").string();
    DaemonCore core(cfg, engine, recorder, ipc, [] {});
    REQUIRE_FALSE(core.init((dir / "h.db").string()));
}

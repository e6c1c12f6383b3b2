#pragma once

#include "config.hpp"
#include "error.hpp"
#include "inference/context_manager.hpp"
#include "inference/inference_engine.hpp"
#include "platform/audio_recorder.hpp"
#include "platform/ipc_server.hpp"
#include "recording/recording_session.hpp"
#include "recording/session_observer.hpp"
#include "storage/history_db.hpp"
#include "transcription/model.hpp"
#include "transcription/processor.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Portable daemon logic. Everything here runs on the event loop thread
// except the job bodies, which run on their own jthread and report back
// through NotifyCallback (an eventfd write on Linux).
class DaemonCore : public SessionObserver {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, InferenceEngine& engine, AudioRecorder& recorder,
               IpcServer& ipc, NotifyCallback notify);
    ~DaemonCore() override;

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init(const std::string& history_path);

    // nullopt: the reply is deferred until a background job finishes.
    std::optional<nlohmann::json> handle_command(int client_fd, const nlohmann::json& cmd);

    // Collects finished jobs and answers their waiting clients.
    void on_job_complete();

    void remove_waiting_client(int fd);

    SessionState session_state() const { return session_.state(); }
    bool has_pending_jobs() const { return !jobs_.empty(); }

    void shutdown();

    static nlohmann::json error_response(const Error& error);
    static nlohmann::json result_to_json(const TranscriptionResult& result);

    // SessionObserver
    void session_did_start() override;
    void session_did_complete(const std::filesystem::path& audio_path) override;
    void session_did_cancel() override;
    void session_did_fail(const Error& error) override;

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_stop(int client_fd, const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_toggle(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_transcribe(int client_fd, const nlohmann::json& cmd);
    std::optional<nlohmann::json> handle_load(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_unload(const nlohmann::json& cmd);
    nlohmann::json handle_models(const nlohmann::json& cmd);

    TranscriptionModel resolve_model(ModelProvider provider,
                                     const std::optional<std::string>& requested) const;
    std::expected<TranscriptionModel, Error> model_for(const nlohmann::json& cmd) const;

    std::optional<nlohmann::json> start_transcription(int client_fd,
                                                      const std::filesystem::path& audio_path,
                                                      const TranscriptionModel& model,
                                                      std::optional<std::string> language,
                                                      std::optional<std::string> prompt);

    enum class JobKind { Transcription, Load };

    struct JobOutput {
        nlohmann::json response;
        std::optional<TranscriptionResult> result;
    };

    struct Job {
        JobKind kind;
        std::string label;
        std::vector<int> waiting_clients;
        bool cancelled = false;
        std::optional<JobOutput> output; // written by the worker under jobs_mu_
        std::jthread thread;
    };

    void launch(JobKind kind, std::string label, int client_fd,
                std::function<JobOutput(std::stop_token)> body);
    void finish(uint64_t id);

    Config config_;
    std::filesystem::path recordings_dir_;
    ModelCatalog catalog_;
    ModelProvider provider_ = ModelProvider::Local;

    IpcServer& ipc_;
    NotifyCallback notify_;

    ContextManager contexts_;
    TranscriptionProcessor processor_;
    RecordingSession session_;
    HistoryDb history_db_;

    std::mutex jobs_mu_; // guards Job::output and done_
    std::vector<uint64_t> done_;
    uint64_t next_job_ = 1;
    std::map<uint64_t, Job> jobs_; // declared last: joins before the rest is torn down
};

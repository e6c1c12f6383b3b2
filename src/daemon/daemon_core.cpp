#include "daemon_core.hpp"

#include "enhancement/chat_enhancer.hpp"
#include "log.hpp"
#include "platform/platform_paths.hpp"
#include "transcription/local_service.hpp"
#include "transcription/remote_service.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path resolve_dir(const std::string& configured, const char* subdir) {
    if (!configured.empty()) {
        if (configured.starts_with("~/")) {
            if (const char* home = std::getenv("HOME")) {
                return fs::path(home) / configured.substr(2);
            }
        }
        return configured;
    }
    auto data = platform::data_dir();
    if (data.empty()) return fs::temp_directory_path() / "inkwell" / subdir;
    return fs::path(data) / subdir;
}

std::optional<std::string> optional_string(const json& cmd, const char* key) {
    if (!cmd.contains(key) || !cmd[key].is_string()) return std::nullopt;
    return cmd[key].get<std::string>();
}

// Rejects fields present with the wrong JSON type before any handler reads them.
std::expected<void, Error> check_field_types(const json& cmd) {
    for (const char* key : {"cmd", "file", "model", "provider", "language", "prompt"}) {
        if (cmd.contains(key) && !cmd[key].is_string()) {
            return std::unexpected(make_error(ErrorCode::InvalidCommand,
                                              std::format("\"{}\" must be a string", key)));
        }
    }
    if (cmd.contains("limit")) {
        const auto& limit = cmd["limit"];
        if (!limit.is_number_integer() || limit.get<int64_t>() < 0) {
            return std::unexpected(make_error(ErrorCode::InvalidCommand,
                                              "\"limit\" must be a non-negative integer"));
        }
    }
    return {};
}

} // namespace

DaemonCore::DaemonCore(Config config, InferenceEngine& engine, AudioRecorder& recorder,
                       IpcServer& ipc, NotifyCallback notify)
    : config_(std::move(config)),
      recordings_dir_(resolve_dir(config_.recordings_dir, "recordings")),
      catalog_(ModelCatalog::from_config(config_, resolve_dir(config_.models_dir, "models"))),
      ipc_(ipc),
      notify_(std::move(notify)),
      contexts_(engine),
      processor_(AudioPreprocessor(config_.transcription.validate_audio),
                 ResultProcessor(ResultProcessor::Options{
                     .text_formatting = config_.transcription.text_formatting,
                     .word_replacements = config_.word_replacements,
                 })),
      session_(recorder, recordings_dir_, this, /*load_audio=*/false) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(const std::string& history_path) {
    auto provider = provider_from_string(config_.transcription.provider);
    if (!provider) {
        log_error("unknown transcription provider: {}", config_.transcription.provider);
        return false;
    }
    provider_ = *provider;

    const auto& language = config_.transcription.language;
    contexts_.set_language(language);
    contexts_.set_prompt(config_.prompt_for_language(language));

    using Format = RemoteTranscriptionService::ApiFormat;
    processor_.register_service(ModelProvider::Local,
                                std::make_shared<LocalTranscriptionService>(contexts_));
    processor_.register_service(
        ModelProvider::Lan,
        std::make_shared<RemoteTranscriptionService>(
            RemoteTranscriptionService::format_from_string(config_.remote.api_format),
            config_.api_key_for("lan")));
    processor_.register_service(
        ModelProvider::Groq,
        std::make_shared<RemoteTranscriptionService>(Format::OpenAI, config_.api_key_for("groq"), true));
    processor_.register_service(
        ModelProvider::Mistral,
        std::make_shared<RemoteTranscriptionService>(Format::OpenAI, config_.api_key_for("mistral"), true));
    processor_.register_service(
        ModelProvider::Custom,
        std::make_shared<RemoteTranscriptionService>(Format::OpenAI, config_.api_key_for("custom")));

    if (config_.enhancement.enabled) {
        processor_.set_enhancer(std::make_shared<ChatEnhancer>(ChatEnhancer::Options{
            .url = config_.enhancement.url,
            .model = config_.enhancement.model,
            .api_key = config_.enhancement.api_key,
            .prompt_name = config_.enhancement.prompt_name,
            .system_prompt = config_.enhancement.system_prompt,
        }));
        log_info("enhancement via {} at {}", config_.enhancement.model, config_.enhancement.url);
    }

    if (!history_db_.open(history_path)) {
        log_warn("history DB failed to open, history disabled");
    }

    log_info("provider {} model {}, recordings in {}", to_string(provider_),
             resolve_model(provider_, std::nullopt).name, recordings_dir_.string());
    return true;
}

std::optional<json> DaemonCore::handle_command(int client_fd, const json& cmd) {
    if (cmd.is_discarded() || !cmd.is_object()) {
        return error_response(make_error(ErrorCode::InvalidCommand, "malformed command"));
    }
    if (auto ok = check_field_types(cmd); !ok) return error_response(ok.error());

    std::string name = optional_string(cmd, "cmd").value_or("");
    if (name == "start") return handle_start(cmd);
    if (name == "stop") return handle_stop(client_fd, cmd);
    if (name == "toggle") return handle_toggle(client_fd, cmd);
    if (name == "cancel") return handle_cancel(cmd);
    if (name == "status") return handle_status(cmd);
    if (name == "history") return handle_history(cmd);
    if (name == "transcribe") return handle_transcribe(client_fd, cmd);
    if (name == "load") return handle_load(client_fd, cmd);
    if (name == "unload") return handle_unload(cmd);
    if (name == "models") return handle_models(cmd);
    return error_response(make_error(ErrorCode::InvalidCommand, "unknown command: " + name));
}

json DaemonCore::handle_start(const json& /*cmd*/) {
    auto path = session_.start_recording();
    if (!path) return error_response(path.error());
    return {{"status", "ok"}, {"state", "recording"}, {"path", path->string()}};
}

std::optional<json> DaemonCore::handle_stop(int client_fd, const json& cmd) {
    auto model = model_for(cmd);
    if (!model) return error_response(model.error());

    // The transcription job reads the file; nothing is read on this thread.
    auto path = session_.stop_recording();
    if (!path) return error_response(path.error());

    return start_transcription(client_fd, *path, *model, optional_string(cmd, "language"),
                               optional_string(cmd, "prompt"));
}

std::optional<json> DaemonCore::handle_toggle(int client_fd, const json& cmd) {
    if (session_.state() == SessionState::Recording) {
        return handle_stop(client_fd, cmd);
    }
    return handle_start(cmd);
}

json DaemonCore::handle_cancel(const json& /*cmd*/) {
    if (session_.state() == SessionState::Recording) {
        session_.cancel_recording();
        return {{"status", "ok"}, {"cancelled", "recording"}};
    }

    if (processor_.is_processing()) {
        processor_.cancel_transcription();

        auto cancelled = error_response(make_error(ErrorCode::Cancelled, "transcription cancelled"));
        for (auto& [id, job] : jobs_) {
            if (job.kind != JobKind::Transcription || job.cancelled) continue;
            job.cancelled = true;
            job.thread.request_stop();
            for (int fd : job.waiting_clients) ipc_.send_response(fd, cancelled);
            job.waiting_clients.clear();
        }
        return {{"status", "ok"}, {"cancelled", "transcription"}};
    }

    return error_response(make_error(ErrorCode::InvalidState, "nothing to cancel"));
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    json resp = {{"status", "ok"}};
    if (session_.state() == SessionState::Recording) {
        resp["state"] = "recording";
        resp["duration"] = session_.recording_duration();
    } else if (processor_.is_processing()) {
        resp["state"] = "transcribing";
    } else {
        resp["state"] = "idle";
    }

    resp["provider"] = to_string(provider_);
    resp["model"] = resolve_model(provider_, std::nullopt).name;

    json loaded = json::array();
    for (const auto& id : contexts_.available_contexts()) {
        loaded.push_back({{"model", id}, {"in_use", contexts_.ref_count(id)}});
    }
    resp["loaded"] = std::move(loaded);

    json loading = json::array();
    for (const auto& [id, job] : jobs_) {
        if (job.kind == JobKind::Load) loading.push_back(job.label);
    }
    resp["loading"] = std::move(loading);
    return resp;
}

json DaemonCore::handle_history(const json& cmd) {
    int64_t requested = cmd.value("limit", int64_t{10});
    int limit = static_cast<int>(std::min<int64_t>(requested, std::numeric_limits<int>::max()));
    auto entries = history_db_.recent(limit);

    json resp = {{"status", "ok"}, {"entries", json::array()}};
    for (auto& e : entries) {
        json entry = {
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"audio_duration", e.audio_duration},
            {"transcription_duration", e.transcription_duration},
            {"model", e.model_name},
            {"audio_path", e.audio_path},
        };
        if (e.enhanced_text) entry["enhanced_text"] = *e.enhanced_text;
        if (e.enhancement_duration) entry["enhancement_duration"] = *e.enhancement_duration;
        if (e.prompt_name) entry["prompt_name"] = *e.prompt_name;
        resp["entries"].push_back(std::move(entry));
    }
    return resp;
}

std::optional<json> DaemonCore::handle_transcribe(int client_fd, const json& cmd) {
    auto file = optional_string(cmd, "file");
    if (!file || file->empty()) {
        return error_response(make_error(ErrorCode::AudioFileNotFound, "missing \"file\""));
    }

    auto model = model_for(cmd);
    if (!model) return error_response(model.error());

    return start_transcription(client_fd, *file, *model, optional_string(cmd, "language"),
                               optional_string(cmd, "prompt"));
}

std::optional<json> DaemonCore::handle_load(int client_fd, const json& cmd) {
    std::string name = optional_string(cmd, "model").value_or(config_.transcription.model);
    if (contexts_.is_context_loaded(name)) {
        return json{{"status", "ok"}, {"model", name}, {"loaded", true}};
    }
    if (contexts_.is_loading(name)) {
        return error_response(make_error(ErrorCode::ContextLoadInProgress,
                                         "context for " + name + " is loading"));
    }

    auto path = catalog_.local_model_path(name);
    launch(JobKind::Load, name, client_fd, [this, name, path](std::stop_token) {
        auto ctx = contexts_.load_context(name, path);
        if (!ctx) return JobOutput{.response = error_response(ctx.error())};
        return JobOutput{.response = {{"status", "ok"}, {"model", name}, {"loaded", true}}};
    });
    return std::nullopt;
}

json DaemonCore::handle_unload(const json& cmd) {
    std::string name = optional_string(cmd, "model").value_or(config_.transcription.model);
    bool was_loaded = contexts_.is_context_loaded(name);
    contexts_.unload_context(name);
    return {{"status", "ok"}, {"model", name}, {"unloaded", was_loaded}};
}

json DaemonCore::handle_models(const json& /*cmd*/) {
    json providers = json::array();
    for (auto p : processor_.services().providers()) providers.push_back(to_string(p));

    return {
        {"status", "ok"},
        {"installed", catalog_.installed_local_models()},
        {"loaded", contexts_.available_contexts()},
        {"providers", std::move(providers)},
        {"models_dir", catalog_.models_dir().string()},
    };
}

// transcription.model names the local model. Remote providers fall back to
// their catalog default.
TranscriptionModel DaemonCore::resolve_model(ModelProvider provider,
                                             const std::optional<std::string>& requested) const {
    if (requested) return catalog_.resolve(provider, *requested);
    if (provider == ModelProvider::Local) return catalog_.resolve(provider, config_.transcription.model);
    return catalog_.resolve(provider, "");
}

std::expected<TranscriptionModel, Error> DaemonCore::model_for(const json& cmd) const {
    auto provider = provider_;
    if (auto name = optional_string(cmd, "provider")) {
        auto parsed = provider_from_string(*name);
        if (!parsed) {
            return std::unexpected(make_error(ErrorCode::ServiceUnavailable,
                                              "unknown provider: " + *name));
        }
        provider = *parsed;
    }
    return resolve_model(provider, optional_string(cmd, "model"));
}

std::optional<json> DaemonCore::start_transcription(int client_fd, const fs::path& audio_path,
                                                    const TranscriptionModel& model,
                                                    std::optional<std::string> language,
                                                    std::optional<std::string> prompt) {
    if (processor_.is_processing()) {
        auto resp = error_response(make_error(ErrorCode::AlreadyProcessing,
                                              "a transcription is already running"));
        resp["path"] = audio_path.string();
        return resp;
    }

    log_info("transcribing {} with {}/{}", audio_path.string(), to_string(model.provider), model.name);

    launch(JobKind::Transcription, audio_path.filename().string(), client_fd,
           [this, audio_path, model, language = std::move(language),
            prompt = std::move(prompt)](std::stop_token) {
               auto result = processor_.process_transcription(audio_path, model, language, prompt);
               if (!result) {
                   auto resp = error_response(result.error());
                   resp["path"] = audio_path.string();
                   resp["model"] = model.name;
                   return JobOutput{.response = std::move(resp)};
               }
               return JobOutput{.response = result_to_json(*result), .result = std::move(*result)};
           });
    return std::nullopt;
}

void DaemonCore::launch(JobKind kind, std::string label, int client_fd,
                        std::function<JobOutput(std::stop_token)> body) {
    uint64_t id = next_job_++;
    auto& job = jobs_[id];
    job.kind = kind;
    job.label = std::move(label);
    if (client_fd >= 0) job.waiting_clients.push_back(client_fd);

    job.thread = std::jthread([this, id, job_ptr = &job, body = std::move(body)](std::stop_token st) {
        auto output = body(st);
        {
            std::lock_guard lock(jobs_mu_);
            job_ptr->output.emplace(std::move(output));
            done_.push_back(id);
        }
        notify_();
    });
}

void DaemonCore::on_job_complete() {
    std::vector<uint64_t> done;
    {
        std::lock_guard lock(jobs_mu_);
        done.swap(done_);
    }
    for (auto id : done) finish(id);
}

void DaemonCore::finish(uint64_t id) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;

    auto& job = it->second;
    if (job.thread.joinable()) job.thread.join();

    std::optional<JobOutput> output;
    {
        std::lock_guard lock(jobs_mu_);
        if (job.output) output.emplace(std::move(*job.output));
    }

    if (output) {
        if (output->result && !job.cancelled) {
            const auto& r = *output->result;
            log_info("transcription complete: {:.1f}s audio, {:.2f}s processing, {} chars",
                     r.duration, r.transcription_duration, r.text.size());
            if (!history_db_.insert(r)) log_warn("failed to store history entry");
        } else if (!output->result) {
            log_warn("{} {}: {}", job.kind == JobKind::Load ? "load" : "transcription", job.label,
                     output->response.value("message", "failed"));
        }

        for (int fd : job.waiting_clients) {
            ipc_.send_response(fd, output->response);
        }
    }

    jobs_.erase(it);
}

void DaemonCore::remove_waiting_client(int fd) {
    for (auto& [id, job] : jobs_) {
        std::erase(job.waiting_clients, fd);
    }
}

void DaemonCore::shutdown() {
    if (session_.state() == SessionState::Recording) {
        session_.cancel_recording();
    }

    if (processor_.is_processing()) {
        log_info("cancelling pending transcription");
        processor_.cancel_transcription();
    }

    for (auto& [id, job] : jobs_) {
        job.thread.request_stop();
        if (job.thread.joinable()) job.thread.join();
    }
    on_job_complete();

    contexts_.unload_all();
}

json DaemonCore::error_response(const Error& error) {
    return {
        {"status", "error"},
        {"code", error_code_name(error.code)},
        {"message", error.message},
        {"retryable", is_retryable(error.code)},
    };
}

json DaemonCore::result_to_json(const TranscriptionResult& r) {
    json j = {
        {"status", "ok"},
        {"text", r.text},
        {"duration", r.duration},
        {"transcription_duration", r.transcription_duration},
        {"model", r.model_name},
        {"path", r.audio_path},
    };
    if (r.enhanced_text) j["enhanced_text"] = *r.enhanced_text;
    if (r.enhancement_duration) j["enhancement_duration"] = *r.enhancement_duration;
    if (r.prompt_name) j["prompt_name"] = *r.prompt_name;
    if (r.ai_enhancement_model_name) j["enhancement_model"] = *r.ai_enhancement_model_name;
    return j;
}

void DaemonCore::session_did_start() {
    log_info("recording started");
}

void DaemonCore::session_did_complete(const fs::path& audio_path) {
    log_info("recording saved to {}", audio_path.string());
}

void DaemonCore::session_did_cancel() {
    log_info("recording cancelled");
}

void DaemonCore::session_did_fail(const Error& error) {
    log_error("recording failed ({}): {}", error_code_name(error.code), error.message);
}

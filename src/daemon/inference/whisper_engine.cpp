#include "inference/whisper_engine.hpp"

#include "log.hpp"

#include <algorithm>
#include <mutex>
#include <thread>
#include <whisper.h>

namespace {

// whisper/ggml emit partial lines; buffer until newline.
void whisper_log_cb(ggml_log_level level, const char* text, void* /*user_data*/) {
    thread_local std::string line;
    if (text) line += text;
    if (line.empty() || line.back() != '\n') return;
    line.pop_back();

    switch (level) {
        case GGML_LOG_LEVEL_ERROR: log_error("whisper: {}", line); break;
        case GGML_LOG_LEVEL_WARN:  log_warn("whisper: {}", line); break;
        default:                   log_info("whisper: {}", line); break;
    }
    line.clear();
}

std::once_flag g_log_once;

} // namespace

WhisperHandle::WhisperHandle(whisper_context* ctx, int n_threads)
    : ctx_(ctx), n_threads_(n_threads) {}

WhisperHandle::~WhisperHandle() {
    release();
}

bool WhisperHandle::run_full_transcription(std::span<const float> samples) {
    if (!ctx_) return false;

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.print_realtime   = false;
    params.print_progress   = false;
    params.print_timestamps = false;
    params.print_special    = false;
    params.translate        = false;
    params.n_threads        = n_threads_;
    params.offset_ms        = 0;
    params.no_context       = true;
    params.single_segment   = false;
    params.temperature      = 0.2f;

    // Pointers must outlive whisper_full; the members do.
    bool auto_language = language_.empty() || language_ == "auto";
    params.language = auto_language ? nullptr : language_.c_str();
    params.detect_language = false;
    params.initial_prompt = prompt_.empty() ? nullptr : prompt_.c_str();

    whisper_reset_timings(ctx_);

    int rc = whisper_full(ctx_, params, samples.data(), static_cast<int>(samples.size()));
    if (rc != 0) {
        log_error("whisper: whisper_full failed, rc={}", rc);
        return false;
    }
    return true;
}

std::string WhisperHandle::transcription() const {
    if (!ctx_) return {};

    std::string out;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(ctx_, i);
        if (text) out += text;
    }
    return out;
}

void WhisperHandle::release() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

WhisperEngine::WhisperEngine(bool use_gpu, int n_threads)
    : use_gpu_(use_gpu), n_threads_(n_threads) {
    if (n_threads_ <= 0) {
        int cpus = static_cast<int>(std::thread::hardware_concurrency());
        n_threads_ = std::clamp(cpus - 2, 1, 8);
    }
    std::call_once(g_log_once, [] { whisper_log_set(whisper_log_cb, nullptr); });
}

std::expected<std::unique_ptr<InferenceHandle>, Error>
WhisperEngine::load(const std::filesystem::path& model_path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(model_path, ec)) {
        return std::unexpected(make_error(ErrorCode::ModelNotFound,
                                          "model file not found: " + model_path.string()));
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu_;
    cparams.flash_attn = use_gpu_;

    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected(make_error(ErrorCode::ModelLoadFailed,
                                          "couldn't load model at " + model_path.string()));
    }

    log_info("whisper: loaded {} ({} threads)", model_path.filename().string(), n_threads_);
    return std::make_unique<WhisperHandle>(ctx, n_threads_);
}

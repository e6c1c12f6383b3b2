#include "inference/model_context.hpp"

#include "log.hpp"

ModelContext::ModelContext(std::string model_id, std::unique_ptr<InferenceHandle> handle)
    : model_id_(std::move(model_id)), handle_(std::move(handle)) {}

ModelContext::~ModelContext() {
    release_resources();
}

void ModelContext::set_prompt(const std::string& prompt) {
    std::lock_guard lock(mu_);
    prompt_ = prompt;
    if (handle_) handle_->set_prompt(prompt);
}

std::string ModelContext::prompt() const {
    std::lock_guard lock(mu_);
    return prompt_;
}

bool ModelContext::run_full_transcription(std::span<const float> samples) {
    std::lock_guard lock(mu_);
    if (!handle_) return false;
    return handle_->run_full_transcription(samples);
}

std::string ModelContext::transcription() const {
    std::lock_guard lock(mu_);
    if (!handle_) return {};
    return handle_->transcription();
}

std::expected<std::string, Error> ModelContext::transcribe(std::span<const float> samples,
                                                           const std::string& prompt,
                                                           const std::string& language) {
    std::lock_guard lock(mu_);
    if (!handle_) {
        return std::unexpected(make_error(ErrorCode::ContextNotLoaded,
                                          "context released: " + model_id_));
    }

    prompt_ = prompt;
    handle_->set_prompt(prompt);
    handle_->set_language(language);

    if (!handle_->run_full_transcription(samples)) {
        return std::unexpected(make_error(ErrorCode::TranscriptionFailed,
                                          "inference failed for model " + model_id_));
    }
    return handle_->transcription();
}

bool ModelContext::is_released() const {
    std::lock_guard lock(mu_);
    return handle_ == nullptr;
}

void ModelContext::release_resources() {
    // Waits for an in-flight transcription on this context to finish.
    std::lock_guard lock(mu_);
    if (!handle_) return;
    handle_->release();
    handle_.reset();
    log_info("context: released native handle for {}", model_id_);
}

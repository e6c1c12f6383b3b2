#pragma once

#include "inference/inference_engine.hpp"

struct whisper_context;

class WhisperHandle : public InferenceHandle {
public:
    WhisperHandle(whisper_context* ctx, int n_threads);
    ~WhisperHandle() override;

    WhisperHandle(const WhisperHandle&) = delete;
    WhisperHandle& operator=(const WhisperHandle&) = delete;

    void set_prompt(const std::string& prompt) override { prompt_ = prompt; }
    void set_language(const std::string& language) override { language_ = language; }
    bool run_full_transcription(std::span<const float> samples) override;
    std::string transcription() const override;
    void release() override;

private:
    whisper_context* ctx_ = nullptr;
    int n_threads_;
    std::string prompt_;
    std::string language_;
};

class WhisperEngine : public InferenceEngine {
public:
    // n_threads <= 0 picks hardware_concurrency - 2, clamped to [1, 8].
    explicit WhisperEngine(bool use_gpu = true, int n_threads = 0);

    std::expected<std::unique_ptr<InferenceHandle>, Error>
        load(const std::filesystem::path& model_path) override;

private:
    bool use_gpu_;
    int n_threads_;
};

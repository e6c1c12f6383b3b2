#pragma once

#include "error.hpp"
#include "inference/inference_engine.hpp"

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <span>
#include <string>

// A loaded model. Owns its native handle; the handle is released when the
// owning ContextManager unloads it or when the context is destroyed,
// whichever comes first. All native calls are serialized on mu_.
class ModelContext {
public:
    ModelContext(std::string model_id, std::unique_ptr<InferenceHandle> handle);
    ~ModelContext();

    ModelContext(const ModelContext&) = delete;
    ModelContext& operator=(const ModelContext&) = delete;

    const std::string& model_id() const { return model_id_; }

    void set_prompt(const std::string& prompt);
    std::string prompt() const;

    bool run_full_transcription(std::span<const float> samples);
    std::string transcription() const;

    // set_prompt + set_language + run + collect under one lock, so
    // concurrent callers can't interleave prompts and results.
    std::expected<std::string, Error> transcribe(std::span<const float> samples,
                                                 const std::string& prompt,
                                                 const std::string& language);

    bool is_released() const;

    // Advisory only. Reaching zero never frees anything.
    int retain() { return ++ref_count_; }
    int release() {
        int cur = ref_count_.load();
        while (cur > 0 && !ref_count_.compare_exchange_weak(cur, cur - 1)) {}
        return cur > 0 ? cur - 1 : 0;
    }
    int ref_count() const { return ref_count_.load(); }

private:
    friend class ContextManager;
    void release_resources();

    const std::string model_id_;
    mutable std::mutex mu_;
    std::unique_ptr<InferenceHandle> handle_;
    std::string prompt_;
    std::atomic<int> ref_count_{0};
};

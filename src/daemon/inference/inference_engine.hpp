#pragma once

#include "error.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

// One loaded native model. Not thread-safe: callers serialize access.
class InferenceHandle {
public:
    virtual ~InferenceHandle() = default;

    virtual void set_prompt(const std::string& prompt) = 0;
    // Empty or "auto" lets the engine detect the language.
    virtual void set_language(const std::string& language) = 0;
    // Failure is a bare signal; the engine has no richer error to offer.
    virtual bool run_full_transcription(std::span<const float> samples) = 0;
    virtual std::string transcription() const = 0;
    // Frees native resources. Safe to call more than once.
    virtual void release() = 0;
};

class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    virtual std::expected<std::unique_ptr<InferenceHandle>, Error>
        load(const std::filesystem::path& model_path) = 0;
};

#pragma once

#include "audio/audio_preprocessor.hpp"
#include "error.hpp"
#include "transcription/model.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

struct TranscriptionOptions {
    std::optional<std::string> language;  // nullopt: configured default
    std::optional<std::string> prompt;    // nullopt: configured prompt
    std::stop_token stop;
    const PreprocessedAudio* audio = nullptr; // file already read by the caller
};

class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    virtual std::expected<std::string, Error>
        transcribe(const std::filesystem::path& audio_path, const TranscriptionModel& model,
                   const TranscriptionOptions& options) = 0;
};

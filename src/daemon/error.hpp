#pragma once

#include <string>

enum class ErrorCode {
    // Concurrency conflicts
    ContextLoadInProgress,
    AlreadyProcessing,
    InvalidState,
    // Resource not ready
    ContextNotLoaded,
    ServiceUnavailable,
    NoRecordingUrl,
    ModelNotFound,
    // Format / validation
    UnsupportedSampleRate,
    UnsupportedChannelCount,
    UnsupportedBitDepth,
    InvalidAudioData,
    AudioFileNotFound,
    // Backend failure
    TranscriptionFailed,
    ModelLoadFailed,
    NetworkError,
    ApiRequestFailed,
    MissingApiKey,
    EnhancementFailed,
    // Lifecycle
    Cancelled,
    RecorderFailed,
    // Control protocol
    InvalidCommand,
};

struct Error {
    ErrorCode code;
    std::string message;

    bool operator==(ErrorCode c) const { return code == c; }
};

const char* error_code_name(ErrorCode code);

// Conflicts and non-deterministic backend failures may succeed on a retry
// with the same input. Everything else needs remediation first.
bool is_retryable(ErrorCode code);

inline Error make_error(ErrorCode code, std::string message = {}) {
    if (message.empty()) message = error_code_name(code);
    return Error{code, std::move(message)};
}

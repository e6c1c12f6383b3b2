#include "error.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::ContextLoadInProgress:   return "context load in progress";
        case ErrorCode::AlreadyProcessing:       return "transcription already in progress";
        case ErrorCode::InvalidState:            return "invalid state";
        case ErrorCode::ContextNotLoaded:        return "context not loaded";
        case ErrorCode::ServiceUnavailable:      return "service unavailable";
        case ErrorCode::NoRecordingUrl:          return "no recording path";
        case ErrorCode::ModelNotFound:           return "model not found";
        case ErrorCode::UnsupportedSampleRate:   return "unsupported sample rate";
        case ErrorCode::UnsupportedChannelCount: return "unsupported channel count";
        case ErrorCode::UnsupportedBitDepth:     return "unsupported bit depth";
        case ErrorCode::InvalidAudioData:        return "invalid audio data";
        case ErrorCode::AudioFileNotFound:       return "audio file not found";
        case ErrorCode::TranscriptionFailed:     return "transcription failed";
        case ErrorCode::ModelLoadFailed:         return "model load failed";
        case ErrorCode::NetworkError:            return "network error";
        case ErrorCode::ApiRequestFailed:        return "api request failed";
        case ErrorCode::MissingApiKey:           return "missing api key";
        case ErrorCode::EnhancementFailed:       return "enhancement failed";
        case ErrorCode::Cancelled:               return "cancelled";
        case ErrorCode::RecorderFailed:          return "recorder failed";
        case ErrorCode::InvalidCommand:          return "invalid command";
    }
    return "unknown error";
}

bool is_retryable(ErrorCode code) {
    switch (code) {
        case ErrorCode::ContextLoadInProgress:
        case ErrorCode::AlreadyProcessing:
        case ErrorCode::InvalidState:
        case ErrorCode::TranscriptionFailed:
        case ErrorCode::NetworkError:
        case ErrorCode::ApiRequestFailed:
        case ErrorCode::EnhancementFailed:
            return true;
        default:
            return false;
    }
}

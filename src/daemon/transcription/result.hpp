#pragma once

#include <optional>
#include <string>

// Final record of one transcription job. Built once by
// ResultProcessor::create_transcription_result and never modified.
struct TranscriptionResult {
    const std::string text;
    const std::optional<std::string> enhanced_text;
    const double duration = 0.0;                 // audio seconds
    const double transcription_duration = 0.0;   // wall seconds in the backend
    const std::optional<double> enhancement_duration;
    const std::string model_name;
    const std::optional<std::string> prompt_name;
    const std::optional<std::string> power_mode_name;
    const std::optional<std::string> power_mode_emoji;
    const std::optional<std::string> ai_request_system_message;
    const std::optional<std::string> ai_request_user_message;
    const std::optional<std::string> ai_context_json;
    const std::optional<std::string> ai_enhancement_model_name;
    const std::string audio_path;
};

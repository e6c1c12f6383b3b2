#pragma once

#include <cstdint>
#include <map>
#include <string>

struct Config {
    struct Transcription {
        std::string provider = "local";
        std::string model = "base.en";
        std::string language = "en"; // "auto" lets the engine detect
        std::map<std::string, std::string> prompts; // per-language override
        bool text_formatting = true;
        bool validate_audio = true;
    } transcription;

    // "gonna, gunna" -> "going to"
    std::map<std::string, std::string> word_replacements;

    // Empty means <data dir>/models and <data dir>/recordings.
    std::string models_dir;
    std::string recordings_dir;

    struct Remote {
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string api_model = "whisper-1";
        std::map<std::string, std::string> api_keys; // provider key -> token
    } remote;

    struct Enhancement {
        bool enabled = false;
        std::string url = "http://localhost:11434";
        std::string model = "llama3.2";
        std::string api_key;
        std::string prompt_name = "Default";
        std::string system_prompt =
            "You are a transcription editor. Fix grammar, punctuation and obvious "
            "recognition errors in the text inside <TRANSCRIPT> tags. Keep the "
            "speaker's wording and language. Reply with the corrected text only.";
    } enhancement;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 120;

        size_t ring_buffer_samples() const {
            return static_cast<size_t>(max_seconds) * sample_rate;
        }
    } audio;

    // Custom prompt for the language if set, else a built-in greeting in
    // that language, else empty.
    std::string prompt_for_language(const std::string& language) const;

    std::string api_key_for(const std::string& provider) const;

    static Config load(const std::string& path);
    static Config load_default();
};

#pragma once

#include "enhancement/enhancer.hpp"
#include "error.hpp"
#include "text/word_replacer.hpp"
#include "transcription/result.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

struct ProcessedText {
    std::string text;
    double duration = 0.0;
};

// Turns raw backend text into the final transcript:
//   filter_output -> format_paragraphs (optional) -> word replacement -> trim
// Every stage is pure; the processor holds no mutable state. Running the
// chain on its own output is a no-op as long as replacement values contain
// no replacement key, nothing the filter strips and no sentence terminator.
class ResultProcessor {
public:
    struct Options {
        bool text_formatting = true;
        std::map<std::string, std::string> word_replacements;
    };

    ResultProcessor() = default;
    explicit ResultProcessor(Options opts);

    std::string process_text(const std::string& raw_text) const;

    // Runs the text chain and re-reads the audio duration from the file.
    std::expected<ProcessedText, Error>
        process_result(const std::string& raw_text, const std::filesystem::path& audio_path,
                       const std::string& model_name, double transcription_duration) const;

    // Same, with the duration already known from preprocessing.
    ProcessedText process_result(const std::string& raw_text, double audio_duration,
                                 const std::string& model_name,
                                 double transcription_duration) const;

    static TranscriptionResult
        create_transcription_result(const ProcessedText& processed, const std::string& model_name,
                                    double transcription_duration,
                                    const std::filesystem::path& audio_path,
                                    const std::optional<EnhancementResult>& enhancement = std::nullopt);

private:
    bool text_formatting_ = true;
    text::WordReplacer replacer_;
};

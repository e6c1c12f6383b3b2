#include "transcription/result_processor.hpp"

#include "audio/audio_preprocessor.hpp"
#include "log.hpp"
#include "text/output_filter.hpp"
#include "text/paragraph_formatter.hpp"
#include "wav.hpp"

ResultProcessor::ResultProcessor(Options opts)
    : text_formatting_(opts.text_formatting), replacer_(opts.word_replacements) {}

std::string ResultProcessor::process_text(const std::string& raw_text) const {
    std::string out = text::filter_output(raw_text);
    if (text_formatting_ && replacer_.empty()) {
        out = text::format_paragraphs(out);
    } else if (text_formatting_) {
        // Size sentences as they read after replacement, so formatting the
        // replaced text again yields the same paragraphs.
        out = text::format_paragraphs(out, [this](const std::string& sentence) {
            return text::count_words(replacer_.apply(sentence));
        });
    }
    if (!replacer_.empty()) out = replacer_.apply(out);
    return text::trim(out);
}

std::expected<ProcessedText, Error>
ResultProcessor::process_result(const std::string& raw_text,
                                const std::filesystem::path& audio_path,
                                const std::string& model_name,
                                double transcription_duration) const {
    auto bytes = AudioPreprocessor::read_file(audio_path);
    if (!bytes) return std::unexpected(bytes.error());

    auto info = wav::parse(*bytes);
    if (!info) {
        return std::unexpected(make_error(ErrorCode::InvalidAudioData,
                                          "not a WAV file: " + audio_path.string()));
    }
    return process_result(raw_text, info->duration_s(), model_name, transcription_duration);
}

ProcessedText ResultProcessor::process_result(const std::string& raw_text, double audio_duration,
                                              const std::string& model_name,
                                              double transcription_duration) const {
    ProcessedText out{
        .text = process_text(raw_text),
        .duration = audio_duration,
    };
    log_info("result: {} -> {} chars ({:.1f}s audio, {:.2f}s in {})", raw_text.size(),
             out.text.size(), out.duration, transcription_duration, model_name);
    return out;
}

TranscriptionResult
ResultProcessor::create_transcription_result(const ProcessedText& processed,
                                             const std::string& model_name,
                                             double transcription_duration,
                                             const std::filesystem::path& audio_path,
                                             const std::optional<EnhancementResult>& enhancement) {
    if (!enhancement) {
        return TranscriptionResult{
            .text = processed.text,
            .duration = processed.duration,
            .transcription_duration = transcription_duration,
            .model_name = model_name,
            .audio_path = audio_path.string(),
        };
    }

    return TranscriptionResult{
        .text = processed.text,
        .enhanced_text = enhancement->text,
        .duration = processed.duration,
        .transcription_duration = transcription_duration,
        .enhancement_duration = enhancement->duration_s,
        .model_name = model_name,
        .prompt_name = enhancement->prompt_name,
        .ai_request_system_message = enhancement->system_message,
        .ai_request_user_message = enhancement->user_message,
        .ai_enhancement_model_name = enhancement->model_name,
        .audio_path = audio_path.string(),
    };
}

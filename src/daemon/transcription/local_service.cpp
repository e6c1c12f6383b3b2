#include "transcription/local_service.hpp"

#include "audio/audio_preprocessor.hpp"
#include "log.hpp"

LocalTranscriptionService::LocalTranscriptionService(ContextManager& contexts)
    : contexts_(contexts) {}

std::expected<std::string, Error>
LocalTranscriptionService::transcribe(const std::filesystem::path& audio_path,
                                      const TranscriptionModel& model,
                                      const TranscriptionOptions& options) {
    if (!model.model_path) {
        return std::unexpected(make_error(ErrorCode::ModelNotFound,
                                          "no model file for " + model.name));
    }

    if (!contexts_.is_context_loaded(model.name)) {
        auto ctx = contexts_.load_context(model.name, *model.model_path);
        if (!ctx) return std::unexpected(ctx.error());
    }

    uint32_t rate = 0;
    auto samples = options.audio ? AudioPreprocessor::decode_samples(options.audio->bytes, &rate)
                                 : AudioPreprocessor::read_samples(audio_path, &rate);
    if (!samples) return std::unexpected(samples.error());

    if (rate != AudioPreprocessor::WHISPER_SAMPLE_RATE) {
        log_info("local: resampling {} Hz -> {} Hz", rate, AudioPreprocessor::WHISPER_SAMPLE_RATE);
        *samples = AudioPreprocessor::resample(*samples, rate);
    }

    if (options.stop.stop_requested()) {
        return std::unexpected(make_error(ErrorCode::Cancelled));
    }

    contexts_.retain(model.name);
    auto text = contexts_.perform_inference(model.name, *samples, options.prompt, options.language);
    contexts_.release(model.name);
    return text;
}

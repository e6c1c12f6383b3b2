#include "transcription/processor.hpp"

#include "log.hpp"

#include <chrono>

namespace {

std::expected<void, Error> checkpoint(const std::stop_token& stop, const char* where) {
    if (!stop.stop_requested()) return {};
    log_info("processor: cancelled {}", where);
    return std::unexpected(make_error(ErrorCode::Cancelled, std::string("cancelled ") + where));
}

} // namespace

TranscriptionProcessor::TranscriptionProcessor(AudioPreprocessor preprocessor,
                                               ResultProcessor result_processor)
    : preprocessor_(preprocessor),
      result_processor_(std::make_shared<const ResultProcessor>(std::move(result_processor))) {}

std::expected<TranscriptionResult, Error>
TranscriptionProcessor::process_transcription(const std::filesystem::path& audio_path,
                                              const TranscriptionModel& model,
                                              const std::optional<std::string>& language_hint,
                                              const std::optional<std::string>& prompt_override) {
    auto job = begin_job();
    if (!job) return std::unexpected(job.error());

    auto result = run(*job, audio_path, model, language_hint, prompt_override);
    end_job(job->generation);
    return result;
}

std::expected<TranscriptionResult, Error>
TranscriptionProcessor::run(const Job& job, const std::filesystem::path& audio_path,
                            const TranscriptionModel& model,
                            const std::optional<std::string>& language_hint,
                            const std::optional<std::string>& prompt_override) {
    log_info("processor: job {} {} with {}/{}", job.generation, audio_path.string(),
             to_string(model.provider), model.name);

    auto audio = preprocessor_.preprocess(audio_path);
    if (!audio) return std::unexpected(audio.error());

    if (auto ok = checkpoint(job.stop, "after preprocessing"); !ok) {
        return std::unexpected(ok.error());
    }

    auto service = registry_.find(model.provider);
    if (!service) {
        return std::unexpected(make_error(ErrorCode::ServiceUnavailable,
                                          std::string("no service for ") + to_string(model.provider)));
    }

    TranscriptionOptions options{
        .language = language_hint,
        .prompt = prompt_override,
        .stop = job.stop,
        .audio = &*audio,
    };

    auto start = std::chrono::steady_clock::now();
    auto raw = service->transcribe(audio_path, model, options);
    double transcription_s =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (!raw) return std::unexpected(raw.error());

    if (auto ok = checkpoint(job.stop, "after transcription"); !ok) {
        return std::unexpected(ok.error());
    }

    std::shared_ptr<const ResultProcessor> result_processor;
    std::shared_ptr<Enhancer> enhancer;
    {
        std::lock_guard lock(mu_);
        result_processor = result_processor_;
        enhancer = enhancer_;
    }

    auto processed = result_processor->process_result(*raw, audio->duration_s, model.name,
                                                      transcription_s);

    std::optional<EnhancementResult> enhancement;
    if (enhancer && !processed.text.empty()) {
        auto enhanced = enhancer->enhance(processed.text, job.stop);
        if (!enhanced) return std::unexpected(enhanced.error());
        enhancement = std::move(*enhanced);
    }

    if (auto ok = checkpoint(job.stop, "before result assembly"); !ok) {
        return std::unexpected(ok.error());
    }

    return ResultProcessor::create_transcription_result(processed, model.name, transcription_s,
                                                        audio_path, enhancement);
}

std::expected<TranscriptionProcessor::Job, Error> TranscriptionProcessor::begin_job() {
    std::lock_guard lock(mu_);
    if (busy_) {
        return std::unexpected(make_error(ErrorCode::AlreadyProcessing,
                                          "a transcription is already running"));
    }
    busy_ = true;
    stop_source_ = std::stop_source{};
    return Job{.generation = ++generation_, .stop = stop_source_.get_token()};
}

void TranscriptionProcessor::end_job(uint64_t generation) {
    std::lock_guard lock(mu_);
    if (generation == generation_) busy_ = false;
}

void TranscriptionProcessor::cancel_transcription() {
    std::lock_guard lock(mu_);
    if (!busy_) return;
    log_info("processor: cancelling job {}", generation_);
    stop_source_.request_stop();
    busy_ = false;
}

bool TranscriptionProcessor::is_processing() const {
    std::lock_guard lock(mu_);
    return busy_;
}

void TranscriptionProcessor::register_service(ModelProvider provider,
                                              std::shared_ptr<TranscriptionService> service) {
    registry_.register_service(provider, std::move(service));
}

void TranscriptionProcessor::set_enhancer(std::shared_ptr<Enhancer> enhancer) {
    std::lock_guard lock(mu_);
    enhancer_ = std::move(enhancer);
}

void TranscriptionProcessor::set_result_processor(ResultProcessor result_processor) {
    auto rp = std::make_shared<const ResultProcessor>(std::move(result_processor));
    std::lock_guard lock(mu_);
    result_processor_ = std::move(rp);
}

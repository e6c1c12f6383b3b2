#pragma once

#include "audio/audio_preprocessor.hpp"
#include "enhancement/enhancer.hpp"
#include "error.hpp"
#include "transcription/model.hpp"
#include "transcription/result.hpp"
#include "transcription/result_processor.hpp"
#include "transcription/service_registry.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

// Runs one transcription job end to end:
//   preprocess -> [stop?] -> service -> [stop?] -> text chain
//   -> enhancement -> [stop?] -> TranscriptionResult
//
// At most one job is active. A second caller gets AlreadyProcessing.
// cancel_transcription() frees the processor at once; the abandoned job sees
// its stop token at the next checkpoint and returns Cancelled. Jobs carry a
// generation number so a stale job can't clear a newer job's busy flag.
class TranscriptionProcessor {
public:
    explicit TranscriptionProcessor(AudioPreprocessor preprocessor = AudioPreprocessor{},
                                    ResultProcessor result_processor = ResultProcessor{});

    TranscriptionProcessor(const TranscriptionProcessor&) = delete;
    TranscriptionProcessor& operator=(const TranscriptionProcessor&) = delete;

    std::expected<TranscriptionResult, Error>
        process_transcription(const std::filesystem::path& audio_path,
                              const TranscriptionModel& model,
                              const std::optional<std::string>& language_hint = std::nullopt,
                              const std::optional<std::string>& prompt_override = std::nullopt);

    void cancel_transcription();
    bool is_processing() const;

    void register_service(ModelProvider provider, std::shared_ptr<TranscriptionService> service);
    ServiceRegistry& services() { return registry_; }

    void set_enhancer(std::shared_ptr<Enhancer> enhancer);
    void set_result_processor(ResultProcessor result_processor);

private:
    struct Job {
        uint64_t generation;
        std::stop_token stop;
    };

    std::expected<Job, Error> begin_job();
    void end_job(uint64_t generation);

    std::expected<TranscriptionResult, Error>
        run(const Job& job, const std::filesystem::path& audio_path,
            const TranscriptionModel& model, const std::optional<std::string>& language_hint,
            const std::optional<std::string>& prompt_override);

    const AudioPreprocessor preprocessor_;
    ServiceRegistry registry_;

    mutable std::mutex mu_;
    bool busy_ = false;
    uint64_t generation_ = 0;
    std::stop_source stop_source_;
    std::shared_ptr<Enhancer> enhancer_;
    std::shared_ptr<const ResultProcessor> result_processor_;
};

#pragma once

#include "inference/context_manager.hpp"
#include "transcription/service.hpp"

// In-process whisper.cpp through the ContextManager. Loads the model on
// first use; later jobs reuse the loaded context.
class LocalTranscriptionService : public TranscriptionService {
public:
    explicit LocalTranscriptionService(ContextManager& contexts);

    std::expected<std::string, Error>
        transcribe(const std::filesystem::path& audio_path, const TranscriptionModel& model,
                   const TranscriptionOptions& options) override;

private:
    ContextManager& contexts_;
};

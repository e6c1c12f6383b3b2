#pragma once

#include "transcription/service.hpp"

#include <string>

// HTTP transcription through libcurl. Serves the LAN whisper.cpp server as
// well as OpenAI-compatible cloud APIs (Groq, Mistral, custom endpoints).
class RemoteTranscriptionService : public TranscriptionService {
public:
    enum class ApiFormat {
        WhisperCpp, // POST <endpoint>/inference
        OpenAI,     // POST <endpoint>[/v1]/audio/transcriptions
    };

    static ApiFormat format_from_string(const std::string& s);

    RemoteTranscriptionService(ApiFormat format, std::string api_key = {},
                               bool requires_api_key = false);
    ~RemoteTranscriptionService() override;

    RemoteTranscriptionService(const RemoteTranscriptionService&) = delete;
    RemoteTranscriptionService& operator=(const RemoteTranscriptionService&) = delete;

    std::expected<std::string, Error>
        transcribe(const std::filesystem::path& audio_path, const TranscriptionModel& model,
                   const TranscriptionOptions& options) override;

    // Full request URL for a model endpoint in the given format.
    static std::string request_url(ApiFormat format, const std::string& endpoint);

    // Pulls "text" out of a JSON reply, or the server's error message.
    static std::expected<std::string, Error> parse_response(long http_status,
                                                            const std::string& body);

private:
    ApiFormat format_;
    std::string api_key_;
    bool requires_api_key_;
};

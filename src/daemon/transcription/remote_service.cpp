#include "transcription/remote_service.hpp"

#include "audio/audio_preprocessor.hpp"
#include "log.hpp"
#include "text/output_filter.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<const std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

static void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

RemoteTranscriptionService::ApiFormat
RemoteTranscriptionService::format_from_string(const std::string& s) {
    return s == "openai" ? ApiFormat::OpenAI : ApiFormat::WhisperCpp;
}

RemoteTranscriptionService::RemoteTranscriptionService(ApiFormat format, std::string api_key,
                                                       bool requires_api_key)
    : format_(format), api_key_(std::move(api_key)), requires_api_key_(requires_api_key) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

RemoteTranscriptionService::~RemoteTranscriptionService() {
    curl_global_cleanup();
}

std::string RemoteTranscriptionService::request_url(ApiFormat format, const std::string& endpoint) {
    std::string base = endpoint;
    while (base.ends_with('/')) base.pop_back();

    if (format == ApiFormat::WhisperCpp) return base + "/inference";
    if (base.ends_with("/v1")) return base + "/audio/transcriptions";
    return base + "/v1/audio/transcriptions";
}

std::expected<std::string, Error>
RemoteTranscriptionService::parse_response(long http_status, const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        if (http_status >= 400) {
            return std::unexpected(make_error(ErrorCode::ApiRequestFailed,
                                              "HTTP " + std::to_string(http_status) + ": " + body));
        }
        return std::unexpected(make_error(ErrorCode::ApiRequestFailed,
                                          std::string("JSON parse error: ") + e.what()));
    }

    if (j.contains("error")) {
        const auto& err = j["error"];
        std::string msg;
        if (err.is_string()) {
            msg = err.get<std::string>();
        } else if (err.is_object() && err.contains("message") && err["message"].is_string()) {
            msg = err["message"].get<std::string>();
        } else {
            msg = err.dump();
        }
        return std::unexpected(make_error(ErrorCode::ApiRequestFailed, "server error: " + msg));
    }

    if (http_status >= 400) {
        return std::unexpected(make_error(ErrorCode::ApiRequestFailed,
                                          "HTTP " + std::to_string(http_status) + ": " + body));
    }

    if (!j.contains("text") || !j["text"].is_string()) {
        return std::unexpected(make_error(ErrorCode::ApiRequestFailed,
                                          "unexpected response: " + body));
    }
    return text::trim(j["text"].get<std::string>());
}

std::expected<std::string, Error>
RemoteTranscriptionService::transcribe(const std::filesystem::path& audio_path,
                                       const TranscriptionModel& model,
                                       const TranscriptionOptions& options) {
    if (!model.endpoint) {
        return std::unexpected(make_error(ErrorCode::ServiceUnavailable,
                                          std::string("no endpoint for ") + to_string(model.provider)));
    }
    if (requires_api_key_ && api_key_.empty()) {
        return std::unexpected(make_error(ErrorCode::MissingApiKey,
                                          std::string("no API key for ") + to_string(model.provider)));
    }

    std::expected<std::vector<uint8_t>, Error> loaded;
    if (!options.audio) {
        loaded = AudioPreprocessor::read_file(audio_path);
        if (!loaded) return std::unexpected(loaded.error());
    }
    const std::vector<uint8_t>& wav_data = options.audio ? options.audio->bytes : *loaded;

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(make_error(ErrorCode::NetworkError, "curl_easy_init failed"));
    }

    std::string endpoint = request_url(format_, *model.endpoint);
    std::string language = options.language.value_or("");
    if (language == "auto") language.clear();

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, audio_path.filename().string().c_str());
    curl_mime_type(part, "audio/wav");

    add_field(mime, "response_format", "json");
    if (!language.empty()) add_field(mime, "language", language);
    if (options.prompt && !options.prompt->empty()) add_field(mime, "prompt", *options.prompt);

    if (format_ == ApiFormat::OpenAI) {
        add_field(mime, "model", model.api_model.value_or("whisper-1"));
        add_field(mime, "temperature", "0");
    } else {
        add_field(mime, "temperature", "0.0");
    }

    curl_slist* headers = nullptr;
    if (!api_key_.empty()) {
        std::string auth = "Authorization: Bearer " + api_key_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    std::string response_body;
    std::stop_token stop = options.stop;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    log_info("remote: POST {} ({} bytes)", endpoint, wav_data.size());
    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(make_error(ErrorCode::Cancelled));
    }
    if (res != CURLE_OK) {
        return std::unexpected(make_error(ErrorCode::NetworkError,
                                          std::string("curl error: ") + curl_easy_strerror(res)));
    }

    auto text = parse_response(http_status, response_body);
    if (!text) log_error("remote: {}", text.error().message);
    return text;
}

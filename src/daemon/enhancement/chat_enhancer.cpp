#include "enhancement/chat_enhancer.hpp"

#include "log.hpp"
#include "text/output_filter.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<const std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

ChatEnhancer::ChatEnhancer(Options opts)
    : opts_(std::move(opts)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

ChatEnhancer::~ChatEnhancer() {
    curl_global_cleanup();
}

std::string ChatEnhancer::user_message(const std::string& transcript) {
    return "<TRANSCRIPT>\n" + transcript + "\n</TRANSCRIPT>";
}

std::string ChatEnhancer::request_body(const std::string& transcript) const {
    json body = {
        {"model", opts_.model},
        {"stream", false},
        {"messages", json::array({
            {{"role", "system"}, {"content", opts_.system_prompt}},
            {{"role", "user"}, {"content", user_message(transcript)}},
        })},
    };
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::expected<std::string, Error>
ChatEnhancer::parse_response(long http_status, const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error")) {
            const auto& err = j["error"];
            std::string msg = err.is_object() && err.contains("message")
                                  ? err["message"].get<std::string>()
                                  : err.dump();
            return std::unexpected(make_error(ErrorCode::EnhancementFailed, "server error: " + msg));
        }
        if (http_status >= 400) {
            return std::unexpected(make_error(ErrorCode::EnhancementFailed,
                                              "HTTP " + std::to_string(http_status)));
        }

        const auto& content = j.at("choices").at(0).at("message").at("content");
        auto text = text::strip_reasoning(content.get<std::string>());
        if (text.empty()) {
            return std::unexpected(make_error(ErrorCode::EnhancementFailed, "empty reply"));
        }
        return text;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::EnhancementFailed,
                                          std::string("bad reply: ") + e.what()));
    }
}

std::expected<EnhancementResult, Error>
ChatEnhancer::enhance(const std::string& transcript, std::stop_token stop) {
    std::string base = opts_.url;
    while (base.ends_with('/')) base.pop_back();
    std::string endpoint = base.ends_with("/v1") ? base + "/chat/completions"
                                                 : base + "/v1/chat/completions";

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(make_error(ErrorCode::EnhancementFailed, "curl_easy_init failed"));
    }

    std::string payload = request_body(transcript);
    std::string response_body;

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    if (!opts_.api_key.empty()) {
        std::string auth = "Authorization: Bearer " + opts_.api_key;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl);
    auto end = std::chrono::steady_clock::now();

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(make_error(ErrorCode::Cancelled));
    }
    if (res != CURLE_OK) {
        return std::unexpected(make_error(ErrorCode::EnhancementFailed,
                                          std::string("curl error: ") + curl_easy_strerror(res)));
    }

    auto text = parse_response(http_status, response_body);
    if (!text) {
        log_error("enhance: {}", text.error().message);
        return std::unexpected(text.error());
    }

    return EnhancementResult{
        .text = std::move(*text),
        .duration_s = std::chrono::duration<double>(end - start).count(),
        .model_name = opts_.model,
        .prompt_name = opts_.prompt_name,
        .system_message = opts_.system_prompt,
        .user_message = user_message(transcript),
    };
}

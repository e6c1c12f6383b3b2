#pragma once

#include "enhancement/enhancer.hpp"

#include <string>

// OpenAI-compatible /v1/chat/completions client (Ollama, llama.cpp server,
// hosted APIs).
class ChatEnhancer : public Enhancer {
public:
    struct Options {
        std::string url;
        std::string model;
        std::string api_key;
        std::string prompt_name;
        std::string system_prompt;
    };

    explicit ChatEnhancer(Options opts);
    ~ChatEnhancer() override;

    ChatEnhancer(const ChatEnhancer&) = delete;
    ChatEnhancer& operator=(const ChatEnhancer&) = delete;

    std::expected<EnhancementResult, Error>
        enhance(const std::string& transcript, std::stop_token stop) override;

    static std::string user_message(const std::string& transcript);
    std::string request_body(const std::string& transcript) const;

    // choices[0].message.content with <think> blocks stripped.
    static std::expected<std::string, Error> parse_response(long http_status,
                                                            const std::string& body);

private:
    Options opts_;
};

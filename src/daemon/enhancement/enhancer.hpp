#pragma once

#include "error.hpp"

#include <expected>
#include <stop_token>
#include <string>

struct EnhancementResult {
    std::string text;
    double duration_s = 0.0;
    std::string model_name;
    std::string prompt_name;
    std::string system_message;
    std::string user_message;
};

// Optional LLM pass over a finished transcript.
class Enhancer {
public:
    virtual ~Enhancer() = default;

    virtual std::expected<EnhancementResult, Error>
        enhance(const std::string& transcript, std::stop_token stop) = 0;
};

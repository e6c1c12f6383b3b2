#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class ModelProvider {
    Local,   // whisper.cpp in-process
    Lan,     // whisper.cpp server on the network
    Groq,
    Mistral,
    Custom,  // any OpenAI-compatible endpoint
};

const char* to_string(ModelProvider provider);
std::optional<ModelProvider> provider_from_string(const std::string& s);

struct TranscriptionModel {
    std::string name;
    std::string display_name;
    ModelProvider provider = ModelProvider::Local;
    std::optional<std::filesystem::path> model_path;  // local only
    std::optional<std::string> endpoint;               // remote only
    std::optional<std::string> api_model;              // remote only
};

struct Config;

// Resolves configured model names to TranscriptionModel records.
class ModelCatalog {
public:
    ModelCatalog(std::filesystem::path models_dir, std::string remote_url,
                 std::string remote_api_model);

    static ModelCatalog from_config(const Config& cfg, const std::filesystem::path& models_dir);

    // ggml-<name>.bin under the models directory.
    std::filesystem::path local_model_path(const std::string& name) const;

    // An empty name picks the provider's default model.
    TranscriptionModel resolve(ModelProvider provider, const std::string& name) const;

    // remote.api_model for lan/custom, a built-in name for the cloud providers.
    std::string default_model(ModelProvider provider) const;

    // Names of ggml-*.bin files present on disk, sorted.
    std::vector<std::string> installed_local_models() const;

    const std::filesystem::path& models_dir() const { return models_dir_; }

    static constexpr const char* GROQ_ENDPOINT = "https://api.groq.com/openai/v1";
    static constexpr const char* MISTRAL_ENDPOINT = "https://api.mistral.ai/v1";

    static constexpr const char* DEFAULT_LOCAL_MODEL = "base.en";
    static constexpr const char* DEFAULT_GROQ_MODEL = "whisper-large-v3-turbo";
    static constexpr const char* DEFAULT_MISTRAL_MODEL = "voxtral-mini-latest";

private:
    std::filesystem::path models_dir_;
    std::string remote_url_;
    std::string remote_api_model_;
};

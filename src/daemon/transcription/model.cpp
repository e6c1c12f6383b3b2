#include "transcription/model.hpp"

#include "config.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

const char* to_string(ModelProvider provider) {
    switch (provider) {
    case ModelProvider::Local: return "local";
    case ModelProvider::Lan: return "lan";
    case ModelProvider::Groq: return "groq";
    case ModelProvider::Mistral: return "mistral";
    case ModelProvider::Custom: return "custom";
    }
    return "unknown";
}

std::optional<ModelProvider> provider_from_string(const std::string& s) {
    if (s == "local") return ModelProvider::Local;
    if (s == "lan") return ModelProvider::Lan;
    if (s == "groq") return ModelProvider::Groq;
    if (s == "mistral") return ModelProvider::Mistral;
    if (s == "custom") return ModelProvider::Custom;
    return std::nullopt;
}

ModelCatalog::ModelCatalog(fs::path models_dir, std::string remote_url,
                           std::string remote_api_model)
    : models_dir_(std::move(models_dir)), remote_url_(std::move(remote_url)),
      remote_api_model_(std::move(remote_api_model)) {}

ModelCatalog ModelCatalog::from_config(const Config& cfg, const fs::path& models_dir) {
    return ModelCatalog(models_dir, cfg.remote.url, cfg.remote.api_model);
}

fs::path ModelCatalog::local_model_path(const std::string& name) const {
    return models_dir_ / ("ggml-" + name + ".bin");
}

std::string ModelCatalog::default_model(ModelProvider provider) const {
    switch (provider) {
    case ModelProvider::Local: return DEFAULT_LOCAL_MODEL;
    case ModelProvider::Groq: return DEFAULT_GROQ_MODEL;
    case ModelProvider::Mistral: return DEFAULT_MISTRAL_MODEL;
    case ModelProvider::Lan:
    case ModelProvider::Custom: return remote_api_model_;
    }
    return {};
}

TranscriptionModel ModelCatalog::resolve(ModelProvider provider, const std::string& requested) const {
    const std::string name = requested.empty() ? default_model(provider) : requested;
    TranscriptionModel model{
        .name = name,
        .display_name = name,
        .provider = provider,
    };

    switch (provider) {
    case ModelProvider::Local:
        model.display_name = "Whisper " + name;
        model.model_path = local_model_path(name);
        break;
    case ModelProvider::Lan:
        model.endpoint = remote_url_;
        model.api_model = name;
        break;
    case ModelProvider::Groq:
        model.endpoint = GROQ_ENDPOINT;
        model.api_model = name;
        break;
    case ModelProvider::Mistral:
        model.endpoint = MISTRAL_ENDPOINT;
        model.api_model = name;
        break;
    case ModelProvider::Custom:
        model.endpoint = remote_url_;
        model.api_model = name;
        break;
    }
    return model;
}

std::vector<std::string> ModelCatalog::installed_local_models() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(models_dir_, ec)) return names;

    for (const auto& entry : fs::directory_iterator(models_dir_, ec)) {
        auto file = entry.path().filename().string();
        if (!entry.is_regular_file(ec)) continue;
        if (!file.starts_with("ggml-") || !file.ends_with(".bin")) continue;
        names.push_back(file.substr(5, file.size() - 5 - 4));
    }
    std::ranges::sort(names);
    return names;
}

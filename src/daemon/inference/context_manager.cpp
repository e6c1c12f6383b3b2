#include "inference/context_manager.hpp"

#include "log.hpp"

#include <algorithm>

ContextManager::ContextManager(InferenceEngine& engine)
    : engine_(engine) {}

ContextManager::~ContextManager() {
    unload_all();
}

std::expected<std::shared_ptr<ModelContext>, Error>
ContextManager::load_context(const std::string& model_id, const std::filesystem::path& model_path) {
    {
        std::lock_guard lock(mu_);
        if (auto it = contexts_.find(model_id); it != contexts_.end()) {
            log_info("context: using existing context for {}", model_id);
            return it->second;
        }
        if (loading_.contains(model_id)) {
            log_warn("context: {} is already being loaded", model_id);
            return std::unexpected(make_error(ErrorCode::ContextLoadInProgress,
                                              "context for " + model_id + " is loading"));
        }
        loading_.insert(model_id);
    }

    log_info("context: loading {} from {}", model_id, model_path.string());
    auto handle = engine_.load(model_path);

    std::shared_ptr<ModelContext> duplicate;
    std::shared_ptr<ModelContext> result;
    {
        std::lock_guard lock(mu_);
        loading_.erase(model_id);

        if (!handle) {
            log_error("context: failed to load {}: {}", model_id, handle.error().message);
            return std::unexpected(handle.error());
        }

        auto ctx = std::make_shared<ModelContext>(model_id, std::move(*handle));
        ctx->set_prompt(prompt_);

        // An unload during our load cleared the mark and let a second load
        // through; keep whichever landed first.
        auto [it, inserted] = contexts_.try_emplace(model_id, ctx);
        if (!inserted) duplicate = std::move(ctx);
        result = it->second;
    }

    if (duplicate) {
        duplicate->release_resources();
        log_warn("context: discarded duplicate load of {}", model_id);
    } else {
        log_info("context: loaded {}", model_id);
    }
    return result;
}

void ContextManager::unload_context(const std::string& model_id) {
    std::shared_ptr<ModelContext> ctx;
    {
        std::lock_guard lock(mu_);
        if (auto it = contexts_.find(model_id); it != contexts_.end()) {
            ctx = std::move(it->second);
            contexts_.erase(it);
        }
        loading_.erase(model_id);
    }

    if (ctx) {
        log_info("context: unloading {}", model_id);
        ctx->release_resources();
    }
}

void ContextManager::unload_all() {
    std::unordered_map<std::string, std::shared_ptr<ModelContext>> doomed;
    {
        std::lock_guard lock(mu_);
        doomed.swap(contexts_);
        loading_.clear();
    }

    if (!doomed.empty()) log_info("context: unloading all ({})", doomed.size());
    for (auto& [id, ctx] : doomed) {
        ctx->release_resources();
    }
}

std::expected<std::string, Error>
ContextManager::perform_inference(const std::string& model_id, std::span<const float> samples,
                                  const std::optional<std::string>& prompt_override,
                                  const std::optional<std::string>& language_override) {
    std::shared_ptr<ModelContext> ctx;
    std::string prompt;
    std::string language;
    {
        std::lock_guard lock(mu_);
        if (auto it = contexts_.find(model_id); it != contexts_.end()) ctx = it->second;
        prompt = prompt_override.value_or(prompt_);
        language = language_override.value_or(language_);
    }

    if (!ctx) {
        log_error("context: no context loaded for {}", model_id);
        return std::unexpected(make_error(ErrorCode::ContextNotLoaded,
                                          "no context loaded for " + model_id));
    }

    log_info("context: inference on {} ({} samples)", model_id, samples.size());
    auto text = ctx->transcribe(samples, prompt, language);
    if (!text) {
        log_error("context: inference failed for {}: {}", model_id, text.error().message);
    }
    return text;
}

bool ContextManager::is_context_loaded(const std::string& model_id) const {
    std::lock_guard lock(mu_);
    return contexts_.contains(model_id);
}

bool ContextManager::is_loading(const std::string& model_id) const {
    std::lock_guard lock(mu_);
    return loading_.contains(model_id);
}

std::vector<std::string> ContextManager::available_contexts() const {
    std::vector<std::string> ids;
    {
        std::lock_guard lock(mu_);
        ids.reserve(contexts_.size());
        for (const auto& [id, ctx] : contexts_) ids.push_back(id);
    }
    std::ranges::sort(ids);
    return ids;
}

void ContextManager::set_prompt(std::string prompt) {
    std::lock_guard lock(mu_);
    prompt_ = std::move(prompt);
}

std::string ContextManager::prompt() const {
    std::lock_guard lock(mu_);
    return prompt_;
}

void ContextManager::set_language(std::string language) {
    std::lock_guard lock(mu_);
    language_ = std::move(language);
}

std::string ContextManager::language() const {
    std::lock_guard lock(mu_);
    return language_;
}

int ContextManager::retain(const std::string& model_id) {
    auto ctx = find(model_id);
    return ctx ? ctx->retain() : -1;
}

int ContextManager::release(const std::string& model_id) {
    auto ctx = find(model_id);
    return ctx ? ctx->release() : -1;
}

int ContextManager::ref_count(const std::string& model_id) const {
    auto ctx = find(model_id);
    return ctx ? ctx->ref_count() : -1;
}

std::shared_ptr<ModelContext> ContextManager::find(const std::string& model_id) const {
    std::lock_guard lock(mu_);
    auto it = contexts_.find(model_id);
    return it != contexts_.end() ? it->second : nullptr;
}

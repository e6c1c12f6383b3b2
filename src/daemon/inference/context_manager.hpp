#pragma once

#include "error.hpp"
#include "inference/inference_engine.hpp"
#include "inference/model_context.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Sole owner of every loaded ModelContext.
//
// contexts_ and loading_ are only touched by ContextManager member functions,
// always under mu_. Native work (load, inference, release) runs outside mu_
// so a slow load never blocks queries or loads of other models.
//
// An id is either absent, in loading_ (load in flight), or in contexts_
// (ready). A failed load leaves it absent. Contexts are never evicted;
// only unload_context()/unload_all() destroy them.
class ContextManager {
public:
    explicit ContextManager(InferenceEngine& engine);
    ~ContextManager();

    ContextManager(const ContextManager&) = delete;
    ContextManager& operator=(const ContextManager&) = delete;

    // Returns the existing context if loaded. Fails with ContextLoadInProgress
    // if another load of model_id is in flight; callers retry later.
    std::expected<std::shared_ptr<ModelContext>, Error>
        load_context(const std::string& model_id, const std::filesystem::path& model_path);

    void unload_context(const std::string& model_id);
    void unload_all();

    // Uses the configured prompt and language unless overridden. Empty text
    // from a successful run is returned as-is.
    std::expected<std::string, Error>
        perform_inference(const std::string& model_id, std::span<const float> samples,
                          const std::optional<std::string>& prompt_override = std::nullopt,
                          const std::optional<std::string>& language_override = std::nullopt);

    bool is_context_loaded(const std::string& model_id) const;
    bool is_loading(const std::string& model_id) const;
    std::vector<std::string> available_contexts() const;

    void set_prompt(std::string prompt);
    std::string prompt() const;
    void set_language(std::string language);
    std::string language() const;

    // Advisory usage counts for diagnostics. -1 when not loaded.
    int retain(const std::string& model_id);
    int release(const std::string& model_id);
    int ref_count(const std::string& model_id) const;

private:
    std::shared_ptr<ModelContext> find(const std::string& model_id) const;

    InferenceEngine& engine_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::shared_ptr<ModelContext>> contexts_;
    std::unordered_set<std::string> loading_;
    std::string prompt_;
    std::string language_ = "auto";
};

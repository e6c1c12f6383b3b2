#include "transcription/service_registry.hpp"

void ServiceRegistry::register_service(ModelProvider provider,
                                       std::shared_ptr<TranscriptionService> service) {
    std::lock_guard lock(mu_);
    services_[provider] = std::move(service);
}

void ServiceRegistry::unregister_service(ModelProvider provider) {
    std::shared_ptr<TranscriptionService> old;
    {
        std::lock_guard lock(mu_);
        auto it = services_.find(provider);
        if (it == services_.end()) return;
        old = std::move(it->second);
        services_.erase(it);
    }
}

std::shared_ptr<TranscriptionService> ServiceRegistry::find(ModelProvider provider) const {
    std::lock_guard lock(mu_);
    auto it = services_.find(provider);
    return it != services_.end() ? it->second : nullptr;
}

std::vector<ModelProvider> ServiceRegistry::providers() const {
    std::lock_guard lock(mu_);
    std::vector<ModelProvider> out;
    out.reserve(services_.size());
    for (const auto& [provider, service] : services_) {
        if (service) out.push_back(provider);
    }
    return out;
}

#pragma once

#include "transcription/model.hpp"
#include "transcription/service.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <vector>

// Provider kind -> backend. Lookups hand out a shared_ptr, so a service
// replaced mid-job stays alive until that job is done with it.
class ServiceRegistry {
public:
    void register_service(ModelProvider provider, std::shared_ptr<TranscriptionService> service);
    void unregister_service(ModelProvider provider);

    std::shared_ptr<TranscriptionService> find(ModelProvider provider) const;
    std::vector<ModelProvider> providers() const;

private:
    mutable std::mutex mu_;
    std::map<ModelProvider, std::shared_ptr<TranscriptionService>> services_;
};

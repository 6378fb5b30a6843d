#include "RequestContextRegistry.hpp"
#include "../utils/Logger.hpp"

namespace Fanout {

void RequestContext::SetMetadata(const std::string& key, nlohmann::json value) {
    std::lock_guard<std::mutex> lock(mutex_);
    metadata_[key] = std::move(value);
}

std::optional<nlohmann::json> RequestContext::GetMetadata(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metadata_.find(key);
    if (it == metadata_.end()) return std::nullopt;
    return *it;
}

nlohmann::json RequestContext::MetadataSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

std::shared_ptr<RequestContext> RequestContextRegistry::Acquire(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(request_id);
    if (it != contexts_.end()) {
        return it->second;
    }
    auto context = std::make_shared<RequestContext>(request_id, RequestContext::Clock::now());
    contexts_.emplace(request_id, context);
    return context;
}

bool RequestContextRegistry::Release(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.erase(request_id) > 0;
}

size_t RequestContextRegistry::ReapStale(std::chrono::milliseconds max_age) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = RequestContext::Clock::now();
        for (auto it = contexts_.begin(); it != contexts_.end();) {
            if (now - it->second->StartTime() > max_age) {
                it = contexts_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        Logger::Log(LogLevel::Info, "context", "Reaped " + std::to_string(removed) + " stale request context(s)");
    }
    return removed;
}

size_t RequestContextRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

}

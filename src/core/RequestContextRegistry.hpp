#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace Fanout {

    // Per-request bookkeeping. Metadata is an open JSON object bag.
    class RequestContext {
    public:
        using Clock = std::chrono::steady_clock;

        RequestContext(std::string request_id, Clock::time_point start_time)
            : request_id_(std::move(request_id)), start_time_(start_time), metadata_(nlohmann::json::object()) {}

        const std::string& RequestId() const { return request_id_; }
        Clock::time_point StartTime() const { return start_time_; }

        void SetMetadata(const std::string& key, nlohmann::json value);
        std::optional<nlohmann::json> GetMetadata(const std::string& key) const;
        nlohmann::json MetadataSnapshot() const;

    private:
        const std::string request_id_;
        const Clock::time_point start_time_;
        nlohmann::json metadata_;
        mutable std::mutex mutex_;
    };

    class RequestContextRegistry {
    public:
        RequestContextRegistry() = default;
        RequestContextRegistry(const RequestContextRegistry&) = delete;
        RequestContextRegistry& operator=(const RequestContextRegistry&) = delete;

        // Returns the live context for `request_id`, creating it on first use.
        std::shared_ptr<RequestContext> Acquire(const std::string& request_id);
        bool Release(const std::string& request_id);

        // Drops contexts started more than `max_age` ago. Returns how many.
        size_t ReapStale(std::chrono::milliseconds max_age);

        size_t Size() const;

    private:
        std::unordered_map<std::string, std::shared_ptr<RequestContext>> contexts_;
        mutable std::mutex mutex_;
    };

}

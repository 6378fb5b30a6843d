#include "ServiceRuntime.hpp"
#include <algorithm>
#include <thread>
#include "../utils/Logger.hpp"

namespace Fanout {

namespace {

size_t ResolveWorkerThreads(int configured) {
    if (configured > 0) return static_cast<size_t>(configured);
    const unsigned int hardware_cores = std::thread::hardware_concurrency();
    return std::max(2u, hardware_cores / 2);
}

CachePolicy MakePolicy(const std::string& eviction, int max_entries, long ttl_ms) {
    if (max_entries <= 0) {
        throw std::invalid_argument("cache max_entries must be positive");
    }
    CachePolicy policy;
    policy.eviction = ParseEvictionKind(eviction);
    policy.max_entries = static_cast<size_t>(max_entries);
    policy.default_ttl = std::chrono::milliseconds(ttl_ms);
    return policy;
}

}

ServiceRuntime::ServiceRuntime(const Config& config)
    : config_(config),
      pool_(ResolveWorkerThreads(config.worker_threads)),
      scheduler_(pool_) {
    caches_.CreateCache<nlohmann::json>(kApiResponsesCache,
        MakePolicy(config_.api_cache_eviction, config_.api_cache_max_entries, config_.api_cache_ttl_ms));
    caches_.CreateCache<std::string>(kStaticFilesCache,
        MakePolicy(config_.static_cache_eviction, config_.static_cache_max_entries, config_.static_cache_ttl_ms));

    sweep_job_ = scheduler_.ScheduleEvery(std::chrono::milliseconds(config_.cache_sweep_interval_ms), [this]() {
        SweepCaches();
    });
    reap_job_ = scheduler_.ScheduleEvery(std::chrono::milliseconds(config_.request_context_reap_interval_ms), [this]() {
        ReapRequestContexts();
    });

    Logger::Log(LogLevel::Info, "runtime", "Service runtime started with " + std::to_string(pool_.size()) + " worker thread(s)");
}

ServiceRuntime::~ServiceRuntime() {
    scheduler_.Cancel(sweep_job_);
    scheduler_.Cancel(reap_job_);
}

RunOptions ServiceRuntime::DefaultRunOptions() const {
    RunOptions options;
    options.max_concurrency = static_cast<size_t>(std::max(1, config_.runner_max_concurrency));
    options.per_task_timeout = std::chrono::milliseconds(config_.runner_task_timeout_ms);
    return options;
}

BatchOptions ServiceRuntime::DefaultBatchOptions() const {
    BatchOptions options;
    options.max_size = static_cast<size_t>(std::max(1, config_.batch_max_size));
    options.max_wait = std::chrono::milliseconds(config_.batch_max_wait_ms);
    return options;
}

ValidatorOptions ServiceRuntime::DefaultValidatorOptions() const {
    ValidatorOptions options;
    options.request_timeout = std::chrono::milliseconds(config_.validation_timeout_ms);
    options.cache_timeout = std::chrono::milliseconds(config_.validation_cache_timeout_ms);
    options.batch_size = static_cast<size_t>(std::max(1, config_.validation_batch_size));
    options.retries = std::max(0, config_.validation_retries);
    options.task_timeout = std::chrono::milliseconds(config_.validation_task_timeout_ms);
    options.cache_max_entries = static_cast<size_t>(std::max(1, config_.validation_cache_max_entries));
    options.expected_content_type = config_.expected_content_type;
    return options;
}

size_t ServiceRuntime::SweepCaches() {
    size_t removed = caches_.SweepExpired();
    if (removed > 0) {
        Logger::Log(LogLevel::Info, "runtime", "Cache sweep removed " + std::to_string(removed) + " expired entries");
    }
    return removed;
}

size_t ServiceRuntime::ReapRequestContexts() {
    return contexts_.ReapStale(std::chrono::milliseconds(config_.request_context_max_age_ms));
}

nlohmann::json ServiceRuntime::Metrics() const {
    nlohmann::json metrics;
    metrics["active_requests"] = contexts_.Size();
    metrics["caches"] = nlohmann::json::object();
    for (const auto& [name, size] : caches_.Sizes()) {
        metrics["caches"][name] = size;
    }
    return metrics;
}

}

#include "ResourceValidator.hpp"
#include "../utils/UrlUtil.hpp"
#include <stdexcept>
#include <thread>

namespace Fanout {

namespace {

// Extra time granted to the fetcher beyond its own transfer timeout before we
// stop waiting for its callback.
constexpr std::chrono::milliseconds kCallbackGrace{1000};

}

ResourceValidator::ResourceValidator(IResourceFetcher& fetcher, CacheRegistry& caches, ValidatorOptions options, DelayFn delay)
    : fetcher_(fetcher), options_(std::move(options)), delay_(std::move(delay)) {
    if (options_.batch_size == 0) {
        throw std::invalid_argument("ValidatorOptions::batch_size must be positive");
    }
    if (options_.retries < 0) {
        throw std::invalid_argument("ValidatorOptions::retries must not be negative");
    }
    if (!delay_) {
        delay_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }

    CachePolicy policy;
    policy.eviction = EvictionKind::Lru;
    policy.max_entries = options_.cache_max_entries;
    policy.default_ttl = options_.cache_timeout;
    cache_ = caches.CreateCache<ValidationRecord>(options_.cache_name, policy);
    limiter_ = std::make_shared<PermitLimiter>(options_.batch_size);
}

ResourceValidator::~ResourceValidator() {
    std::unique_lock<std::mutex> lock(units_mutex_);
    if (outstanding_units_ > 0) {
        Logger::Log(LogLevel::Debug, "validator", "Waiting for " + std::to_string(outstanding_units_) + " unfinished validation unit(s)");
    }
    units_cv_.wait(lock, [this] { return outstanding_units_ == 0; });
}

ResourceValidator::UnitLease::UnitLease(ResourceValidator& owner) : owner(owner) {
    std::lock_guard<std::mutex> lock(owner.units_mutex_);
    ++owner.outstanding_units_;
}

ResourceValidator::UnitLease::~UnitLease() {
    std::lock_guard<std::mutex> lock(owner.units_mutex_);
    --owner.outstanding_units_;
    // Notify under the lock; the owner may be destroyed as soon as it is released.
    owner.units_cv_.notify_all();
}

std::shared_ptr<ResourceValidator::UnitLease> ResourceValidator::TrackUnit() {
    return std::make_shared<UnitLease>(*this);
}

bool ResourceValidator::IsValid(const std::string& url) {
    if (!UrlUtil::IsHttpUrl(url)) {
        Logger::Log(LogLevel::Debug, "validator", "Rejecting malformed or non-HTTP URL: " + url);
        return false;
    }

    if (auto record = cache_->Get(url)) {
        ++hits_;
        return record->is_valid;
    }
    ++misses_;

    // Concurrent callers for the same URL share one check.
    std::promise<bool> promise;
    {
        std::unique_lock<std::mutex> lock(in_flight_mutex_);
        auto it = in_flight_.find(url);
        if (it != in_flight_.end()) {
            std::shared_future<bool> shared = it->second;
            lock.unlock();
            return shared.get();
        }
        in_flight_.emplace(url, promise.get_future().share());
    }

    auto leave_in_flight = [this, &url]() {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_.erase(url);
    };

    bool valid = false;
    try {
        valid = CheckWithRetries(url);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "validator", "Validation of " + url + " aborted: " + e.what());
        valid = false;
    } catch (...) {
        // Nothing is cached; waiters get the same exception and the next caller checks again.
        leave_in_flight();
        promise.set_exception(std::current_exception());
        throw;
    }

    try {
        cache_->Set(url, ValidationRecord{url, valid, std::chrono::system_clock::now()}, options_.cache_timeout);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "validator", "Could not cache validation of " + url + ": " + e.what());
    }
    leave_in_flight();
    promise.set_value(valid);
    return valid;
}

bool ResourceValidator::CheckWithRetries(const std::string& url) {
    for (int attempt = 0;; ++attempt) {
        CheckResult result = CheckOnce(url);
        if (result == CheckResult::Valid) return true;
        if (result == CheckResult::Invalid) return false;

        if (attempt >= options_.retries) {
            Logger::Log(LogLevel::Info, "validator", "Giving up on " + url + " after " + std::to_string(attempt + 1) + " attempt(s)");
            return false;
        }
        const auto backoff = options_.backoff_step * (attempt + 1);
        Logger::Log(LogLevel::Info, "validator", "Retrying validation for " + url + " (attempt " + std::to_string(attempt + 1) +
                                        ") in " + std::to_string(backoff.count()) + " ms");
        delay_(backoff);
    }
}

ResourceValidator::CheckResult ResourceValidator::CheckOnce(const std::string& url) {
    ++checks_;

    FetchRequest request;
    request.url = url;
    request.timeout = options_.request_timeout;
    request.headers.push_back("Accept: " + options_.accept_header);

    auto promise = std::make_shared<std::promise<FetchResult>>();
    std::future<FetchResult> future = promise->get_future();
    fetcher_.Fetch(request, [promise](FetchResult result) { promise->set_value(std::move(result)); });

    if (future.wait_for(options_.request_timeout + kCallbackGrace) != std::future_status::ready) {
        Logger::Log(LogLevel::Info, "validator", "Validation request for " + url + " did not complete in time");
        return CheckResult::TransientFailure;
    }

    FetchResult result = future.get();
    if (result.TransportFailed()) {
        Logger::Log(LogLevel::Info, "validator", "Validation request for " + url + " failed: " + result.error);
        return CheckResult::TransientFailure;
    }
    if (result.status_code < 200 || result.status_code >= 300) {
        Logger::Log(LogLevel::Debug, "validator", url + " answered HTTP " + std::to_string(result.status_code));
        return CheckResult::Invalid;
    }
    if (!UrlUtil::StartsWithIgnoreCase(result.content_type, options_.expected_content_type)) {
        Logger::Log(LogLevel::Debug, "validator", url + " has unexpected content type '" + result.content_type + "'");
        return CheckResult::Invalid;
    }
    return CheckResult::Valid;
}

RunOptions ResourceValidator::BatchRunOptions() const {
    RunOptions run;
    run.max_concurrency = options_.batch_size;
    run.per_task_timeout = options_.task_timeout;
    run.failure_policy = FailurePolicy::BestEffort;
    return run;
}

std::unordered_map<std::string, bool> ResourceValidator::ValidateMany(const std::vector<std::string>& urls) {
    std::unordered_map<std::string, bool> results;
    for (const auto& url : urls) results.emplace(url, false);

    for (size_t start = 0; start < urls.size(); start += options_.batch_size) {
        const size_t end = std::min(urls.size(), start + options_.batch_size);
        std::vector<std::function<std::pair<std::string, bool>()>> units;
        units.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            const std::string url = urls[i];
            units.push_back([this, url, lease = TrackUnit()]() { return std::make_pair(url, IsValid(url)); });
        }

        // Units that timed out or threw are absent here and stay false.
        auto batch = RunParallel<std::pair<std::string, bool>>(std::move(units), BatchRunOptions(), limiter_);
        for (const auto& [url, valid] : batch) {
            results[url] = valid;
        }
    }
    return results;
}

ValidatorStats ResourceValidator::Stats() const {
    ValidatorStats stats;
    stats.cache_size = cache_->Size();
    stats.cache_hits = hits_.load();
    stats.cache_misses = misses_.load();
    stats.checks_issued = checks_.load();
    return stats;
}

void ResourceValidator::ClearCache() {
    cache_->Clear();
    Logger::Log(LogLevel::Info, "validator", "Resource validation cache cleared");
}

}

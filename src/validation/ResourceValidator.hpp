#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "../cache/CacheRegistry.hpp"
#include "../concurrency/ParallelRunner.hpp"
#include "../concurrency/PermitLimiter.hpp"
#include "../interfaces/IResourceFetcher.hpp"
#include "../utils/Logger.hpp"

namespace Fanout {

    struct ValidatorOptions {
        std::chrono::milliseconds request_timeout{5000};
        std::chrono::milliseconds cache_timeout{300000};
        size_t batch_size = 10;
        int retries = 2;
        std::chrono::milliseconds backoff_step{1000};   // delay before retry n is n * backoff_step
        std::chrono::milliseconds task_timeout{30000};  // per URL, retries included
        std::string expected_content_type = "image/";
        std::string accept_header = "image/*";
        std::string cache_name = "resource-validation";
        size_t cache_max_entries = 10000;
    };

    struct ValidationRecord {
        std::string resource_key;
        bool is_valid = false;
        std::chrono::system_clock::time_point checked_at;
    };

    struct ValidatorStats {
        size_t cache_size = 0;
        size_t cache_hits = 0;
        size_t cache_misses = 0;
        size_t checks_issued = 0;
    };

    // Confirms that remote resources answer a HEAD request with a 2xx status
    // and the expected content type. Every outcome is cached in a named cache
    // of the registry for cache_timeout, so the registry sweep also purges it.
    //
    // All batch work of one validator shares a single permit pool of
    // batch_size. The fetcher and the registry must outlive the validator;
    // destruction blocks until work units abandoned by a task timeout have
    // finished with them.
    class ResourceValidator {
    public:
        using DelayFn = std::function<void(std::chrono::milliseconds)>;

        // `delay` defaults to sleeping the calling thread.
        ResourceValidator(IResourceFetcher& fetcher, CacheRegistry& caches, ValidatorOptions options = {},
                          DelayFn delay = {});
        ~ResourceValidator();

        ResourceValidator(const ResourceValidator&) = delete;
        ResourceValidator& operator=(const ResourceValidator&) = delete;

        bool IsValid(const std::string& url);

        // Maps every input URL to its validity.
        std::unordered_map<std::string, bool> ValidateMany(const std::vector<std::string>& urls);

        // Keeps the items whose URL (as returned by url_of) validates, in their
        // original order. Items with an empty URL are dropped.
        template <typename Item, typename UrlOf>
        std::vector<Item> FilterValid(const std::vector<Item>& items, UrlOf url_of) {
            std::vector<Item> kept;
            if (items.empty()) return kept;

            Logger::Log(LogLevel::Info, "validator", "Validating " + std::to_string(items.size()) + " candidate resource(s)");
            for (size_t start = 0; start < items.size(); start += options_.batch_size) {
                const size_t end = std::min(items.size(), start + options_.batch_size);

                std::vector<std::function<std::optional<size_t>()>> units;
                units.reserve(end - start);
                for (size_t i = start; i < end; ++i) {
                    std::string url = url_of(items[i]);
                    if (url.empty()) {
                        Logger::Log(LogLevel::Info, "validator", "Dropping candidate #" + std::to_string(i) + ": no resource URL");
                        continue;
                    }
                    units.push_back([this, i, url, lease = TrackUnit()]() -> std::optional<size_t> {
                        if (IsValid(url)) return i;
                        Logger::Log(LogLevel::Info, "validator", "Dropping candidate #" + std::to_string(i) + " with invalid resource: " + url);
                        return std::nullopt;
                    });
                }

                auto valid = RunParallel<std::optional<size_t>>(std::move(units), BatchRunOptions(), limiter_);
                std::vector<size_t> indices;
                for (const auto& index : valid) {
                    if (index) indices.push_back(*index);
                }
                // Completion order is arbitrary; restore input order.
                std::sort(indices.begin(), indices.end());
                for (size_t index : indices) kept.push_back(items[index]);
            }

            const size_t dropped = items.size() - kept.size();
            if (dropped > 0) {
                Logger::Log(LogLevel::Info, "validator", "Filtered out " + std::to_string(dropped) + " candidate(s), " +
                                                std::to_string(kept.size()) + " remaining");
            }
            return kept;
        }

        ValidatorStats Stats() const;
        void ClearCache();

        const ValidatorOptions& Options() const { return options_; }

    private:
        enum class CheckResult { Valid, Invalid, TransientFailure };

        CheckResult CheckOnce(const std::string& url);
        bool CheckWithRetries(const std::string& url);
        RunOptions BatchRunOptions() const;

        // Held by every batch work unit; the destructor waits for all leases.
        struct UnitLease {
            explicit UnitLease(ResourceValidator& owner);
            ~UnitLease();
            ResourceValidator& owner;
        };
        std::shared_ptr<UnitLease> TrackUnit();

        IResourceFetcher& fetcher_;
        ValidatorOptions options_;
        DelayFn delay_;
        std::shared_ptr<TtlCache<ValidationRecord>> cache_;
        std::shared_ptr<PermitLimiter> limiter_;

        std::mutex units_mutex_;
        std::condition_variable units_cv_;
        size_t outstanding_units_ = 0;

        std::mutex in_flight_mutex_;
        std::unordered_map<std::string, std::shared_future<bool>> in_flight_;

        std::atomic<size_t> hits_{0};
        std::atomic<size_t> misses_{0};
        std::atomic<size_t> checks_{0};
    };

}

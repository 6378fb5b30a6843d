#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "Scheduler.hpp"
#include "RequestContextRegistry.hpp"
#include "../../config/Config.hpp"
#include "../cache/CacheRegistry.hpp"
#include "../concurrency/BatchCoalescer.hpp"
#include "../concurrency/ParallelRunner.hpp"
#include "../utils/ThreadPool.hpp"
#include "../validation/ResourceValidator.hpp"

namespace Fanout {

    // Well-known cache names registered by ServiceRuntime.
    inline const std::string kApiResponsesCache = "api-responses";
    inline const std::string kStaticFilesCache = "static-files";

    // Owns the shared runtime state of one service instance: worker pool,
    // timer service, named caches and the request context table. Periodic
    // cache sweeps and context reaping start on construction and stop on
    // destruction.
    class ServiceRuntime {
    public:
        explicit ServiceRuntime(const Config& config);
        ~ServiceRuntime();

        ServiceRuntime(const ServiceRuntime&) = delete;
        ServiceRuntime& operator=(const ServiceRuntime&) = delete;

        ThreadPool& Pool() { return pool_; }
        Scheduler& Timers() { return scheduler_; }
        CacheRegistry& Caches() { return caches_; }
        RequestContextRegistry& RequestContexts() { return contexts_; }

        RunOptions DefaultRunOptions() const;
        BatchOptions DefaultBatchOptions() const;
        ValidatorOptions DefaultValidatorOptions() const;

        template <typename Item, typename Result>
        std::unique_ptr<BatchCoalescer<Item, Result>> MakeCoalescer() {
            return std::make_unique<BatchCoalescer<Item, Result>>(scheduler_, pool_);
        }

        // One sweep/reap pass now, outside the periodic schedule.
        size_t SweepCaches();
        size_t ReapRequestContexts();

        // {"active_requests": n, "caches": {"<name>": entries, ...}}
        nlohmann::json Metrics() const;

    private:
        const Config config_;
        // Declared before the pool and scheduler so they outlive any job touching them.
        CacheRegistry caches_;
        RequestContextRegistry contexts_;
        ThreadPool pool_;
        Scheduler scheduler_;
        Scheduler::JobId sweep_job_ = 0;
        Scheduler::JobId reap_job_ = 0;
    };

}

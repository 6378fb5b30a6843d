#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace Fanout {
    struct Config {
        std::string log_level = "info";
        std::string log_dir;                      // empty: console only
        int worker_threads = 0;                   // 0: half of the hardware threads, at least 2

        // Parallel runner defaults
        int runner_max_concurrency = 10;
        long runner_task_timeout_ms = 30000;

        // Batch coalescer defaults
        int batch_max_size = 10;
        long batch_max_wait_ms = 100;

        // Named caches
        long cache_sweep_interval_ms = 300000;
        std::string api_cache_eviction = "lru";
        int api_cache_max_entries = 1000;
        long api_cache_ttl_ms = 300000;
        std::string static_cache_eviction = "fifo";
        int static_cache_max_entries = 500;
        long static_cache_ttl_ms = 3600000;

        // Request context registry
        long request_context_max_age_ms = 600000;
        long request_context_reap_interval_ms = 300000;

        // Resource validator
        long validation_timeout_ms = 5000;
        long validation_cache_timeout_ms = 300000;
        int validation_batch_size = 10;
        int validation_retries = 2;
        long validation_task_timeout_ms = 30000;
        int validation_cache_max_entries = 10000;
        std::string expected_content_type = "image/";
        std::string http_user_agent = "Mozilla/5.0 (compatible; ArtRecommendationBot/1.0)";
        long http_max_redirects = 5;

        void Load(const std::string& path);
        void CreateDefault(const std::string& path) const;
        nlohmann::json ToJson() const;
    };
}

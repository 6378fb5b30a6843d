#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"

namespace Fanout {

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["log_level"] = log_level;
    data["log_dir"] = log_dir;
    data["worker_threads"] = worker_threads;
    data["runner_max_concurrency"] = runner_max_concurrency;
    data["runner_task_timeout_ms"] = runner_task_timeout_ms;
    data["batch_max_size"] = batch_max_size;
    data["batch_max_wait_ms"] = batch_max_wait_ms;
    data["cache_sweep_interval_ms"] = cache_sweep_interval_ms;
    data["api_cache_eviction"] = api_cache_eviction;
    data["api_cache_max_entries"] = api_cache_max_entries;
    data["api_cache_ttl_ms"] = api_cache_ttl_ms;
    data["static_cache_eviction"] = static_cache_eviction;
    data["static_cache_max_entries"] = static_cache_max_entries;
    data["static_cache_ttl_ms"] = static_cache_ttl_ms;
    data["request_context_max_age_ms"] = request_context_max_age_ms;
    data["request_context_reap_interval_ms"] = request_context_reap_interval_ms;
    data["validation_timeout_ms"] = validation_timeout_ms;
    data["validation_cache_timeout_ms"] = validation_cache_timeout_ms;
    data["validation_batch_size"] = validation_batch_size;
    data["validation_retries"] = validation_retries;
    data["validation_task_timeout_ms"] = validation_task_timeout_ms;
    data["validation_cache_max_entries"] = validation_cache_max_entries;
    data["expected_content_type"] = expected_content_type;
    data["http_user_agent"] = http_user_agent;
    data["http_max_redirects"] = http_max_redirects;
    return data;
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("Config file must hold a JSON object: " + path);
    }

    try {
        log_level = data.value("log_level", log_level);
        log_dir = data.value("log_dir", log_dir);
        worker_threads = data.value("worker_threads", worker_threads);
        runner_max_concurrency = data.value("runner_max_concurrency", runner_max_concurrency);
        runner_task_timeout_ms = data.value("runner_task_timeout_ms", runner_task_timeout_ms);
        batch_max_size = data.value("batch_max_size", batch_max_size);
        batch_max_wait_ms = data.value("batch_max_wait_ms", batch_max_wait_ms);
        cache_sweep_interval_ms = data.value("cache_sweep_interval_ms", cache_sweep_interval_ms);
        api_cache_eviction = data.value("api_cache_eviction", api_cache_eviction);
        api_cache_max_entries = data.value("api_cache_max_entries", api_cache_max_entries);
        api_cache_ttl_ms = data.value("api_cache_ttl_ms", api_cache_ttl_ms);
        static_cache_eviction = data.value("static_cache_eviction", static_cache_eviction);
        static_cache_max_entries = data.value("static_cache_max_entries", static_cache_max_entries);
        static_cache_ttl_ms = data.value("static_cache_ttl_ms", static_cache_ttl_ms);
        request_context_max_age_ms = data.value("request_context_max_age_ms", request_context_max_age_ms);
        request_context_reap_interval_ms = data.value("request_context_reap_interval_ms", request_context_reap_interval_ms);
        validation_timeout_ms = data.value("validation_timeout_ms", validation_timeout_ms);
        validation_cache_timeout_ms = data.value("validation_cache_timeout_ms", validation_cache_timeout_ms);
        validation_batch_size = data.value("validation_batch_size", validation_batch_size);
        validation_retries = data.value("validation_retries", validation_retries);
        validation_task_timeout_ms = data.value("validation_task_timeout_ms", validation_task_timeout_ms);
        validation_cache_max_entries = data.value("validation_cache_max_entries", validation_cache_max_entries);
        expected_content_type = data.value("expected_content_type", expected_content_type);
        http_user_agent = data.value("http_user_agent", http_user_agent);
        http_max_redirects = data.value("http_max_redirects", http_max_redirects);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("Wrong value type in config file " + path + ": " + e.what());
    }

    // Write back missing keys so existing config.json reflects newly added options.
    // This is non-destructive: preserves unknown keys and only appends missing ones.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "config", "Could not back up config before updating it: " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            // Startup continues with the values already loaded.
            Logger::Log(LogLevel::Warn, "config", "Could not write new config keys back to " + path);
        }
    }
}

void Config::CreateDefault(const std::string& path_str) const {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}

#include <chrono>
#include <iostream>
#include <iomanip>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../config/Config.hpp"
#include "core/ServiceRuntime.hpp"
#include "network/HttpFetcher.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtil.hpp"
#include "validation/ResourceValidator.hpp"

namespace {

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config <path>] [--quiet] [url ...]\n"
              << "Checks that each URL answers HEAD with the expected content type.\n"
              << "Without URL arguments, URLs are read from standard input.\n"
              << "  --quiet, -q   no log output on stderr\n";
}

// Returns false when the process should exit right away with `exit_code`.
bool LoadConfig(Fanout::Config& config, const std::string& config_path_str, int& exit_code) {
    try {
        config.Load(config_path_str);
        Fanout::Logger::Log(Fanout::LogLevel::Info, "Configuration loaded from: " + config_path_str);
        return true;
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") == std::string::npos) {
            Fanout::Logger::Log(Fanout::LogLevel::Error, "Failed to load config: " + error_message);
            exit_code = 1;
            return false;
        }
    }

    Fanout::Logger::Log(Fanout::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
    try {
        config.CreateDefault(config_path_str);
    } catch (const std::exception& create_e) {
        // Defaults are still usable; only persisting them failed.
        Fanout::Logger::Log(Fanout::LogLevel::Warn, "Failed to create default config: " + std::string(create_e.what()));
    }
    return true;
}

}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        Fanout::Logger::Log(Fanout::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }

    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    std::string config_path_str = (exe_dir / "config" / "config.json").string();
    std::vector<std::string> urls;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }
        if (arg == "--quiet" || arg == "-q") {
            Fanout::Logger::SetConsoleEnabled(false);
            continue;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                PrintUsage(argv[0]);
                return 2;
            }
            config_path_str = argv[++i];
            continue;
        }
        urls.push_back(arg);
    }

    Fanout::Config config;
    int exit_code = 0;
    if (!LoadConfig(config, config_path_str, exit_code)) {
        return exit_code;
    }
    if (!config.log_dir.empty()) {
        Fanout::Logger::Init(config.log_dir, Fanout::Logger::FromString(config.log_level));
    } else {
        Fanout::Logger::SetMinLevel(Fanout::Logger::FromString(config.log_level));
    }

    if (urls.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            for (auto& url : Fanout::UrlUtil::ExtractUrls(line)) urls.push_back(std::move(url));
        }
    }
    if (urls.empty()) {
        Fanout::Logger::Log(Fanout::LogLevel::Warn, "No URLs to validate.");
        return 0;
    }

    // Initialize global resources
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        Fanout::Logger::Log(Fanout::LogLevel::Error, "curl_global_init failed");
        return 1;
    }

    nlohmann::json output = nlohmann::json::object();
    try {
        Fanout::ServiceRuntime runtime(config);

        Fanout::HttpFetcherOptions fetcher_options;
        fetcher_options.user_agent = config.http_user_agent;
        fetcher_options.max_redirects = config.http_max_redirects;
        Fanout::HttpFetcher fetcher(fetcher_options);
        Fanout::ResourceValidator validator(fetcher, runtime.Caches(), runtime.DefaultValidatorOptions());

        const std::string request_id = "cli-" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
        auto context = runtime.RequestContexts().Acquire(request_id);
        context->SetMetadata("url_count", urls.size());

        auto results = validator.ValidateMany(urls);
        for (const auto& url : urls) {
            output[url] = results[url];
        }

        auto stats = validator.Stats();
        Fanout::Logger::Log(Fanout::LogLevel::Debug, "Validator stats: hits=" + std::to_string(stats.cache_hits) +
                                                         " misses=" + std::to_string(stats.cache_misses) +
                                                         " checks=" + std::to_string(stats.checks_issued));
        Fanout::Logger::Log(Fanout::LogLevel::Debug, "Runtime metrics: " + runtime.Metrics().dump());
        runtime.RequestContexts().Release(request_id);
    } catch (const std::exception& e) {
        Fanout::Logger::Log(Fanout::LogLevel::Error, "Validation run failed: " + std::string(e.what()));
        curl_global_cleanup();
        return 1;
    }

    std::cout << std::setw(2) << output << std::endl;

    // Cleanup global resources
    curl_global_cleanup();
    return 0;
}

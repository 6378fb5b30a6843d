#include "HttpFetcher.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <stdexcept>
#include <vector>
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string url;
    Fanout::IResourceFetcher::Callback callback;
    curl_slist* headers = nullptr;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    ~TransferContext() {
        if (headers) curl_slist_free_all(headers);
    }
};

// HEAD responses have no body; swallow anything a misbehaving server sends.
size_t DiscardBody(void*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

// Helper to create and configure a cURL easy handle
CURL* CreateEasyHandle(const Fanout::FetchRequest& request, const Fanout::HttpFetcherOptions& options, TransferContext* transfer_ctx) {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    for (const auto& header : request.headers) {
        curl_slist* appended = curl_slist_append(transfer_ctx->headers, header.c_str());
        if (!appended) {
            curl_easy_cleanup(curl);
            return nullptr;
        }
        transfer_ctx->headers = appended;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, DiscardBody);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, transfer_ctx->error_buffer);
    curl_easy_setopt(curl, CURLOPT_PRIVATE, transfer_ctx);
    if (transfer_ctx->headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, transfer_ctx->headers);
    }

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    return curl;
}

void InvokeCallback(TransferContext* transfer_ctx, Fanout::FetchResult result) {
    if (!transfer_ctx->callback) return;
    try {
        transfer_ctx->callback(std::move(result));
    } catch (const std::exception& e) {
        Fanout::Logger::Log(Fanout::LogLevel::Error, "http", "Exception in fetch callback: " + std::string(e.what()));
    }
}

} // anonymous namespace

namespace Fanout {

HttpFetcher::HttpFetcher(HttpFetcherOptions options) : options_(std::move(options)) {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    worker_thread_ = std::thread(&HttpFetcher::Run, this);
}

HttpFetcher::~HttpFetcher() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    curl_multi_wakeup(multi_handle_);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (multi_handle_) {
        curl_multi_cleanup(multi_handle_);
    }
}

void HttpFetcher::Fetch(const FetchRequest& request, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            FetchResult result;
            result.error = "fetcher is shut down";
            lock.unlock();
            cb(std::move(result));
            return;
        }
        pending_requests_.push_back({request, std::move(cb)});
    }
    cv_.notify_one();
    // Interrupt curl_multi_poll so the new request starts right away
    curl_multi_wakeup(multi_handle_);
}

void HttpFetcher::AbortActive() {
    for (void* handle : active_handles_) {
        CURL* easy_handle = static_cast<CURL*>(handle);
        TransferContext* transfer_ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        if (transfer_ctx) {
            FetchResult result;
            result.error = "fetcher shut down before completion";
            InvokeCallback(transfer_ctx, std::move(result));
            delete transfer_ctx;
        }
    }
    active_handles_.clear();
}

void HttpFetcher::Run() {
    Logger::Log(LogLevel::Debug, "http", "HttpFetcher worker thread started.");
    int still_running = 0;

    for (;;) {
        std::vector<Request> current_requests;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this, &still_running] { return stop_ || !pending_requests_.empty() || still_running > 0; });
            if (stop_) {
                std::swap(current_requests, pending_requests_);
                lock.unlock();
                for (auto& req : current_requests) {
                    TransferContext transfer_ctx{req.request.url, std::move(req.callback)};
                    FetchResult result;
                    result.error = "fetcher shut down before start";
                    InvokeCallback(&transfer_ctx, std::move(result));
                }
                AbortActive();
                break;
            }
            std::swap(current_requests, pending_requests_);
        }

        for (auto& req : current_requests) {
            auto* transfer_ctx = new TransferContext{req.request.url, std::move(req.callback)};
            CURL* easy_handle = CreateEasyHandle(req.request, options_, transfer_ctx);
            if (easy_handle && curl_multi_add_handle(multi_handle_, easy_handle) == CURLM_OK) {
                active_handles_.push_back(easy_handle);
                Logger::Log(LogLevel::Debug, "http", "Added HEAD request for URL: " + req.request.url);
            } else {
                if (easy_handle) curl_easy_cleanup(easy_handle);
                Logger::Log(LogLevel::Error, "http", "Failed to create cURL easy handle for: " + req.request.url);
                FetchResult result;
                result.error = "failed to create transfer";
                InvokeCallback(transfer_ctx, std::move(result));
                delete transfer_ctx;
            }
        }

        curl_multi_perform(multi_handle_, &still_running);

        int msgs_in_queue;
        CURLMsg* msg;
        while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
            if (msg->msg != CURLMSG_DONE) continue;

            CURL* easy_handle = msg->easy_handle;
            TransferContext* transfer_ctx = nullptr;
            curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);

            FetchResult result;
            if (msg->data.result == CURLE_OK) {
                curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &result.status_code);
                char* eff_url = nullptr;
                curl_easy_getinfo(easy_handle, CURLINFO_EFFECTIVE_URL, &eff_url);
                if (eff_url) result.effective_url = eff_url;
                char* content_type = nullptr;
                curl_easy_getinfo(easy_handle, CURLINFO_CONTENT_TYPE, &content_type);
                if (content_type) result.content_type = content_type;
            } else {
                result.error = transfer_ctx->error_buffer;
                if (result.error.empty()) {
                    result.error = curl_easy_strerror(msg->data.result);
                }
            }
            Logger::Log(LogLevel::Debug, "http", "HEAD " + transfer_ctx->url + " -> " +
                                         (result.TransportFailed() ? result.error : std::to_string(result.status_code)));

            curl_multi_remove_handle(multi_handle_, easy_handle);
            curl_easy_cleanup(easy_handle);
            active_handles_.erase(std::remove(active_handles_.begin(), active_handles_.end(), easy_handle), active_handles_.end());

            InvokeCallback(transfer_ctx, std::move(result));
            delete transfer_ctx;
        }

        if (still_running > 0) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }
}

}

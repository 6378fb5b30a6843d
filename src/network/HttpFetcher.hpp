#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include <condition_variable>
#include "../interfaces/IResourceFetcher.hpp"

// Forward declare CURLM
typedef void CURLM;

namespace Fanout {

struct HttpFetcherOptions {
    std::string user_agent = "Mozilla/5.0 (compatible; ArtRecommendationBot/1.0)";
    long max_redirects = 5;
};

// Runs HEAD requests on a libcurl multi handle owned by one worker thread.
// curl_global_init() must have been called before construction.
class HttpFetcher : public IResourceFetcher {
public:
    explicit HttpFetcher(HttpFetcherOptions options = {});
    ~HttpFetcher() override;

    // Non-copyable
    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    void Fetch(const FetchRequest& request, Callback cb) override;

private:
    void Run();
    void AbortActive();

    HttpFetcherOptions options_;
    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;

    struct Request {
        FetchRequest request;
        Callback callback;
    };
    std::vector<Request> pending_requests_;
    std::vector<void*> active_handles_; // CURL*, touched only by the worker thread
};

}

#include <catch2/catch_all.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "validation/ResourceValidator.hpp"

using namespace Fanout;
using namespace std::chrono_literals;

namespace {

FetchResult Ok(const std::string& content_type) {
    FetchResult r;
    r.status_code = 200;
    r.content_type = content_type;
    return r;
}

FetchResult Status(long code) {
    FetchResult r;
    r.status_code = code;
    r.content_type = "text/html";
    return r;
}

FetchResult NetworkError() {
    FetchResult r;
    r.error = "Couldn't connect to server";
    return r;
}

// Thrown by the fetcher for URLs marked with Crash(); not a std::exception.
struct FetcherCrash {};

// Answers from a per-URL script; the last scripted result repeats.
// Unknown URLs answer 404.
class FakeFetcher : public IResourceFetcher {
public:
    explicit FakeFetcher(std::chrono::milliseconds latency = 0ms) : latency_(latency) {}

    ~FakeFetcher() override {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            threads.swap(threads_);
        }
        for (auto& t : threads) t.join();
    }

    void Script(const std::string& url, std::deque<FetchResult> results) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[url] = std::move(results);
    }

    void Slow(const std::string& url, std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        slow_[url] = latency;
    }

    void Crash(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        crash_[url] = true;
    }

    void Fetch(const FetchRequest& request, Callback cb) override {
        FetchResult result = Status(404);
        std::chrono::milliseconds latency = latency_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_[request.url];
            last_request_ = request;
            if (crash_[request.url]) throw FetcherCrash{};
            auto it = scripts_.find(request.url);
            if (it != scripts_.end() && !it->second.empty()) {
                result = it->second.front();
                if (it->second.size() > 1) it->second.pop_front();
            }
            auto slow = slow_.find(request.url);
            if (slow != slow_.end()) latency = slow->second;
        }

        const int now = ++in_flight_;
        int seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {}

        if (latency.count() == 0) {
            --in_flight_;
            ++answered_;
            cb(std::move(result));
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        threads_.emplace_back([this, cb = std::move(cb), result, latency]() {
            std::this_thread::sleep_for(latency);
            --in_flight_;
            ++answered_;
            cb(result);
        });
    }

    int Calls(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[url];
    }

    int TotalCalls() {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& entry : calls_) total += entry.second;
        return total;
    }

    FetchRequest LastRequest() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }

    // Highest number of requests outstanding at the same time.
    int Peak() const { return peak_.load(); }
    // Requests whose answer has been handed to the callback.
    int Answered() const { return answered_.load(); }

private:
    std::chrono::milliseconds latency_;
    std::mutex mutex_;
    std::map<std::string, std::deque<FetchResult>> scripts_;
    std::map<std::string, std::chrono::milliseconds> slow_;
    std::map<std::string, bool> crash_;
    std::map<std::string, int> calls_;
    FetchRequest last_request_;
    std::vector<std::thread> threads_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> answered_{0};
};

struct DelayRecorder {
    std::mutex mutex;
    std::vector<std::chrono::milliseconds> delays;

    ResourceValidator::DelayFn Fn() {
        return [this](std::chrono::milliseconds d) {
            std::lock_guard<std::mutex> lock(mutex);
            delays.push_back(d);
        };
    }
};

struct Candidate {
    std::string id;
    std::string image_url;
};

}

TEST_CASE("A validated URL is served from cache afterwards") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    fetcher.Script("https://img.test/a.png", {Ok("image/png")});
    ResourceValidator validator(fetcher, caches);

    CHECK(validator.IsValid("https://img.test/a.png"));
    CHECK(validator.IsValid("https://img.test/a.png"));
    CHECK(fetcher.Calls("https://img.test/a.png") == 1);

    auto stats = validator.Stats();
    CHECK(stats.cache_size == 1);
    CHECK(stats.cache_hits == 1);
    CHECK(stats.cache_misses == 1);
    CHECK(stats.checks_issued == 1);
}

TEST_CASE("HEAD request carries the Accept header and timeout") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    ValidatorOptions options;
    options.request_timeout = 1234ms;
    ResourceValidator validator(fetcher, caches, options);

    validator.IsValid("https://img.test/x.png");
    auto request = fetcher.LastRequest();
    CHECK(request.url == "https://img.test/x.png");
    CHECK(request.timeout == 1234ms);
    REQUIRE(request.headers.size() == 1);
    CHECK(request.headers[0] == "Accept: image/*");
}

TEST_CASE("Non-2xx and non-image answers are invalid without retry") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    DelayRecorder recorder;
    fetcher.Script("https://img.test/missing.png", {Status(404)});
    fetcher.Script("https://img.test/page", {Ok("text/html; charset=utf-8")});
    fetcher.Script("https://img.test/boom.png", {Status(503)});
    ResourceValidator validator(fetcher, caches, {}, recorder.Fn());

    CHECK_FALSE(validator.IsValid("https://img.test/missing.png"));
    CHECK_FALSE(validator.IsValid("https://img.test/page"));
    CHECK_FALSE(validator.IsValid("https://img.test/boom.png"));
    CHECK(fetcher.TotalCalls() == 3);
    CHECK(recorder.delays.empty());
}

TEST_CASE("Content type matching ignores case and parameters") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    fetcher.Script("https://img.test/a.jpg", {Ok("IMAGE/JPEG; charset=binary")});
    ResourceValidator validator(fetcher, caches);
    CHECK(validator.IsValid("https://img.test/a.jpg"));
}

TEST_CASE("Transport failures are retried with a linear backoff") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    DelayRecorder recorder;
    fetcher.Script("https://img.test/flaky.png", {NetworkError(), NetworkError(), Ok("image/png")});
    ResourceValidator validator(fetcher, caches, {}, recorder.Fn());

    CHECK(validator.IsValid("https://img.test/flaky.png"));
    CHECK(fetcher.Calls("https://img.test/flaky.png") == 3);
    CHECK(recorder.delays == std::vector<std::chrono::milliseconds>{1000ms, 2000ms});
}

TEST_CASE("Exhausted retries yield false and the failure is cached") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    DelayRecorder recorder;
    fetcher.Script("https://down.test/a.png", {NetworkError()});
    ResourceValidator validator(fetcher, caches, {}, recorder.Fn());

    CHECK_FALSE(validator.IsValid("https://down.test/a.png"));
    CHECK(fetcher.Calls("https://down.test/a.png") == 3);

    CHECK_FALSE(validator.IsValid("https://down.test/a.png"));
    CHECK(fetcher.Calls("https://down.test/a.png") == 3);
}

TEST_CASE("Malformed URLs are rejected without a request") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    ResourceValidator validator(fetcher, caches);

    CHECK_FALSE(validator.IsValid("not a url"));
    CHECK_FALSE(validator.IsValid("ftp://img.test/a.png"));
    CHECK_FALSE(validator.IsValid(""));
    CHECK(fetcher.TotalCalls() == 0);
    CHECK(validator.Stats().cache_size == 0);
}

TEST_CASE("ValidateMany reports every URL across batches") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    fetcher.Script("https://img.test/1.png", {Ok("image/png")});
    fetcher.Script("https://img.test/3.png", {Ok("image/gif")});
    fetcher.Script("https://img.test/5.png", {Ok("image/webp")});
    ValidatorOptions options;
    options.batch_size = 2;
    ResourceValidator validator(fetcher, caches, options);

    auto results = validator.ValidateMany({"https://img.test/1.png", "https://img.test/2.png", "https://img.test/3.png",
                                           "https://img.test/4.png", "https://img.test/5.png", "bogus"});
    REQUIRE(results.size() == 6);
    CHECK(results["https://img.test/1.png"]);
    CHECK_FALSE(results["https://img.test/2.png"]);
    CHECK(results["https://img.test/3.png"]);
    CHECK_FALSE(results["https://img.test/4.png"]);
    CHECK(results["https://img.test/5.png"]);
    CHECK_FALSE(results["bogus"]);
}

TEST_CASE("FilterValid keeps valid items in their original order") {
    FakeFetcher fetcher(5ms);
    CacheRegistry caches;
    fetcher.Script("https://img.test/a.png", {Ok("image/png")});
    fetcher.Script("https://img.test/b.png", {Status(404)});
    fetcher.Script("https://img.test/c.png", {Ok("image/png")});
    ResourceValidator validator(fetcher, caches);

    std::vector<Candidate> items{
        {"a", "https://img.test/a.png"},
        {"b", "https://img.test/b.png"},
        {"c", "https://img.test/c.png"},
        {"d", ""},
    };
    auto kept = validator.FilterValid(items, [](const Candidate& c) { return c.image_url; });

    REQUIRE(kept.size() == 2);
    CHECK(kept[0].id == "a");
    CHECK(kept[1].id == "c");
}

TEST_CASE("FilterValid preserves order across many batches") {
    FakeFetcher fetcher(2ms);
    CacheRegistry caches;
    ValidatorOptions options;
    options.batch_size = 4;

    std::vector<Candidate> items;
    std::vector<std::string> expected;
    for (int i = 0; i < 25; ++i) {
        std::string url = "https://img.test/" + std::to_string(i) + ".png";
        items.push_back({std::to_string(i), url});
        if (i % 3 != 0) {
            fetcher.Script(url, {Ok("image/png")});
            expected.push_back(std::to_string(i));
        }
    }
    ResourceValidator validator(fetcher, caches, options);

    auto kept = validator.FilterValid(items, [](const Candidate& c) { return c.image_url; });
    std::vector<std::string> ids;
    for (const auto& c : kept) ids.push_back(c.id);
    CHECK(ids == expected);
}

TEST_CASE("An expired cache entry triggers a new check") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    fetcher.Script("https://img.test/a.png", {Ok("image/png")});
    ValidatorOptions options;
    options.cache_timeout = 50ms;
    ResourceValidator validator(fetcher, caches, options);

    CHECK(validator.IsValid("https://img.test/a.png"));
    std::this_thread::sleep_for(120ms);
    CHECK(validator.IsValid("https://img.test/a.png"));
    CHECK(fetcher.Calls("https://img.test/a.png") == 2);
}

TEST_CASE("The registry sweep purges expired validation entries") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    ValidatorOptions options;
    options.cache_timeout = 30ms;
    ResourceValidator validator(fetcher, caches, options);

    validator.IsValid("https://img.test/a.png");
    validator.IsValid("https://img.test/b.png");
    REQUIRE(validator.Stats().cache_size == 2);
    std::this_thread::sleep_for(80ms);

    CHECK(caches.SweepExpired() == 2);
    CHECK(validator.Stats().cache_size == 0);
}

TEST_CASE("Concurrent checks of one URL share a single request") {
    FakeFetcher fetcher(150ms);
    CacheRegistry caches;
    fetcher.Script("https://img.test/a.png", {Ok("image/png")});
    ResourceValidator validator(fetcher, caches);

    std::atomic<int> valid{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            if (validator.IsValid("https://img.test/a.png")) ++valid;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(valid.load() == 4);
    CHECK(fetcher.Calls("https://img.test/a.png") == 1);
}

TEST_CASE("ClearCache forces a re-check") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    fetcher.Script("https://img.test/a.png", {Ok("image/png")});
    ResourceValidator validator(fetcher, caches);

    validator.IsValid("https://img.test/a.png");
    validator.ClearCache();
    CHECK(validator.Stats().cache_size == 0);
    validator.IsValid("https://img.test/a.png");
    CHECK(fetcher.Calls("https://img.test/a.png") == 2);
}

TEST_CASE("Units that outlast task_timeout count as invalid") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    fetcher.Script("https://img.test/fast.png", {Ok("image/png")});
    fetcher.Script("https://img.test/slow-1.png", {Ok("image/png")});
    fetcher.Script("https://img.test/slow-2.png", {Ok("image/png")});
    fetcher.Slow("https://img.test/slow-1.png", 400ms);
    fetcher.Slow("https://img.test/slow-2.png", 400ms);
    ValidatorOptions options;
    options.task_timeout = 100ms;

    {
        ResourceValidator validator(fetcher, caches, options);

        auto results = validator.ValidateMany({"https://img.test/fast.png", "https://img.test/slow-1.png"});
        REQUIRE(results.size() == 2);
        CHECK(results["https://img.test/fast.png"]);
        CHECK_FALSE(results["https://img.test/slow-1.png"]);

        std::vector<Candidate> items{
            {"fast", "https://img.test/fast.png"},
            {"slow", "https://img.test/slow-2.png"},
        };
        auto kept = validator.FilterValid(items, [](const Candidate& c) { return c.image_url; });
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].id == "fast");
    }

    // The validator only went away after the abandoned checks were done with it.
    CHECK(fetcher.Answered() == fetcher.TotalCalls());
    CHECK(caches.Find<ValidationRecord>("resource-validation")->Size() == 3);
}

TEST_CASE("Destroying the validator waits for a timed-out batch") {
    FakeFetcher fetcher(300ms);
    CacheRegistry caches;
    fetcher.Script("https://img.test/late.png", {Ok("image/png")});
    ValidatorOptions options;
    options.task_timeout = 50ms;

    auto start = std::chrono::steady_clock::now();
    {
        ResourceValidator validator(fetcher, caches, options);
        auto results = validator.ValidateMany({"https://img.test/late.png"});
        CHECK_FALSE(results["https://img.test/late.png"]);
        CHECK(std::chrono::steady_clock::now() - start < 250ms);
    }
    CHECK(std::chrono::steady_clock::now() - start >= 300ms);
    CHECK(fetcher.Answered() == 1);
}

TEST_CASE("Concurrent batch calls share one permit pool") {
    FakeFetcher fetcher(40ms);
    CacheRegistry caches;
    ValidatorOptions options;
    options.batch_size = 2;
    ResourceValidator validator(fetcher, caches, options);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&validator, t] {
            const std::string base = "https://img.test/" + std::to_string(t);
            validator.ValidateMany({base + "-a.png", base + "-b.png"});
        });
    }
    for (auto& t : threads) t.join();

    CHECK(fetcher.TotalCalls() == 8);
    CHECK(fetcher.Peak() <= 2);
}

TEST_CASE("A non-standard exception from the fetcher does not wedge the URL") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    fetcher.Crash("https://img.test/crash.png");
    ResourceValidator validator(fetcher, caches);

    CHECK_THROWS_AS(validator.IsValid("https://img.test/crash.png"), FetcherCrash);
    // A stale in-flight entry would surface here as std::future_error.
    CHECK_THROWS_AS(validator.IsValid("https://img.test/crash.png"), FetcherCrash);
    CHECK(fetcher.Calls("https://img.test/crash.png") == 2);
    CHECK(validator.Stats().cache_size == 0);
}

TEST_CASE("ResourceValidator rejects invalid options") {
    FakeFetcher fetcher;
    CacheRegistry caches;
    ValidatorOptions options;
    options.batch_size = 0;
    CHECK_THROWS_AS(ResourceValidator(fetcher, caches, options), std::invalid_argument);
    options.batch_size = 1;
    options.retries = -1;
    CHECK_THROWS_AS(ResourceValidator(fetcher, caches, options), std::invalid_argument);
}

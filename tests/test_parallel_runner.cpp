#include <catch2/catch_all.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "concurrency/ParallelRunner.hpp"

using namespace Fanout;
using namespace std::chrono_literals;

namespace {

struct Boom : std::runtime_error {
    Boom() : std::runtime_error("boom") {}
};

RunOptions Options(size_t max_concurrency, FailurePolicy policy, std::chrono::milliseconds timeout = 2000ms) {
    RunOptions options;
    options.max_concurrency = max_concurrency;
    options.failure_policy = policy;
    options.per_task_timeout = timeout;
    return options;
}

}

TEST_CASE("RunParallel never exceeds max_concurrency") {
    const size_t limit = GENERATE(1, 3, 8);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<std::function<int()>> units;
    for (int i = 0; i < 40; ++i) {
        units.push_back([&, i] {
            int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(3ms);
            --active;
            return i;
        });
    }

    auto results = RunParallel<int>(std::move(units), Options(limit, FailurePolicy::BestEffort));
    CHECK(results.size() == 40);
    CHECK(peak.load() <= static_cast<int>(limit));
    CHECK(peak.load() >= 1);
}

TEST_CASE("RunParallel returns every permit after mixed outcomes") {
    auto limiter = std::make_shared<PermitLimiter>(3);

    std::vector<std::function<int()>> units;
    units.push_back([] { return 1; });
    units.push_back([]() -> int { throw Boom(); });
    units.push_back([] { std::this_thread::sleep_for(500ms); return 3; }); // times out
    units.push_back([] { return 4; });
    units.push_back([]() -> int { throw Boom(); });

    auto results = RunParallel<int>(std::move(units), Options(3, FailurePolicy::BestEffort, 100ms), limiter);
    std::sort(results.begin(), results.end());
    CHECK(results == std::vector<int>{1, 4});
    CHECK(limiter->Available() == 3);
    CHECK(limiter->Waiting() == 0);
}

TEST_CASE("Best-effort run drops the failing unit and keeps the others") {
    std::vector<std::function<std::string()>> units{
        [] { std::this_thread::sleep_for(20ms); return std::string("result1"); },
        []() -> std::string { throw Boom(); },
        [] { std::this_thread::sleep_for(10ms); return std::string("result3"); },
    };

    auto start = std::chrono::steady_clock::now();
    auto results = RunParallel<std::string>(std::move(units), Options(2, FailurePolicy::BestEffort));
    auto elapsed = std::chrono::steady_clock::now() - start;

    std::sort(results.begin(), results.end());
    CHECK(results == std::vector<std::string>{"result1", "result3"});
    CHECK(elapsed < 1500ms);
}

TEST_CASE("Best-effort run with only failures yields an empty result") {
    std::vector<std::function<int()>> units{
        []() -> int { throw Boom(); },
        []() -> int { throw std::logic_error("nope"); },
    };
    auto results = RunParallel<int>(std::move(units), Options(2, FailurePolicy::BestEffort));
    CHECK(results.empty());
}

TEST_CASE("Fail-fast run returns values aligned to input order") {
    std::vector<std::function<int()>> units;
    for (int i = 0; i < 6; ++i) {
        units.push_back([i] {
            // Later units finish first
            std::this_thread::sleep_for(std::chrono::milliseconds(5 * (6 - i)));
            return i * i;
        });
    }
    auto results = RunParallel<int>(std::move(units), Options(6, FailurePolicy::FailFast));
    CHECK(results == std::vector<int>{0, 1, 4, 9, 16, 25});
}

TEST_CASE("Fail-fast run propagates the unit's own exception") {
    auto limiter = std::make_shared<PermitLimiter>(2);
    std::vector<std::function<int()>> units{
        [] { return 1; },
        []() -> int { throw Boom(); },
        [] { return 3; },
    };
    CHECK_THROWS_AS(RunParallel<int>(std::move(units), Options(2, FailurePolicy::FailFast), limiter), Boom);
    CHECK(limiter->Available() == 2);
}

TEST_CASE("Fail-fast run reports a timeout as TaskTimeoutError") {
    std::vector<std::function<int()>> units{
        [] { return 1; },
        [] { std::this_thread::sleep_for(400ms); return 2; },
    };
    CHECK_THROWS_AS(RunParallel<int>(std::move(units), Options(2, FailurePolicy::FailFast, 50ms)), TaskTimeoutError);
}

TEST_CASE("Fail-fast run stops dispatching after the first failure") {
    std::atomic<int> started{0};
    std::vector<std::function<int()>> units;
    units.push_back([&]() -> int { ++started; throw Boom(); });
    for (int i = 0; i < 5; ++i) {
        units.push_back([&] { ++started; std::this_thread::sleep_for(5ms); return 0; });
    }
    CHECK_THROWS_AS(RunParallel<int>(std::move(units), Options(1, FailurePolicy::FailFast)), Boom);
    CHECK(started.load() < 6);
}

TEST_CASE("A timed-out unit frees its slot for the next unit") {
    std::vector<std::function<int()>> units{
        [] { std::this_thread::sleep_for(1000ms); return 1; },
        [] { return 2; },
    };
    auto start = std::chrono::steady_clock::now();
    auto results = RunParallel<int>(std::move(units), Options(1, FailurePolicy::BestEffort, 100ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(results == std::vector<int>{2});
    CHECK(elapsed < 800ms);
}

TEST_CASE("RunSettled reports one outcome per unit in input order") {
    std::vector<std::function<int()>> units{
        [] { return 7; },
        []() -> int { throw Boom(); },
        [] { std::this_thread::sleep_for(400ms); return 9; },
    };
    auto outcomes = RunSettled<int>(std::move(units), Options(3, FailurePolicy::FailFast, 50ms));
    REQUIRE(outcomes.size() == 3);

    CHECK(outcomes[0].status == TaskOutcome<int>::Status::Completed);
    REQUIRE(outcomes[0].value.has_value());
    CHECK(*outcomes[0].value == 7);

    CHECK(outcomes[1].status == TaskOutcome<int>::Status::Failed);
    REQUIRE(outcomes[1].error);
    CHECK_THROWS_AS(std::rethrow_exception(outcomes[1].error), Boom);

    CHECK(outcomes[2].status == TaskOutcome<int>::Status::TimedOut);
}

TEST_CASE("RunParallel rejects invalid options") {
    std::vector<std::function<int()>> units{[] { return 1; }};
    CHECK_THROWS_AS(RunParallel<int>(units, Options(0, FailurePolicy::BestEffort)), std::invalid_argument);
    CHECK_THROWS_AS(RunParallel<int>(units, Options(1, FailurePolicy::BestEffort, 0ms)), std::invalid_argument);
}

TEST_CASE("RunParallel on an empty list returns immediately") {
    auto results = RunParallel<int>({}, Options(2, FailurePolicy::FailFast));
    CHECK(results.empty());
}

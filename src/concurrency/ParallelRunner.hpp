#pragma once
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
#include "PermitLimiter.hpp"
#include "../core/Errors.hpp"
#include "../utils/Logger.hpp"

namespace Fanout {

    enum class FailurePolicy {
        FailFast,   // first failure or timeout aborts the call
        BestEffort  // failures are dropped, successes returned in completion order
    };

    struct RunOptions {
        size_t max_concurrency = 10;
        std::chrono::milliseconds per_task_timeout{30000};
        FailurePolicy failure_policy = FailurePolicy::BestEffort;
    };

    template <typename T>
    struct TaskOutcome {
        enum class Status { Completed, Failed, TimedOut };

        Status status = Status::TimedOut;
        std::optional<T> value;
        std::exception_ptr error;

        static TaskOutcome Completed(T v) {
            TaskOutcome o;
            o.status = Status::Completed;
            o.value = std::move(v);
            return o;
        }
        static TaskOutcome Failed(std::exception_ptr e) {
            TaskOutcome o;
            o.status = Status::Failed;
            o.error = std::move(e);
            return o;
        }
        static TaskOutcome TimedOut() { return TaskOutcome{}; }

        bool ok() const { return status == Status::Completed; }
    };

    namespace detail {

        template <typename T>
        struct RunState {
            std::mutex mutex;
            std::condition_variable cv;
            size_t in_flight = 0;
            bool aborted = false;
            // (input index, outcome) in completion order
            std::vector<std::pair<size_t, TaskOutcome<T>>> finished;
        };

        // Runs the unit on its own detached thread and waits up to `timeout`.
        // On timeout the thread is abandoned; its result is discarded when it
        // eventually finishes.
        template <typename T>
        TaskOutcome<T> RunWithTimeout(std::function<T()> unit, std::chrono::milliseconds timeout) {
            auto promise = std::make_shared<std::promise<T>>();
            std::future<T> future = promise->get_future();
            try {
                std::thread([promise, unit = std::move(unit)]() mutable {
                    try {
                        promise->set_value(unit());
                    } catch (...) {
                        promise->set_exception(std::current_exception());
                    }
                }).detach();
            } catch (...) {
                return TaskOutcome<T>::Failed(std::current_exception());
            }

            if (future.wait_for(timeout) == std::future_status::timeout) {
                return TaskOutcome<T>::TimedOut();
            }
            try {
                return TaskOutcome<T>::Completed(future.get());
            } catch (...) {
                return TaskOutcome<T>::Failed(std::current_exception());
            }
        }

        // Dispatches units in input order, each holding one permit from `limiter`
        // for as long as it occupies a slot. Returns after every dispatched unit
        // has settled and returned its permit. With `stop_on_failure` no further
        // unit is dispatched once one has failed or timed out.
        template <typename T>
        std::vector<std::pair<size_t, TaskOutcome<T>>> Execute(std::vector<std::function<T()>> units,
                                                               const RunOptions& options,
                                                               const std::shared_ptr<IPermitLimiter>& limiter,
                                                               bool stop_on_failure) {
            static_assert(!std::is_void_v<T>, "work units must produce a value");
            if (options.per_task_timeout.count() <= 0) {
                throw std::invalid_argument("per_task_timeout must be positive");
            }

            auto state = std::make_shared<RunState<T>>();
            const auto timeout = options.per_task_timeout;

            for (size_t i = 0; i < units.size(); ++i) {
                limiter->Acquire();
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (state->aborted) {
                        limiter->Release();
                        break;
                    }
                    ++state->in_flight;
                }

                try {
                    std::thread([state, limiter, unit = std::move(units[i]), i, timeout, stop_on_failure]() mutable {
                        PermitGuard permit(*limiter);
                        TaskOutcome<T> outcome = RunWithTimeout<T>(std::move(unit), timeout);
                        if (outcome.status == TaskOutcome<T>::Status::TimedOut) {
                            Logger::Log(LogLevel::Debug, "runner", "Task #" + std::to_string(i) + " timed out after " +
                                                             std::to_string(timeout.count()) + " ms");
                        }
                        if (stop_on_failure && !outcome.ok()) {
                            // Set before the permit is freed so the dispatcher sees it.
                            std::lock_guard<std::mutex> lock(state->mutex);
                            state->aborted = true;
                        }
                        // The permit is back before the caller can observe completion.
                        permit.Release();
                        {
                            std::lock_guard<std::mutex> lock(state->mutex);
                            state->finished.emplace_back(i, std::move(outcome));
                            --state->in_flight;
                        }
                        state->cv.notify_all();
                    }).detach();
                } catch (...) {
                    limiter->Release();
                    std::lock_guard<std::mutex> lock(state->mutex);
                    --state->in_flight;
                    if (stop_on_failure) state->aborted = true;
                    state->finished.emplace_back(i, TaskOutcome<T>::Failed(std::current_exception()));
                }
            }

            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&state] { return state->in_flight == 0; });
            return std::move(state->finished);
        }

        template <typename T>
        [[noreturn]] void Rethrow(const TaskOutcome<T>& outcome, size_t index) {
            if (outcome.status == TaskOutcome<T>::Status::Failed && outcome.error) {
                std::rethrow_exception(outcome.error);
            }
            throw TaskTimeoutError("Task #" + std::to_string(index) + " timed out");
        }

    }

    // Runs `units` with at most options.max_concurrency in flight, drawing
    // permits from `limiter`.
    //
    // FailFast: returns every value aligned to input order, or throws the first
    // failure (the unit's own exception, or TaskTimeoutError). Units already in
    // flight are allowed to settle before the exception leaves this call.
    //
    // BestEffort: returns only successful values, in completion order. An empty
    // vector is a valid result.
    template <typename T>
    std::vector<T> RunParallel(std::vector<std::function<T()>> units, const RunOptions& options,
                               const std::shared_ptr<IPermitLimiter>& limiter) {
        const bool fail_fast = options.failure_policy == FailurePolicy::FailFast;
        auto finished = detail::Execute<T>(std::move(units), options, limiter, fail_fast);

        std::vector<T> results;
        if (fail_fast) {
            for (const auto& [index, outcome] : finished) {
                if (!outcome.ok()) detail::Rethrow(outcome, index);
            }
            std::vector<std::optional<T>> aligned(finished.size());
            for (auto& [index, outcome] : finished) {
                aligned[index] = std::move(outcome.value);
            }
            results.reserve(aligned.size());
            for (auto& v : aligned) results.push_back(std::move(*v));
            return results;
        }

        for (auto& entry : finished) {
            if (entry.second.ok()) results.push_back(std::move(*entry.second.value));
        }
        return results;
    }

    template <typename T>
    std::vector<T> RunParallel(std::vector<std::function<T()>> units, const RunOptions& options = {}) {
        auto limiter = std::make_shared<PermitLimiter>(options.max_concurrency);
        return RunParallel<T>(std::move(units), options, limiter);
    }

    // Runs every unit to completion and reports one outcome per unit, aligned
    // to input order. The failure policy is ignored.
    template <typename T>
    std::vector<TaskOutcome<T>> RunSettled(std::vector<std::function<T()>> units, const RunOptions& options = {}) {
        const size_t count = units.size();
        auto limiter = std::make_shared<PermitLimiter>(options.max_concurrency);
        auto finished = detail::Execute<T>(std::move(units), options, limiter, false);

        std::vector<TaskOutcome<T>> outcomes(count);
        for (auto& [index, outcome] : finished) {
            outcomes[index] = std::move(outcome);
        }
        return outcomes;
    }
}

#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../core/Errors.hpp"
#include "../core/Scheduler.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ThreadPool.hpp"

namespace Fanout {

    struct BatchOptions {
        size_t max_size = 10;
        std::chrono::milliseconds max_wait{100};
    };

    // Groups concurrent Add() calls that share a batch key into one processor
    // call. A group flushes exactly once: when it reaches max_size, or when
    // max_wait has elapsed since it was opened, whichever comes first. The
    // processor and options of the caller that opened the group are used for
    // the whole group.
    template <typename Item, typename Result>
    class BatchCoalescer {
    public:
        // Must return one result per item, positionally aligned.
        using Processor = std::function<std::vector<Result>(const std::vector<Item>&)>;

        BatchCoalescer(Scheduler& scheduler, ThreadPool& pool)
            : shared_(std::make_shared<Shared>(scheduler, pool)) {}

        ~BatchCoalescer() { shared_->Shutdown(); }

        BatchCoalescer(const BatchCoalescer&) = delete;
        BatchCoalescer& operator=(const BatchCoalescer&) = delete;

        std::future<Result> Add(const std::string& batch_key, Item item, Processor processor,
                                BatchOptions options = {}) {
            if (!processor) {
                throw std::invalid_argument("BatchCoalescer::Add requires a processor");
            }
            if (options.max_size == 0) {
                throw std::invalid_argument("BatchOptions::max_size must be positive");
            }
            return Shared::Add(shared_, batch_key, std::move(item), std::move(processor), options);
        }

        size_t OpenGroups() const {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            return shared_->groups.size();
        }

    private:
        struct Group {
            std::uint64_t generation = 0;
            std::vector<Item> items;
            std::vector<std::promise<Result>> pending;
            Processor processor;
            BatchOptions options;
            std::optional<Scheduler::JobId> timer;
        };

        struct Shared {
            Shared(Scheduler& s, ThreadPool& p) : scheduler(s), pool(p) {}

            Scheduler& scheduler;
            ThreadPool& pool;
            mutable std::mutex mutex;
            std::unordered_map<std::string, std::unique_ptr<Group>> groups;
            std::uint64_t next_generation = 1;
            bool stopped = false;

            static std::future<Result> Add(const std::shared_ptr<Shared>& self, const std::string& key, Item item,
                                           Processor processor, const BatchOptions& options) {
                std::unique_ptr<Group> full;
                std::future<Result> future;
                {
                    std::lock_guard<std::mutex> lock(self->mutex);
                    if (self->stopped) {
                        throw BatchProcessingError("BatchCoalescer is shut down");
                    }
                    auto it = self->groups.find(key);
                    if (it == self->groups.end()) {
                        auto group = std::make_unique<Group>();
                        group->generation = self->next_generation++;
                        group->processor = std::move(processor);
                        group->options = options;
                        it = self->groups.emplace(key, std::move(group)).first;
                    }
                    Group& group = *it->second;
                    group.items.push_back(std::move(item));
                    group.pending.emplace_back();
                    future = group.pending.back().get_future();

                    if (group.items.size() >= group.options.max_size) {
                        // Removed under the lock so the next Add opens a fresh group.
                        full = std::move(it->second);
                        self->groups.erase(it);
                    } else if (!group.timer) {
                        std::weak_ptr<Shared> weak = self;
                        const std::uint64_t generation = group.generation;
                        group.timer = self->scheduler.Schedule(group.options.max_wait, [weak, key, generation]() {
                            if (auto shared = weak.lock()) {
                                Shared::FlushOnTimer(shared, key, generation);
                            }
                        });
                    }
                }

                if (full) {
                    if (full->timer) self->scheduler.Cancel(*full->timer);
                    Dispatch(self, key, std::move(full));
                }
                return future;
            }

            static void FlushOnTimer(const std::shared_ptr<Shared>& self, const std::string& key,
                                     std::uint64_t generation) {
                std::unique_ptr<Group> group;
                {
                    std::lock_guard<std::mutex> lock(self->mutex);
                    auto it = self->groups.find(key);
                    // A size flush may already have taken this group; a newer group under the same key has its own timer.
                    if (it == self->groups.end() || it->second->generation != generation) return;
                    group = std::move(it->second);
                    self->groups.erase(it);
                }
                Process(key, *group);
            }

            static void Dispatch(const std::shared_ptr<Shared>& self, const std::string& key,
                                 std::unique_ptr<Group> group) {
                std::shared_ptr<Group> owned(std::move(group));
                try {
                    self->pool.enqueue([key, owned]() { Process(key, *owned); });
                } catch (const std::exception& e) {
                    Logger::Log(LogLevel::Warn, "batch", std::string("Batch dispatch failed, processing inline: ") + e.what());
                    Process(key, *owned);
                }
            }

            static void Process(const std::string& key, Group& group) {
                Logger::Log(LogLevel::Debug, "batch", "Flushing batch '" + key + "' with " + std::to_string(group.items.size()) + " item(s)");
                std::vector<Result> results;
                try {
                    results = group.processor(group.items);
                } catch (...) {
                    auto error = std::current_exception();
                    for (auto& p : group.pending) p.set_exception(error);
                    return;
                }

                if (results.size() != group.items.size()) {
                    Logger::Log(LogLevel::Warn, "batch", "Batch processor returned " + std::to_string(results.size()) +
                                                    " result(s) for " + std::to_string(group.items.size()) + " item(s)");
                }
                for (size_t i = 0; i < group.pending.size(); ++i) {
                    if (i < results.size()) {
                        group.pending[i].set_value(std::move(results[i]));
                    } else {
                        group.pending[i].set_exception(
                            std::make_exception_ptr(BatchProcessingError("Batch processing failed")));
                    }
                }
            }

            void Shutdown() {
                std::unordered_map<std::string, std::unique_ptr<Group>> remaining;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    stopped = true;
                    remaining.swap(groups);
                }
                for (auto& entry : remaining) {
                    if (entry.second->timer) scheduler.Cancel(*entry.second->timer);
                    for (auto& p : entry.second->pending) {
                        p.set_exception(std::make_exception_ptr(BatchProcessingError("BatchCoalescer shut down before flush")));
                    }
                }
            }
        };

        std::shared_ptr<Shared> shared_;
    };
}

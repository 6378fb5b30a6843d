#pragma once
#include <string>
#include <optional>
#include <list>
#include <unordered_map>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include "../interfaces/ICacheStore.hpp"

namespace Fanout {
    // Bounded key/value cache with per-entry expiry. The list is kept with the
    // most recently used (LRU) or most recently inserted (FIFO) entry at the
    // front; eviction takes from the back. Expired entries are dropped when
    // read and by SweepExpired().
    template <typename V>
    class TtlCache : public ICacheStore {
    public:
        using Clock = std::chrono::steady_clock;

        TtlCache(std::string name, const CachePolicy& policy)
            : name_(std::move(name)), policy_(policy) {
            if (policy_.max_entries == 0) {
                throw std::invalid_argument("Cache '" + name_ + "' needs max_entries > 0");
            }
        }

        const std::string& Name() const override { return name_; }
        const CachePolicy& Policy() const override { return policy_; }

        std::optional<V> Get(const std::string& key) {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            auto it = cache_map_.find(key);

            if (it == cache_map_.end()) {
                return std::nullopt;
            }

            if (Clock::now() >= it->second->expiry_time) {
                cache_list_.erase(it->second);
                cache_map_.erase(it);
                return std::nullopt;
            }

            if (policy_.eviction == EvictionKind::Lru) {
                cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
            }
            return it->second->value;
        }

        // ttl defaults to the policy's default_ttl.
        void Set(const std::string& key, V value, std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            const auto expiry_time = Clock::now() + ttl.value_or(policy_.default_ttl);
            auto it = cache_map_.find(key);

            if (it != cache_map_.end()) {
                it->second->value = std::move(value);
                it->second->expiry_time = expiry_time;
                // FIFO keeps the original insertion position on overwrite
                if (policy_.eviction == EvictionKind::Lru) {
                    cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
                }
                return;
            }

            if (cache_map_.size() >= policy_.max_entries) {
                if (policy_.eviction == EvictionKind::FifoBulkClear) {
                    cache_list_.clear();
                    cache_map_.clear();
                } else {
                    const auto& oldest = cache_list_.back();
                    cache_map_.erase(oldest.key);
                    cache_list_.pop_back();
                }
            }

            cache_list_.push_front({key, std::move(value), expiry_time});
            cache_map_[key] = cache_list_.begin();
        }

        bool Erase(const std::string& key) {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            auto it = cache_map_.find(key);
            if (it == cache_map_.end()) return false;
            cache_list_.erase(it->second);
            cache_map_.erase(it);
            return true;
        }

        size_t Size() const override {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            return cache_map_.size();
        }

        void Clear() override {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            cache_list_.clear();
            cache_map_.clear();
        }

        size_t SweepExpired() override {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            const auto now = Clock::now();
            size_t removed = 0;
            for (auto it = cache_list_.begin(); it != cache_list_.end();) {
                if (now >= it->expiry_time) {
                    cache_map_.erase(it->key);
                    it = cache_list_.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
            return removed;
        }

    private:
        struct CacheEntry {
            std::string key;
            V value;
            Clock::time_point expiry_time;
        };

        const std::string name_;
        const CachePolicy policy_;
        std::list<CacheEntry> cache_list_;
        std::unordered_map<std::string, typename std::list<CacheEntry>::iterator> cache_map_;
        mutable std::mutex cache_mutex_;
    };
}

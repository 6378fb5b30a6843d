#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "TtlCache.hpp"
#include "../core/Errors.hpp"

namespace Fanout {

    EvictionKind ParseEvictionKind(const std::string& s);
    std::string ToString(EvictionKind kind);

    // Named caches, each statically typed to one value type at creation.
    class CacheRegistry {
    public:
        CacheRegistry() = default;
        CacheRegistry(const CacheRegistry&) = delete;
        CacheRegistry& operator=(const CacheRegistry&) = delete;

        // Registers `name`, replacing any cache previously registered under it.
        template <typename V>
        std::shared_ptr<TtlCache<V>> CreateCache(const std::string& name, const CachePolicy& policy) {
            auto cache = std::make_shared<TtlCache<V>>(name, policy);
            Register(name, cache);
            return cache;
        }

        // nullptr if no cache has that name; CacheTypeError if it holds another type.
        template <typename V>
        std::shared_ptr<TtlCache<V>> Find(const std::string& name) const {
            auto store = FindStore(name);
            if (!store) return nullptr;
            auto typed = std::dynamic_pointer_cast<TtlCache<V>>(store);
            if (!typed) {
                throw CacheTypeError("Cache '" + name + "' holds a different value type");
            }
            return typed;
        }

        template <typename V>
        std::optional<V> Get(const std::string& name, const std::string& key) const {
            auto cache = Find<V>(name);
            if (!cache) return std::nullopt;
            return cache->Get(key);
        }

        // Returns false (and stores nothing) when the cache does not exist.
        template <typename V>
        bool Set(const std::string& name, const std::string& key, V value,
                 std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
            auto cache = Find<V>(name);
            if (!cache) {
                WarnMissing(name);
                return false;
            }
            cache->Set(key, std::move(value), ttl);
            return true;
        }

        bool Contains(const std::string& name) const;
        bool Clear(const std::string& name);
        bool Remove(const std::string& name);

        // Drops expired entries from every cache. Returns the total removed.
        size_t SweepExpired();

        // (name, entry count) for every cache, ordered by name.
        std::vector<std::pair<std::string, size_t>> Sizes() const;

    private:
        void Register(const std::string& name, std::shared_ptr<ICacheStore> store);
        std::shared_ptr<ICacheStore> FindStore(const std::string& name) const;
        static void WarnMissing(const std::string& name);

        std::map<std::string, std::shared_ptr<ICacheStore>> caches_;
        mutable std::mutex mutex_;
    };

}

#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace Fanout {

enum class EvictionKind {
    Lru,
    Fifo,
    FifoBulkClear // clears the whole cache when full instead of dropping one entry
};

struct CachePolicy {
    EvictionKind eviction = EvictionKind::Lru;
    size_t max_entries = 1000;
    std::chrono::milliseconds default_ttl{300000};
};

// Type-erased view of a named cache, used by the registry for sweeps and stats.
class ICacheStore {
public:
    virtual ~ICacheStore() = default;
    virtual const std::string& Name() const = 0;
    virtual const CachePolicy& Policy() const = 0;
    virtual size_t Size() const = 0;
    virtual void Clear() = 0;
    // Removes expired entries, returns how many were dropped.
    virtual size_t SweepExpired() = 0;
};

}

#include "CacheRegistry.hpp"
#include "../utils/Logger.hpp"
#include <stdexcept>

namespace Fanout {

EvictionKind ParseEvictionKind(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (unsigned char c : s) t.push_back((c >= 'A' && c <= 'Z') ? char(c + 32) : char(c));
    if (t == "lru") return EvictionKind::Lru;
    if (t == "fifo") return EvictionKind::Fifo;
    if (t == "fifo-bulk-clear" || t == "fifo_bulk_clear") return EvictionKind::FifoBulkClear;
    throw std::invalid_argument("Unknown eviction policy: " + s);
}

std::string ToString(EvictionKind kind) {
    switch (kind) {
        case EvictionKind::Lru: return "lru";
        case EvictionKind::Fifo: return "fifo";
        case EvictionKind::FifoBulkClear: return "fifo-bulk-clear";
    }
    return "unknown";
}

void CacheRegistry::Register(const std::string& name, std::shared_ptr<ICacheStore> store) {
    const CachePolicy policy = store->Policy();
    bool replaced = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replaced = caches_.count(name) > 0;
        caches_[name] = std::move(store);
    }
    Logger::Log(LogLevel::Info, "cache", std::string(replaced ? "Replaced" : "Created") + " cache '" + name + "' (" +
                                    ToString(policy.eviction) + ", max " + std::to_string(policy.max_entries) +
                                    ", ttl " + std::to_string(policy.default_ttl.count()) + " ms)");
}

std::shared_ptr<ICacheStore> CacheRegistry::FindStore(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(name);
    return it == caches_.end() ? nullptr : it->second;
}

void CacheRegistry::WarnMissing(const std::string& name) {
    Logger::Log(LogLevel::Warn, "cache", "Set on unknown cache '" + name + "' ignored");
}

bool CacheRegistry::Contains(const std::string& name) const {
    return FindStore(name) != nullptr;
}

bool CacheRegistry::Clear(const std::string& name) {
    auto store = FindStore(name);
    if (!store) return false;
    store->Clear();
    return true;
}

bool CacheRegistry::Remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return caches_.erase(name) > 0;
}

size_t CacheRegistry::SweepExpired() {
    std::vector<std::shared_ptr<ICacheStore>> stores;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stores.reserve(caches_.size());
        for (const auto& entry : caches_) stores.push_back(entry.second);
    }

    size_t total = 0;
    for (const auto& store : stores) {
        size_t removed = store->SweepExpired();
        if (removed > 0) {
            Logger::Log(LogLevel::Debug, "cache", "Swept " + std::to_string(removed) + " expired entries from '" + store->Name() + "'");
        }
        total += removed;
    }
    return total;
}

std::vector<std::pair<std::string, size_t>> CacheRegistry::Sizes() const {
    std::vector<std::shared_ptr<ICacheStore>> stores;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : caches_) stores.push_back(entry.second);
    }
    std::vector<std::pair<std::string, size_t>> sizes;
    sizes.reserve(stores.size());
    for (const auto& store : stores) sizes.emplace_back(store->Name(), store->Size());
    return sizes;
}

}

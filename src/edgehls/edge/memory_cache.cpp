// Copyright (c) 2026 changcheng967. All rights reserved.

#include <edgehls/edge/cache.hpp>
#include <edgehls/core/log.hpp>
#include <algorithm>

namespace edgehls::edge {

MemoryCache::MemoryCache(std::chrono::seconds stale_if_error, std::size_t max_entries, Clock clock)
    : stale_if_error_(stale_if_error)
    , max_entries_(std::max<std::size_t>(max_entries, 1))
    , clock_(std::move(clock)) {}

std::optional<CacheLookup> MemoryCache::lookup(const std::string& key) {
    const auto now = clock_();
    std::lock_guard lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now >= it->second.expires + stale_if_error_) {
        entries_.erase(it);
        return std::nullopt;
    }
    return CacheLookup{it->second.response, now >= it->second.expires};
}

void MemoryCache::store(const std::string& key, CachedResponse response, std::chrono::seconds ttl) {
    const auto now = clock_();
    std::lock_guard lock(mutex_);

    if (!entries_.contains(key) && entries_.size() >= max_entries_) {
        evict(now);
    }
    entries_.insert_or_assign(key, Entry{std::move(response), now + ttl});
}

std::size_t MemoryCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void MemoryCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

void MemoryCache::evict(std::chrono::steady_clock::time_point now) {
    std::erase_if(entries_, [&](const auto& item) {
        return now >= item.second.expires + stale_if_error_;
    });
    if (entries_.size() < max_entries_) {
        return;
    }

    // Still full: drop the entry closest to expiry
    auto oldest = std::min_element(entries_.begin(), entries_.end(), [](const auto& a, const auto& b) {
        return a.second.expires < b.second.expires;
    });
    EDGEHLS_LOG_DEBUG << "cache full, evicting " << oldest->first;
    entries_.erase(oldest);
}

} // namespace edgehls::edge

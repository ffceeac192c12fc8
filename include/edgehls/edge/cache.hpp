// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace edgehls::edge {

// Bytes and metadata of one cacheable response
struct CachedResponse {
    int status{200};
    std::string content_type;
    std::string body;
    std::uint32_t max_age{0};
    std::string etag;
    std::size_t source_digest{0};  // Digest of the snapshot a derived entry was rendered from
};

struct CacheLookup {
    CachedResponse response;
    bool stale{false};  // Past its TTL, only usable when origin fails
};

// Cache store collaborator
class ResponseCache {
public:
    virtual ~ResponseCache() = default;

    [[nodiscard]] virtual std::optional<CacheLookup> lookup(const std::string& key) = 0;
    virtual void store(const std::string& key, CachedResponse response, std::chrono::seconds ttl) = 0;
};

// In-process cache. Entries stay servable as stale for stale_if_error
// after their TTL, then are dropped.
class MemoryCache final : public ResponseCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit MemoryCache(std::chrono::seconds stale_if_error,
                         std::size_t max_entries = 4096,
                         Clock clock = [] { return std::chrono::steady_clock::now(); });

    [[nodiscard]] std::optional<CacheLookup> lookup(const std::string& key) override;
    void store(const std::string& key, CachedResponse response, std::chrono::seconds ttl) override;

    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    struct Entry {
        CachedResponse response;
        std::chrono::steady_clock::time_point expires;
    };

    // Requires mutex_ held
    void evict(std::chrono::steady_clock::time_point now);

    std::chrono::seconds stale_if_error_;
    std::size_t max_entries_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace edgehls::edge

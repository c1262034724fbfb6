#pragma once
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "transport/clock.hpp"
#include "wire/manifest.hpp"

namespace asap::transport {

constexpr std::chrono::seconds DEFAULT_MANIFEST_TTL{300};
constexpr size_t DEFAULT_MANIFEST_CACHE_SIZE = 1000;

// TTL + LRU cache of peer manifests keyed by discovery URL.
// Expiry is checked lazily on get(); cleanup_expired() sweeps everything.
// Safe for concurrent callers.
class ManifestCache {
public:
    using ManifestPtr = std::shared_ptr<const wire::Manifest>;

    // max_size 0 means unbounded
    explicit ManifestCache(std::chrono::milliseconds default_ttl = DEFAULT_MANIFEST_TTL,
                           size_t max_size = DEFAULT_MANIFEST_CACHE_SIZE,
                           TimeSource now = {});

    // Non-copyable
    ManifestCache(const ManifestCache&) = delete;
    ManifestCache& operator=(const ManifestCache&) = delete;

    // Cached manifest, marked most recently used; nullptr when missing or
    // expired (expired entries are removed)
    ManifestPtr get(const std::string& url);

    // Insert or replace. A brand-new key evicts the least recently used
    // entry first when the cache is full.
    void set(const std::string& url, ManifestPtr manifest,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);
    void set(const std::string& url, const wire::Manifest& manifest,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    void invalidate(const std::string& url);
    void clear_all();

    // Removes every expired entry, returns how many were removed
    size_t cleanup_expired();

    size_t size() const;
    size_t max_size() const { return max_size_; }
    std::chrono::milliseconds default_ttl() const { return default_ttl_; }

private:
    struct Entry {
        std::string url;
        ManifestPtr manifest;
        SteadyClock::time_point expires_at;
    };

    using EntryList = std::list<Entry>;

    bool is_expired(const Entry& entry, SteadyClock::time_point now) const {
        return now >= entry.expires_at;
    }

    const std::chrono::milliseconds default_ttl_;
    const size_t max_size_;
    TimeSource now_;

    mutable std::mutex mutex_;
    EntryList entries_;   // front = least recently used
    std::unordered_map<std::string, EntryList::iterator> index_;
};

} // namespace asap::transport

#include "transport/manifest_cache.hpp"
#include <spdlog/spdlog.h>
#include <iterator>

namespace asap::transport {

ManifestCache::ManifestCache(std::chrono::milliseconds default_ttl, size_t max_size, TimeSource now)
    : default_ttl_(default_ttl)
    , max_size_(max_size)
    , now_(std::move(now)) {}

ManifestCache::ManifestPtr ManifestCache::get(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(url);
    if (it == index_.end()) {
        return nullptr;
    }

    if (is_expired(*it->second, read_clock(now_))) {
        entries_.erase(it->second);
        index_.erase(it);
        return nullptr;
    }

    entries_.splice(entries_.end(), entries_, it->second);
    return it->second->manifest;
}

void ManifestCache::set(const std::string& url, ManifestPtr manifest,
                        std::optional<std::chrono::milliseconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto expires_at = read_clock(now_) + ttl.value_or(default_ttl_);

    auto it = index_.find(url);
    if (it != index_.end()) {
        it->second->manifest = std::move(manifest);
        it->second->expires_at = expires_at;
        entries_.splice(entries_.end(), entries_, it->second);
        return;
    }

    if (max_size_ > 0 && entries_.size() >= max_size_) {
        spdlog::debug("Manifest cache full ({}), evicting {}", max_size_, entries_.front().url);
        index_.erase(entries_.front().url);
        entries_.pop_front();
    }

    entries_.push_back(Entry{url, std::move(manifest), expires_at});
    index_[url] = std::prev(entries_.end());
}

void ManifestCache::set(const std::string& url, const wire::Manifest& manifest,
                        std::optional<std::chrono::milliseconds> ttl) {
    set(url, std::make_shared<const wire::Manifest>(manifest), ttl);
}

void ManifestCache::invalidate(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(url);
    if (it != index_.end()) {
        entries_.erase(it->second);
        index_.erase(it);
    }
}

void ManifestCache::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
}

size_t ManifestCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = read_clock(now_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired(*it, now)) {
            index_.erase(it->url);
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Manifest cache removed {} expired entries", removed);
    }
    return removed;
}

size_t ManifestCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace asap::transport

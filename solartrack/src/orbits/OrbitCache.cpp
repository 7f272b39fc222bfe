/**
 * @file OrbitCache.cpp
 * @brief Implementation of OrbitCache
 */

#include "solartrack/orbits/OrbitCache.hpp"
#include <tuple>

namespace solartrack::orbits {

bool OrbitCacheKey::operator<(const OrbitCacheKey& o) const {
    return std::tie(body, start, end, sample_count, frame) <
           std::tie(o.body, o.start, o.end, o.sample_count, o.frame);
}

bool OrbitCacheKey::operator==(const OrbitCacheKey& o) const {
    return body == o.body && start == o.start && end == o.end &&
           sample_count == o.sample_count && frame == o.frame;
}

OrbitCache::OrbitCache(std::size_t capacity) : capacity_(capacity) {}

std::optional<OrbitPathPtr> OrbitCache::get(const OrbitCacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }
    entries_.splice(entries_.begin(), entries_, it->second);
    ++hits_;
    return it->second->second;
}

void OrbitCache::put(const OrbitCacheKey& key, OrbitPathPtr path) {
    if (capacity_ == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(path);
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    entries_.emplace_front(key, std::move(path));
    index_[key] = entries_.begin();

    while (entries_.size() > capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
}

void OrbitCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
    hits_ = 0;
    misses_ = 0;
}

std::size_t OrbitCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t OrbitCache::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

std::size_t OrbitCache::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

} // namespace solartrack::orbits

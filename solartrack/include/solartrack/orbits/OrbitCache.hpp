/**
 * @file OrbitCache.hpp
 * @brief Bounded, thread-safe cache of sampled orbit paths
 * @author SolarTrack Team
 *
 * Least-recently-used entries are evicted once the capacity is exceeded.
 * A capacity of zero disables caching (every lookup is a miss and nothing
 * is stored).
 */

#ifndef SOLARTRACK_ORBITS_ORBIT_CACHE_HPP
#define SOLARTRACK_ORBITS_ORBIT_CACHE_HPP

#include "solartrack/orbits/OrbitPath.hpp"
#include <cstddef>
#include <list>
#include <map>
#include <mutex>
#include <optional>

namespace solartrack::orbits {

/**
 * @brief Identity of one sampling request, after clamping
 */
struct OrbitCacheKey {
    std::string body;   ///< Canonical name
    time::Instant start;
    time::Instant end;
    int sample_count;
    ephemeris::ReferenceFrame frame;

    bool operator<(const OrbitCacheKey& o) const;
    bool operator==(const OrbitCacheKey& o) const;
};

class OrbitCache {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 64;

    explicit OrbitCache(std::size_t capacity = DEFAULT_CAPACITY);

    /// Cached path, refreshed to most-recently-used; counts a hit or a miss
    std::optional<OrbitPathPtr> get(const OrbitCacheKey& key);

    /// Insert or replace, evicting the least-recently-used entry beyond capacity
    void put(const OrbitCacheKey& key, OrbitPathPtr path);

    void clear();

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::size_t hits() const;
    std::size_t misses() const;

private:
    using Entry = std::pair<OrbitCacheKey, OrbitPathPtr>;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> entries_;   // front = most recently used
    std::map<OrbitCacheKey, std::list<Entry>::iterator> index_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
};

} // namespace solartrack::orbits

#endif // SOLARTRACK_ORBITS_ORBIT_CACHE_HPP

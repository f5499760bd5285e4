/**
 * @file weft/guard/fragment_cache.cpp
 * @brief Expiry and eviction for `weft::FragmentCache`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Guard
 */
#include "./fragment_cache.h"

#include <stdexcept>  // For std::invalid_argument

#include "../logger.h"

namespace weft {

FragmentCache::FragmentCache(FragmentCacheOptions options, ClockFn clock)
    : _options(options)
    , _clock(clock ? std::move(clock) : ClockFn([] { return Clock::now(); }))
    , _entries(options.get_shards()) {
    if (_options.get_max_entries_per_shard() == 0)
        throw std::invalid_argument("FragmentCache: max_entries_per_shard must be greater than zero");
}

std::optional<std::string>
FragmentCache::get(const std::string &key) {
    const auto now = _clock();
    auto &shard = _entries.shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    Entry *entry = shard.touch(key);
    if (!entry) {
        _misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    if (now >= entry->expires_at) {
        shard.erase(key);
        _misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    _hits.fetch_add(1, std::memory_order_relaxed);
    return entry->value;
}

void
FragmentCache::set_for(const std::string &key, std::string value, std::chrono::milliseconds ttl) {
    if (ttl.count() <= 0) {
        erase(key);
        return;
    }
    const auto now = _clock();
    auto &shard = _entries.shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    if (Entry *entry = shard.touch(key)) {
        entry->value = std::move(value);
        entry->expires_at = now + ttl;
        return;
    }
    while (shard.size() >= _options.get_max_entries_per_shard()) {
        const auto evicted = shard.evict_oldest();
        LOG_WEFT_DEBUG("FragmentCache: shard full, evicting key '" << evicted << "'");
        _evictions.fetch_add(1, std::memory_order_relaxed);
    }
    shard.insert(key, Entry{std::move(value), now + ttl});
}

bool
FragmentCache::erase(const std::string &key) {
    auto &shard = _entries.shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    return shard.erase(key);
}

void
FragmentCache::clear() {
    _entries.for_each_shard([](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.clear();
    });
}

std::size_t
FragmentCache::purge_expired() {
    const auto now = _clock();
    std::size_t purged = 0;
    _entries.for_each_shard([&](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        purged += shard.erase_if([now](const Entry &entry) { return now >= entry.expires_at; });
    });
    return purged;
}

std::size_t
FragmentCache::size() const {
    std::size_t total = 0;
    _entries.for_each_shard([&total](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.size();
    });
    return total;
}

FragmentCache::Stats
FragmentCache::stats() const noexcept {
    Stats s;
    s.hits = _hits.load(std::memory_order_relaxed);
    s.misses = _misses.load(std::memory_order_relaxed);
    s.evictions = _evictions.load(std::memory_order_relaxed);
    return s;
}

} // namespace weft

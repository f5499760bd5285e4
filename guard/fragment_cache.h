/**
 * @file weft/guard/fragment_cache.h
 * @brief Short-lived in-memory cache of rendered fragments.
 *
 * `FragmentCache` stores strings (rendered bodies, partial pages, computed
 * JSON) under a key for a bounded time. It is sharded like the rate
 * limiters: each shard is a map behind its own mutex. When a shard reaches
 * its entry limit, the least recently read or written entry is dropped.
 * Expired entries are removed when read or by `purge_expired()`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Guard
 */
#pragma once

#include <atomic>      // For std::atomic (hit/miss counters)
#include <chrono>      // For std::chrono::steady_clock, durations
#include <functional>  // For std::function (clock injection)
#include <optional>    // For std::optional
#include <string>      // For std::string

#include "./rate_limiter.h" // For detail::ShardedMap

namespace weft {

    /**
     * @brief Options of a `FragmentCache`.
     *
     * Defaults: 30 second TTL, 16 shards, 4096 entries per shard.
     */
    class FragmentCacheOptions {
    public:
        FragmentCacheOptions() noexcept = default;

        /** @brief TTL used by `set(key, value)` without an explicit TTL. */
        template<typename Rep, typename Period>
        FragmentCacheOptions &default_ttl(const std::chrono::duration<Rep, Period> &value) noexcept {
            _default_ttl = std::chrono::duration_cast<std::chrono::milliseconds>(value);
            return *this;
        }

        FragmentCacheOptions &shards(std::size_t value) noexcept {
            _shards = value;
            return *this;
        }

        FragmentCacheOptions &max_entries_per_shard(std::size_t value) noexcept {
            _max_entries_per_shard = value;
            return *this;
        }

        [[nodiscard]] std::chrono::milliseconds get_default_ttl() const noexcept { return _default_ttl; }
        [[nodiscard]] std::size_t get_shards() const noexcept { return _shards; }
        [[nodiscard]] std::size_t get_max_entries_per_shard() const noexcept { return _max_entries_per_shard; }

    private:
        std::chrono::milliseconds _default_ttl = std::chrono::seconds(30);
        std::size_t _shards = 16;
        std::size_t _max_entries_per_shard = 4096;
    };

    class FragmentCache {
    public:
        using Clock = std::chrono::steady_clock;
        using ClockFn = std::function<Clock::time_point()>;

        struct Stats {
            std::size_t hits = 0;
            std::size_t misses = 0;
            std::size_t evictions = 0;
        };

    private:
        struct Entry {
            std::string value;
            Clock::time_point expires_at;
        };

        FragmentCacheOptions _options;
        ClockFn _clock;
        detail::ShardedMap<Entry> _entries;
        std::atomic<std::size_t> _hits{0};
        std::atomic<std::size_t> _misses{0};
        std::atomic<std::size_t> _evictions{0};

    public:
        /** @throws std::invalid_argument if `max_entries_per_shard` is zero. */
        explicit FragmentCache(FragmentCacheOptions options = FragmentCacheOptions(), ClockFn clock = {});

        /** @return The cached value, or `std::nullopt` if absent or expired. */
        [[nodiscard]] std::optional<std::string> get(const std::string &key);

        /**
         * @brief Stores `value` under `key` for `ttl`, replacing any previous entry.
         * A non-positive `ttl` removes the key instead.
         */
        template<typename Rep, typename Period>
        void set(const std::string &key, std::string value, const std::chrono::duration<Rep, Period> &ttl) {
            set_for(key, std::move(value), std::chrono::duration_cast<std::chrono::milliseconds>(ttl));
        }

        /** @brief Stores `value` with the default TTL. */
        void set(const std::string &key, std::string value) {
            set_for(key, std::move(value), _options.get_default_ttl());
        }

        void set_for(const std::string &key, std::string value, std::chrono::milliseconds ttl);

        /** @return true if `key` was present. */
        bool erase(const std::string &key);
        void clear();
        /** @brief Drops expired entries. Returns how many were dropped. */
        std::size_t purge_expired();
        /** @brief Entries currently stored, expired ones included until purged. */
        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] Stats stats() const noexcept;
        [[nodiscard]] const FragmentCacheOptions &get_options() const noexcept { return _options; }
    };

} // namespace weft

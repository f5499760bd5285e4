/**
 * @file weft/guard/rate_limiter.h
 * @brief Per-key request admission: fixed window and token bucket.
 *
 * A rate limiter answers one question for a key (usually a client address):
 * may this request go through now? Rejection is an ordinary result, not an
 * error. State is created lazily on a key's first request and lives in a
 * sharded map where every shard has its own mutex, so unrelated keys rarely
 * contend.
 *
 * Limiters are plain objects constructed at startup and shared with the
 * middleware that uses them through `std::shared_ptr`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Guard
 */
#pragma once

#include <chrono>      // For std::chrono::steady_clock, durations
#include <cstddef>     // For std::size_t
#include <functional>  // For std::function (clock injection), std::hash
#include <list>        // For std::list (per-shard recency order)
#include <memory>      // For std::unique_ptr
#include <mutex>       // For std::mutex
#include <string>      // For std::string
#include <utility>     // For std::move
#include <vector>      // For std::vector (shards)

#include <qb/system/container/unordered_map.h> // For qb::unordered_map

namespace weft {

    /** @brief Outcome of a rate limit check. */
    struct RateLimitDecision {
        bool allowed = false;
        /** @brief Configured maximum per window, or bucket capacity. */
        std::size_t limit = 0;
        /** @brief Requests still admissible right now. */
        std::size_t remaining = 0;
        /** @brief Time until the next request would be admitted (zero when `allowed`). */
        std::chrono::milliseconds retry_after{0};
        /** @brief Time until the window restarts, or until the bucket is full again. */
        std::chrono::milliseconds reset_after{0};
    };

    /**
     * @brief Interface shared by rate limiting strategies.
     */
    class IRateLimiter {
    public:
        using Clock = std::chrono::steady_clock;
        /** @brief Time source, replaceable in tests. */
        using ClockFn = std::function<Clock::time_point()>;

        virtual ~IRateLimiter() = default;

        /** @brief Consumes one unit for `key` if possible. Thread-safe. */
        [[nodiscard]] virtual RateLimitDecision check(const std::string &key) = 0;

        /** @return true if the request for `key` is admitted. */
        [[nodiscard]] bool allow(const std::string &key) { return check(key).allowed; }

        /** @brief Forgets the state of `key`. */
        virtual void reset(const std::string &key) = 0;
        /** @brief Forgets every key. */
        virtual void reset_all() = 0;
        /** @brief Number of keys currently tracked. */
        [[nodiscard]] virtual std::size_t size() const = 0;
        /** @brief Drops keys whose state is back to its initial value. Returns the count dropped. */
        virtual std::size_t purge_idle() = 0;
    };

    /**
     * @brief Options of a `FixedWindowRateLimiter`.
     *
     * Defaults: 100 requests per 1 minute, 16 shards, at most 65536 keys per shard.
     */
    class RateLimitOptions {
    public:
        RateLimitOptions() noexcept = default;

        RateLimitOptions &max_requests(std::size_t value) noexcept {
            _max_requests = value;
            return *this;
        }

        template<typename Rep, typename Period>
        RateLimitOptions &window(const std::chrono::duration<Rep, Period> &value) noexcept {
            _window = std::chrono::duration_cast<std::chrono::milliseconds>(value);
            return *this;
        }

        RateLimitOptions &shards(std::size_t value) noexcept {
            _shards = value;
            return *this;
        }

        /** @brief Keys per shard; a new key beyond it evicts the least recently used one. */
        RateLimitOptions &max_keys_per_shard(std::size_t value) noexcept {
            _max_keys_per_shard = value;
            return *this;
        }

        /** @brief 1000 requests per minute. */
        [[nodiscard]] static RateLimitOptions permissive() noexcept {
            return RateLimitOptions().max_requests(1000).window(std::chrono::minutes(1));
        }

        /** @brief 60 requests per minute. */
        [[nodiscard]] static RateLimitOptions secure() noexcept {
            return RateLimitOptions().max_requests(60).window(std::chrono::minutes(1));
        }

        [[nodiscard]] std::size_t get_max_requests() const noexcept { return _max_requests; }
        [[nodiscard]] std::chrono::milliseconds get_window() const noexcept { return _window; }
        [[nodiscard]] std::size_t get_shards() const noexcept { return _shards; }
        [[nodiscard]] std::size_t get_max_keys_per_shard() const noexcept { return _max_keys_per_shard; }

    private:
        std::size_t _max_requests = 100;
        std::chrono::milliseconds _window = std::chrono::minutes(1);
        std::size_t _shards = 16;
        std::size_t _max_keys_per_shard = 65536;
    };

    /**
     * @brief Options of a `TokenBucketRateLimiter`.
     *
     * Defaults: capacity 100, refilled at 10 tokens per second, 16 shards,
     * at most 65536 keys per shard.
     */
    class TokenBucketOptions {
    public:
        TokenBucketOptions() noexcept = default;

        TokenBucketOptions &capacity(std::size_t value) noexcept {
            _capacity = value;
            return *this;
        }

        /** @brief Tokens added per second. */
        TokenBucketOptions &refill_rate(double tokens_per_second) noexcept {
            _refill_rate = tokens_per_second;
            return *this;
        }

        TokenBucketOptions &shards(std::size_t value) noexcept {
            _shards = value;
            return *this;
        }

        /** @brief Keys per shard; a new key beyond it evicts the least recently used one. */
        TokenBucketOptions &max_keys_per_shard(std::size_t value) noexcept {
            _max_keys_per_shard = value;
            return *this;
        }

        [[nodiscard]] std::size_t get_capacity() const noexcept { return _capacity; }
        [[nodiscard]] double get_refill_rate() const noexcept { return _refill_rate; }
        [[nodiscard]] std::size_t get_shards() const noexcept { return _shards; }
        [[nodiscard]] std::size_t get_max_keys_per_shard() const noexcept { return _max_keys_per_shard; }

    private:
        std::size_t _capacity = 100;
        double _refill_rate = 10.0;
        std::size_t _shards = 16;
        std::size_t _max_keys_per_shard = 65536;
    };

    namespace detail {

    /**
     * @brief Fixed set of mutex-protected maps selected by key hash.
     *
     * Each shard also keeps its keys in recency order, so the least recently
     * used key can be found and dropped in constant time when the shard is full.
     */
    template<typename State>
    class ShardedMap {
    public:
        class Shard {
            struct Slot {
                State state;
                typename std::list<std::string>::iterator position;
            };

            qb::unordered_map<std::string, Slot> _entries;
            std::list<std::string> _recency; // least recently used first

        public:
            std::mutex mutex;

            /** @brief State of `key`, marked as most recently used. Null if absent. */
            [[nodiscard]] State *touch(const std::string &key) {
                auto it = _entries.find(key);
                if (it == _entries.end())
                    return nullptr;
                _recency.splice(_recency.end(), _recency, it->second.position);
                return &it->second.state;
            }

            /** @brief Adds an absent `key` as most recently used. */
            State &insert(const std::string &key, State state) {
                auto position = _recency.insert(_recency.end(), key);
                return _entries.emplace(key, Slot{std::move(state), position}).first->second.state;
            }

            /** @brief Drops the least recently used key. @return Its name. */
            std::string evict_oldest() {
                std::string key = std::move(_recency.front());
                _recency.pop_front();
                _entries.erase(key);
                return key;
            }

            /** @return true if `key` was present. */
            bool erase(const std::string &key) {
                auto it = _entries.find(key);
                if (it == _entries.end())
                    return false;
                _recency.erase(it->second.position);
                _entries.erase(it);
                return true;
            }

            /** @brief Erases every entry for which `pred(state)` holds. @return The count erased. */
            template<typename Pred>
            std::size_t erase_if(Pred &&pred) {
                std::size_t erased = 0;
                for (auto it = _entries.begin(); it != _entries.end();) {
                    if (pred(it->second.state)) {
                        _recency.erase(it->second.position);
                        it = _entries.erase(it);
                        ++erased;
                    } else {
                        ++it;
                    }
                }
                return erased;
            }

            void clear() {
                _entries.clear();
                _recency.clear();
            }

            [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }
        };

        explicit ShardedMap(std::size_t count) {
            if (count == 0)
                count = 1;
            _shards.reserve(count);
            for (std::size_t i = 0; i < count; ++i)
                _shards.push_back(std::make_unique<Shard>());
        }

        [[nodiscard]] Shard &shard_for(const std::string &key) const {
            return *_shards[std::hash<std::string>()(key) % _shards.size()];
        }

        template<typename Fn>
        void for_each_shard(Fn &&fn) const {
            for (const auto &shard : _shards)
                fn(*shard);
        }

    private:
        std::vector<std::unique_ptr<Shard>> _shards;
    };

    } // namespace detail

    /**
     * @brief Admits at most `max_requests` per key in each window.
     *
     * A key's window starts with its first request. Once `window` has elapsed
     * since that start, the count resets on the next request.
     */
    class FixedWindowRateLimiter : public IRateLimiter {
        struct Window {
            std::size_t count = 0;
            Clock::time_point start;
        };

        RateLimitOptions _options;
        ClockFn _clock;
        detail::ShardedMap<Window> _windows;

    public:
        /**
         * @throws std::invalid_argument if `max_requests` is zero or `window` is not positive.
         */
        explicit FixedWindowRateLimiter(RateLimitOptions options = RateLimitOptions(), ClockFn clock = {});

        [[nodiscard]] RateLimitDecision check(const std::string &key) override;
        void reset(const std::string &key) override;
        void reset_all() override;
        [[nodiscard]] std::size_t size() const override;
        std::size_t purge_idle() override;

        [[nodiscard]] const RateLimitOptions &get_options() const noexcept { return _options; }
    };

    /**
     * @brief Admits a request when the key's bucket holds at least one token.
     *
     * Buckets start full. Tokens accrue continuously at `refill_rate` per
     * second up to `capacity`.
     */
    class TokenBucketRateLimiter : public IRateLimiter {
        struct Bucket {
            double tokens = 0;
            Clock::time_point last_refill;
        };

        TokenBucketOptions _options;
        ClockFn _clock;
        detail::ShardedMap<Bucket> _buckets;

        void refill(Bucket &bucket, Clock::time_point now) const noexcept;

    public:
        /**
         * @throws std::invalid_argument if `capacity` is zero or `refill_rate` is not positive.
         */
        explicit TokenBucketRateLimiter(TokenBucketOptions options = TokenBucketOptions(), ClockFn clock = {});

        [[nodiscard]] RateLimitDecision check(const std::string &key) override;
        void reset(const std::string &key) override;
        void reset_all() override;
        [[nodiscard]] std::size_t size() const override;
        std::size_t purge_idle() override;

        [[nodiscard]] const TokenBucketOptions &get_options() const noexcept { return _options; }
    };

} // namespace weft

/**
 * @file weft/guard/rate_limiter.cpp
 * @brief Fixed window and token bucket admission logic.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Guard
 */
#include "./rate_limiter.h"

#include <algorithm>  // For std::min
#include <cmath>      // For std::ceil, std::floor
#include <stdexcept>  // For std::invalid_argument

#include "../logger.h"

namespace weft {

namespace {

IRateLimiter::ClockFn
default_clock(IRateLimiter::ClockFn clock) {
    if (clock)
        return clock;
    return [] { return IRateLimiter::Clock::now(); };
}

std::chrono::milliseconds
ceil_ms(double seconds) {
    if (seconds <= 0)
        return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
}

template<typename Shard>
void
make_room(Shard &shard, std::size_t max_keys, const char *owner) {
    while (shard.size() > 0 && shard.size() >= max_keys) {
        const auto evicted = shard.evict_oldest();
        LOG_WEFT_DEBUG(owner << ": shard full, evicting key '" << evicted << "'");
    }
}

} // namespace

// --- FixedWindowRateLimiter ---

FixedWindowRateLimiter::FixedWindowRateLimiter(RateLimitOptions options, ClockFn clock)
    : _options(options)
    , _clock(default_clock(std::move(clock)))
    , _windows(options.get_shards()) {
    if (_options.get_max_requests() == 0)
        throw std::invalid_argument("FixedWindowRateLimiter: max_requests must be greater than zero");
    if (_options.get_window().count() <= 0)
        throw std::invalid_argument("FixedWindowRateLimiter: window must be positive");
}

RateLimitDecision
FixedWindowRateLimiter::check(const std::string &key) {
    const auto now = _clock();
    const auto window = _options.get_window();
    const auto limit = _options.get_max_requests();

    auto &shard = _windows.shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    Window *found = shard.touch(key);
    if (!found) {
        make_room(shard, _options.get_max_keys_per_shard(), "FixedWindowRateLimiter");
        found = &shard.insert(key, Window{0, now});
    }

    Window &state = *found;
    if (now - state.start >= window) {
        state.count = 0;
        state.start = now;
    }

    RateLimitDecision decision;
    decision.limit = limit;
    decision.reset_after = std::chrono::duration_cast<std::chrono::milliseconds>(state.start + window - now);
    if (state.count >= limit) {
        decision.allowed = false;
        decision.remaining = 0;
        decision.retry_after = decision.reset_after;
        return decision;
    }

    ++state.count;
    decision.allowed = true;
    decision.remaining = limit - state.count;
    return decision;
}

void
FixedWindowRateLimiter::reset(const std::string &key) {
    auto &shard = _windows.shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.erase(key);
}

void
FixedWindowRateLimiter::reset_all() {
    _windows.for_each_shard([](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.clear();
    });
}

std::size_t
FixedWindowRateLimiter::size() const {
    std::size_t total = 0;
    _windows.for_each_shard([&total](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.size();
    });
    return total;
}

std::size_t
FixedWindowRateLimiter::purge_idle() {
    const auto now = _clock();
    const auto window = _options.get_window();
    std::size_t purged = 0;
    _windows.for_each_shard([&](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        purged += shard.erase_if([&](const Window &state) { return now - state.start >= window; });
    });
    return purged;
}

// --- TokenBucketRateLimiter ---

TokenBucketRateLimiter::TokenBucketRateLimiter(TokenBucketOptions options, ClockFn clock)
    : _options(options)
    , _clock(default_clock(std::move(clock)))
    , _buckets(options.get_shards()) {
    if (_options.get_capacity() == 0)
        throw std::invalid_argument("TokenBucketRateLimiter: capacity must be greater than zero");
    if (!(_options.get_refill_rate() > 0.0))
        throw std::invalid_argument("TokenBucketRateLimiter: refill_rate must be positive");
}

void
TokenBucketRateLimiter::refill(Bucket &bucket, Clock::time_point now) const noexcept {
    if (now <= bucket.last_refill)
        return;
    const std::chrono::duration<double> elapsed = now - bucket.last_refill;
    const auto capacity = static_cast<double>(_options.get_capacity());
    bucket.tokens = std::min(capacity, bucket.tokens + elapsed.count() * _options.get_refill_rate());
    bucket.last_refill = now;
}

RateLimitDecision
TokenBucketRateLimiter::check(const std::string &key) {
    const auto now = _clock();
    const auto capacity = static_cast<double>(_options.get_capacity());
    const auto rate = _options.get_refill_rate();

    auto &shard = _buckets.shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    Bucket *found = shard.touch(key);
    if (!found) {
        make_room(shard, _options.get_max_keys_per_shard(), "TokenBucketRateLimiter");
        found = &shard.insert(key, Bucket{capacity, now});
    }

    Bucket &bucket = *found;
    refill(bucket, now);

    RateLimitDecision decision;
    decision.limit = _options.get_capacity();
    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        decision.allowed = true;
    } else {
        decision.allowed = false;
        decision.retry_after = ceil_ms((1.0 - bucket.tokens) / rate);
    }
    decision.remaining = static_cast<std::size_t>(std::floor(bucket.tokens));
    decision.reset_after = ceil_ms((capacity - bucket.tokens) / rate);
    return decision;
}

void
TokenBucketRateLimiter::reset(const std::string &key) {
    auto &shard = _buckets.shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.erase(key);
}

void
TokenBucketRateLimiter::reset_all() {
    _buckets.for_each_shard([](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.clear();
    });
}

std::size_t
TokenBucketRateLimiter::size() const {
    std::size_t total = 0;
    _buckets.for_each_shard([&total](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.size();
    });
    return total;
}

std::size_t
TokenBucketRateLimiter::purge_idle() {
    const auto now = _clock();
    const auto capacity = static_cast<double>(_options.get_capacity());
    std::size_t purged = 0;
    _buckets.for_each_shard([&](auto &shard) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        purged += shard.erase_if([&](Bucket &bucket) {
            refill(bucket, now);
            return bucket.tokens >= capacity;
        });
    });
    return purged;
}

} // namespace weft

/**
 * @file weft/routing/context_pool.cpp
 * @brief Free list management for `weft::ContextPool`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./context_pool.h"

#include <new> // For std::bad_alloc

#include "../logger.h"

namespace weft {

ContextPool::ContextPool(std::size_t max_idle)
    : _max_idle(max_idle) {
    _free.reserve(max_idle < 64 ? max_idle : 64);
}

ContextPool::Lease
ContextPool::acquire() {
    std::unique_ptr<Context> context;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_free.empty()) {
            context = std::move(_free.back());
            _free.pop_back();
        }
    }
    if (!context) {
        context = std::make_unique<Context>();
        _allocated.fetch_add(1, std::memory_order_relaxed);
    }
    _in_use.fetch_add(1, std::memory_order_relaxed);
    return Lease(*this, std::move(context));
}

void
ContextPool::give_back(std::unique_ptr<Context> context) noexcept {
    _in_use.fetch_sub(1, std::memory_order_relaxed);
    context->reset();

    std::lock_guard<std::mutex> lock(_mutex);
    if (_free.size() >= _max_idle)
        return;
    try {
        _free.push_back(std::move(context));
    } catch (const std::bad_alloc &) {
        LOG_WEFT_WARN("ContextPool: free list growth failed, dropping context");
    }
}

std::size_t
ContextPool::idle() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _free.size();
}

void
ContextPool::shrink(std::size_t keep) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_free.size() > keep)
        _free.resize(keep);
}

} // namespace weft

/**
 * @file weft/routing/context_pool.h
 * @brief Thread-safe free list of reusable `Context` objects.
 *
 * Allocating a context per request would churn the custom data map, the
 * error vector and the response buffers. The pool hands out leases instead:
 * a `Lease` owns its context while a request is served and returns it, reset,
 * when it goes out of scope. A context is returned exactly once no matter how
 * the request ends.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <atomic>  // For std::atomic (counters)
#include <memory>  // For std::unique_ptr
#include <mutex>   // For std::mutex
#include <vector>  // For std::vector (free list)

#include "./context.h" // For weft::Context

namespace weft {

    class ContextPool {
    public:
        /**
         * @brief Exclusive handle on a pooled context.
         *
         * Move-only. Destroying or calling `release()` on a lease resets the
         * context and returns it to the pool; a moved-from lease is empty.
         */
        class Lease {
            ContextPool *_pool = nullptr;
            std::unique_ptr<Context> _context;

        public:
            Lease() = default;
            Lease(ContextPool &pool, std::unique_ptr<Context> context) noexcept
                : _pool(&pool), _context(std::move(context)) {}
            ~Lease() { release(); }

            Lease(const Lease &) = delete;
            Lease &operator=(const Lease &) = delete;
            Lease(Lease &&other) noexcept
                : _pool(other._pool), _context(std::move(other._context)) {
                other._pool = nullptr;
            }
            Lease &operator=(Lease &&other) noexcept {
                if (this != &other) {
                    release();
                    _pool = other._pool;
                    _context = std::move(other._context);
                    other._pool = nullptr;
                }
                return *this;
            }

            [[nodiscard]] Context &operator*() const noexcept { return *_context; }
            [[nodiscard]] Context *operator->() const noexcept { return _context.get(); }
            [[nodiscard]] Context *get() const noexcept { return _context.get(); }
            explicit operator bool() const noexcept { return static_cast<bool>(_context); }

            /** @brief Returns the context to its pool now. Idempotent. */
            void release() noexcept {
                if (_pool && _context)
                    _pool->give_back(std::move(_context));
                _context.reset();
                _pool = nullptr;
            }
        };

    private:
        mutable std::mutex _mutex;
        std::vector<std::unique_ptr<Context>> _free;
        std::size_t _max_idle;
        std::atomic<std::size_t> _allocated{0};
        std::atomic<std::size_t> _in_use{0};

        void give_back(std::unique_ptr<Context> context) noexcept;

    public:
        /** @param max_idle Contexts kept for reuse; extra released contexts are freed. */
        explicit ContextPool(std::size_t max_idle = 1024);

        ContextPool(const ContextPool &) = delete;
        ContextPool &operator=(const ContextPool &) = delete;

        /** @brief Takes an idle context, or allocates one when none is idle. */
        [[nodiscard]] Lease acquire();

        /** @brief Contexts currently waiting in the free list. */
        [[nodiscard]] std::size_t idle() const;
        /** @brief Contexts ever allocated by this pool (including freed ones). */
        [[nodiscard]] std::size_t allocated() const noexcept { return _allocated.load(std::memory_order_relaxed); }
        /** @brief Contexts currently leased out. */
        [[nodiscard]] std::size_t in_use() const noexcept { return _in_use.load(std::memory_order_relaxed); }
        [[nodiscard]] std::size_t max_idle() const noexcept { return _max_idle; }

        /** @brief Frees idle contexts until at most `keep` remain. */
        void shrink(std::size_t keep = 0);
    };

} // namespace weft

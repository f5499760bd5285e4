/**
 * @file weft/routing/middleware.h
 * @brief Object-style middleware and its adaptation to plain handlers.
 *
 * Simple middleware is just a `Handler` lambda. Middleware that carries
 * configuration or shared state (rate limiting, caching) derives from
 * `IMiddleware`; registration functions accept either form and store both
 * as `Handler` entries of the route's chain.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <memory>      // For std::shared_ptr
#include <stdexcept>   // For std::invalid_argument
#include <string>      // For std::string
#include <type_traits> // For std::is_base_of_v, std::decay_t
#include <utility>     // For std::forward

#include "./context.h" // For weft::Context
#include "./types.h"   // For weft::Handler

namespace weft {

    /**
     * @brief Interface for middleware objects.
     *
     * `process()` follows the same contract as a `Handler`: call `ctx.next()` to
     * run the rest of the chain, or write a response and return (optionally after
     * `ctx.abort()`) to stop it.
     */
    class IMiddleware {
    public:
        virtual ~IMiddleware() = default;

        virtual void process(Context &ctx) = 0;

        /** @brief Name used in logs. */
        [[nodiscard]] virtual std::string name() const = 0;
    };

    /**
     * @brief Wraps a middleware object into a chain entry.
     * The handler keeps the middleware alive.
     * @throws std::invalid_argument if `middleware` is null.
     */
    inline Handler make_handler(std::shared_ptr<IMiddleware> middleware) {
        if (!middleware)
            throw std::invalid_argument("make_handler: middleware cannot be null");
        return [mw = std::move(middleware)](Context &ctx) { mw->process(ctx); };
    }

    namespace detail {

    template<typename T>
    struct is_middleware_ptr : std::false_type {};

    template<typename M>
    struct is_middleware_ptr<std::shared_ptr<M>> : std::is_base_of<IMiddleware, M> {};

    /** @brief Converts a lambda, function, `Handler` or `shared_ptr<IMiddleware>` to a `Handler`. */
    template<typename T>
    Handler to_handler(T &&item) {
        if constexpr (is_middleware_ptr<std::decay_t<T>>::value) {
            return make_handler(std::shared_ptr<IMiddleware>(std::forward<T>(item)));
        } else {
            Handler handler(std::forward<T>(item));
            if (!handler)
                throw std::invalid_argument("Handler cannot be empty");
            return handler;
        }
    }

    } // namespace detail

} // namespace weft

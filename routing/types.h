/**
 * @file weft/routing/types.h
 * @brief Handler signatures and registration errors of the routing layer.
 *
 * A route is served by a `HandlerChain`: an ordered list of handlers where
 * every entry but the last is usually middleware. Chains are assembled once
 * at registration time and shared read-only between concurrent requests.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <functional> // For std::function
#include <memory>     // For std::shared_ptr
#include <stdexcept>  // For std::invalid_argument
#include <string>     // For std::string
#include <vector>     // For std::vector

#include "../types.h" // For weft::Method, weft::Status

namespace weft {

    class Context;

    /**
     * @brief A route handler or middleware step.
     *
     * Middleware calls `ctx.next()` to run the rest of the chain; code placed
     * after that call runs while the chain unwinds. Returning without calling
     * `next()` ends the chain.
     */
    using Handler = std::function<void(Context &ctx)>;

    /** @brief Ordered handlers of a route: global, group and route middleware, then the final handler. */
    using HandlerChain = std::vector<Handler>;

    /** @brief Immutable chain shared by the route tree and every request served by it. */
    using HandlerChainPtr = std::shared_ptr<const HandlerChain>;

    /**
     * @brief A route pattern that cannot be parsed.
     *
     * Raised for patterns not starting with '/', empty `:` or `*` names, a
     * catch-all that is not the last segment, or an empty segment in the middle
     * of the pattern.
     */
    class RoutePatternError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief A route pattern that clashes with one already registered.
     *
     * Raised when two parameter (or two catch-all) segments with different names
     * occupy the same position, or when the same method and pattern are
     * registered twice.
     */
    class RouteConflictError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

} // namespace weft

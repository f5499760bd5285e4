/**
 * @file weft/routing/route_group.h
 * @brief Route registration with shared prefixes and middleware.
 *
 * A `RouteGroup` prefixes every pattern registered through it and prepends
 * its middleware to every chain. Chains are assembled when a route is
 * registered: global middleware, then each enclosing group's middleware from
 * the outermost in, then the route's own handlers. Middleware added with
 * `use()` therefore only applies to routes and subgroups registered after it.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <memory>   // For std::unique_ptr
#include <string>   // For std::string
#include <utility>  // For std::forward
#include <vector>   // For std::vector

#include "../types.h"        // For weft::Method
#include "./middleware.h"    // For detail::to_handler
#include "./radix_tree.h"    // For weft::RouteTree
#include "./types.h"         // For weft::Handler, weft::HandlerChain

namespace weft {

    class RouteGroup {
    protected:
        RouteTree *_tree;
        std::string _prefix;
        HandlerChain _middleware;
        std::vector<std::unique_ptr<RouteGroup>> _children;

        /** @brief Subgroups are only created through `group()`. */
        struct ChildTag {
            explicit ChildTag() = default;
        };

        RouteGroup(RouteTree &tree, std::string prefix, HandlerChain middleware)
            : _tree(&tree), _prefix(std::move(prefix)), _middleware(std::move(middleware)) {}

        template<typename... H>
        static HandlerChain to_chain(H &&... handlers) {
            HandlerChain chain;
            chain.reserve(sizeof...(H));
            (chain.push_back(detail::to_handler(std::forward<H>(handlers))), ...);
            return chain;
        }

        void register_route(Method method, const std::string &pattern, HandlerChain handlers);
        void ensure_mutable(const char *operation) const;

    public:
        RouteGroup(ChildTag, RouteTree &tree, std::string prefix, HandlerChain middleware)
            : RouteGroup(tree, std::move(prefix), std::move(middleware)) {}

        RouteGroup(const RouteGroup &) = delete;
        RouteGroup &operator=(const RouteGroup &) = delete;
        virtual ~RouteGroup() = default;

        /**
         * @brief Joins a group prefix and a relative pattern.
         * `("/api", "/users")` gives "/api/users"; `("/api", "/")` gives "/api/".
         */
        [[nodiscard]] static std::string join_paths(const std::string &prefix, const std::string &relative);

        /**
         * @brief Appends middleware for routes registered afterwards.
         * Accepts lambdas, `Handler`s and `std::shared_ptr` to `IMiddleware` types.
         * @throws std::logic_error once serving has started.
         */
        template<typename... H>
        RouteGroup &use(H &&... middleware) {
            ensure_mutable("use");
            auto chain = to_chain(std::forward<H>(middleware)...);
            _middleware.insert(_middleware.end(), chain.begin(), chain.end());
            return *this;
        }

        /**
         * @brief Creates a subgroup.
         * @param prefix Pattern prefix, relative to this group.
         * @param middleware Middleware applied to every route of the subgroup.
         * @return The subgroup, owned by this group.
         */
        template<typename... H>
        RouteGroup &group(const std::string &prefix, H &&... middleware) {
            ensure_mutable("group");
            HandlerChain inherited = _middleware;
            auto own = to_chain(std::forward<H>(middleware)...);
            inherited.insert(inherited.end(), own.begin(), own.end());
            _children.push_back(std::make_unique<RouteGroup>(
                ChildTag{}, *_tree, join_paths(_prefix, prefix), std::move(inherited)));
            return *_children.back();
        }

        /**
         * @brief Registers a route.
         * @param method HTTP method.
         * @param pattern Pattern relative to the group prefix.
         * @param handlers Route middleware followed by the final handler. At least one.
         * @throws RoutePatternError, RouteConflictError, std::invalid_argument, std::logic_error
         */
        template<typename... H>
        RouteGroup &add_route(Method method, const std::string &pattern, H &&... handlers) {
            static_assert(sizeof...(H) > 0, "A route needs at least one handler");
            register_route(method, pattern, to_chain(std::forward<H>(handlers)...));
            return *this;
        }

        template<typename... H>
        RouteGroup &get(const std::string &pattern, H &&... handlers) {
            return add_route(Method::GET, pattern, std::forward<H>(handlers)...);
        }

        template<typename... H>
        RouteGroup &post(const std::string &pattern, H &&... handlers) {
            return add_route(Method::POST, pattern, std::forward<H>(handlers)...);
        }

        template<typename... H>
        RouteGroup &put(const std::string &pattern, H &&... handlers) {
            return add_route(Method::PUT, pattern, std::forward<H>(handlers)...);
        }

        template<typename... H>
        RouteGroup &del(const std::string &pattern, H &&... handlers) {
            return add_route(Method::DEL, pattern, std::forward<H>(handlers)...);
        }

        template<typename... H>
        RouteGroup &patch(const std::string &pattern, H &&... handlers) {
            return add_route(Method::PATCH, pattern, std::forward<H>(handlers)...);
        }

        template<typename... H>
        RouteGroup &options(const std::string &pattern, H &&... handlers) {
            return add_route(Method::OPTIONS, pattern, std::forward<H>(handlers)...);
        }

        template<typename... H>
        RouteGroup &head(const std::string &pattern, H &&... handlers) {
            return add_route(Method::HEAD, pattern, std::forward<H>(handlers)...);
        }

        /** @brief Registers the same chain for every method in `Method::common()`. */
        template<typename... H>
        RouteGroup &any(const std::string &pattern, H &&... handlers) {
            static_assert(sizeof...(H) > 0, "A route needs at least one handler");
            const auto chain = to_chain(std::forward<H>(handlers)...);
            for (auto method : Method::common())
                register_route(method, pattern, chain);
            return *this;
        }

        [[nodiscard]] const std::string &prefix() const noexcept { return _prefix; }
        [[nodiscard]] std::size_t middleware_count() const noexcept { return _middleware.size(); }
    };

} // namespace weft

/**
 * @file weft/routing/radix_tree.h
 * @brief Per-method segment tree mapping request paths to handler chains.
 *
 * `RouteTree` keeps one tree per HTTP method. Each tree node is one path
 * segment and can have three kinds of children:
 * - static children, keyed by their literal text (e.g. `users`);
 * - at most one parameter child (`:id`), matching any non-empty segment;
 * - at most one catch-all child (`*path`), matching the whole remainder.
 *
 * Lookup prefers static over parameter over catch-all, and backtracks, so a
 * static or parameter route deeper in the tree always beats a catch-all
 * registered at a shallower node. Trailing slashes are significant:
 * `/users` and `/users/` are different routes.
 *
 * The tree is built before serving starts and is only read afterwards, so
 * concurrent `match()` calls need no locking. `freeze()` enforces that.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <map>          // For std::map (one root per method)
#include <memory>       // For std::unique_ptr
#include <optional>     // For std::optional (match result)
#include <string>       // For std::string
#include <string_view>  // For std::string_view
#include <vector>       // For std::vector

#include <qb/system/container/unordered_map.h> // For qb::unordered_map (static children)

#include "../types.h"           // For weft::Method
#include "./path_parameters.h"  // For weft::PathParameters
#include "./types.h"            // For HandlerChainPtr, RoutePatternError, RouteConflictError

namespace weft {

    /**
     * @brief Result of a successful `RouteTree::match()`.
     */
    struct RouteMatch {
        /** @brief Chain registered for the route. Never null. */
        HandlerChainPtr chain;
        /** @brief Captured `:name` and `*name` values, still percent-encoded. */
        PathParameters params;
        /** @brief The registered pattern (e.g. "/users/:id"). Views into the tree. */
        std::string_view pattern;
    };

    /** @brief One registered route, as listed by `RouteTree::routes()`. */
    struct RouteInfo {
        Method method;
        std::string pattern;
        std::size_t handler_count = 0;
    };

    class RouteTree {
        enum class NodeType {
            ROOT,
            STATIC,
            PARAMETER,
            CATCH_ALL
        };

        struct Node {
            NodeType type = NodeType::STATIC;
            /** @brief Literal text for STATIC nodes, the bound name for PARAMETER and CATCH_ALL. */
            std::string segment;
            /** @brief Keys view into the child's own `segment`, which never moves. */
            qb::unordered_map<std::string_view, std::unique_ptr<Node>> static_children;
            std::unique_ptr<Node> param_child;
            std::unique_ptr<Node> catch_all_child;
            /** @brief Set only on the terminal node of a registered route. */
            HandlerChainPtr chain;
            std::string pattern;

            Node(NodeType t, std::string seg)
                : type(t), segment(std::move(seg)) {}
        };

        std::map<Method, std::unique_ptr<Node>> _roots;
        std::size_t _route_count = 0;
        bool _frozen = false;

        /**
         * @brief Splits and validates a route pattern.
         * @throws RoutePatternError on malformed input.
         */
        static std::vector<std::string_view> split_pattern(std::string_view pattern);

        /** @brief Splits a request path. Returns false if the path cannot match any route. */
        static bool split_path(std::string_view path, std::vector<std::string_view> &segments);

        static const Node *find(const Node &node, const std::vector<std::string_view> &segments,
                                std::size_t index, PathParameters &params);

        static void collect(const Node &node, Method method, std::vector<RouteInfo> &out);

    public:
        RouteTree() = default;
        RouteTree(const RouteTree &) = delete;
        RouteTree &operator=(const RouteTree &) = delete;

        /**
         * @brief Registers `chain` for `method` and `pattern`.
         *
         * @param method HTTP method of the route.
         * @param pattern Path pattern, starting with '/'. Segments are literals,
         *        `:name` parameters or a final `*name` catch-all.
         * @param chain Non-empty handler chain.
         * @throws RoutePatternError If the pattern is malformed.
         * @throws RouteConflictError If the pattern clashes with a registered route.
         * @throws std::invalid_argument If `chain` is null or empty.
         * @throws std::logic_error If the tree is frozen.
         */
        void add(Method method, const std::string &pattern, HandlerChainPtr chain);

        /**
         * @brief Finds the route serving `method` and `path`.
         * @param method Request method.
         * @param path Request path, percent-encoded, without query string.
         * @return The matched chain, captured parameters and pattern, or `std::nullopt`.
         */
        [[nodiscard]] std::optional<RouteMatch> match(Method method, std::string_view path) const;

        /**
         * @brief Methods that have a route matching `path`, in ascending enum order.
         * Used to build 405 responses and their `Allow` header.
         */
        [[nodiscard]] std::vector<Method> allowed_methods(std::string_view path) const;

        /** @brief Every registered route, sorted by pattern then method. */
        [[nodiscard]] std::vector<RouteInfo> routes() const;

        [[nodiscard]] std::size_t size() const noexcept { return _route_count; }
        [[nodiscard]] bool empty() const noexcept { return _route_count == 0; }

        /** @brief Makes further `add()` calls throw. Called by the engine when serving starts. */
        void freeze() noexcept { _frozen = true; }
        [[nodiscard]] bool is_frozen() const noexcept { return _frozen; }

        /** @brief Drops all routes and unfreezes the tree. Not safe while serving. */
        void clear() noexcept;
    };

} // namespace weft

/**
 * @file weft/routing/engine.h
 * @brief Request dispatcher tying route tree, context pool and handler chains together.
 *
 * `Engine` is the root `RouteGroup` of an application. Routes and middleware
 * are registered on it (or on its subgroups) at startup; the transport then
 * calls `serve_one()` for every parsed request, from as many threads as it
 * likes. Each call:
 *  1. leases a `Context` from the pool,
 *  2. matches the request against the route tree,
 *  3. initializes the context with the matched chain and parameters,
 *  4. runs the chain inside a recovery boundary,
 *  5. hands the response to the writer exactly once,
 *  6. runs the finalization callback and returns the context to the pool.
 *
 * Any exception escaping a handler is caught at step 4, logged with the
 * request method and path, recorded on the context as a panic error, and
 * turned into a 500 response. Other requests are unaffected.
 *
 * The first `serve_one()` freezes the route table; registering afterwards
 * throws `std::logic_error`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <atomic>      // For std::atomic (statistics)
#include <functional>  // For std::function
#include <mutex>       // For std::once_flag
#include <string>      // For std::string
#include <vector>      // For std::vector

#include "../request.h"         // For weft::Request
#include "../response.h"        // For weft::IResponseWriter
#include "./context.h"          // For weft::Context
#include "./context_pool.h"     // For weft::ContextPool
#include "./engine_options.h"   // For weft::EngineOptions
#include "./radix_tree.h"       // For weft::RouteTree, weft::RouteInfo
#include "./route_group.h"      // For weft::RouteGroup
#include "./types.h"            // For weft::Handler, weft::HandlerChainPtr

namespace weft {

    class Engine : public RouteGroup {
    public:
        /** @brief Called with the finished context after the response was written. */
        using FinalizedCallback = std::function<void(const Context &ctx)>;

        /** @brief Counters since construction. */
        struct Stats {
            std::size_t served = 0;
            std::size_t panics = 0;
            std::size_t not_found = 0;
            std::size_t method_not_allowed = 0;
            std::size_t redirects = 0;
            std::size_t write_failures = 0;
        };

    private:
        RouteTree _tree;
        EngineOptions _options;
        ContextPool _pool;

        Handler _not_found_handler;
        Handler _method_not_allowed_handler;
        FinalizedCallback _on_finalized;

        // Global middleware + special handler, built when the routes freeze.
        HandlerChainPtr _not_found_chain;
        HandlerChainPtr _method_not_allowed_chain;
        std::once_flag _freeze_once;

        std::atomic<std::size_t> _served{0};
        std::atomic<std::size_t> _panics{0};
        std::atomic<std::size_t> _not_found{0};
        std::atomic<std::size_t> _method_not_allowed{0};
        std::atomic<std::size_t> _redirects{0};
        std::atomic<std::size_t> _write_failures{0};

        void freeze_routes();
        [[nodiscard]] HandlerChainPtr special_chain(const Handler &handler) const;

        /** @brief Tries the trailing-slash redirect. Returns true if the context now holds a redirect. */
        bool try_trailing_slash_redirect(Context &ctx, const Request &request);
        void execute(Context &ctx);
        void recover(Context &ctx, const char *what);
        void finalize(Context &ctx, IResponseWriter &writer);

    public:
        explicit Engine(EngineOptions options = EngineOptions());

        /**
         * @brief Replaces the handler run when no route matches.
         * Global middleware still runs before it. Default: 404 "Not Found".
         * @throws std::invalid_argument if `handler` is empty; std::logic_error once frozen.
         */
        Engine &set_not_found_handler(Handler handler);

        /**
         * @brief Replaces the handler run for 405 responses (see `EngineOptions::handle_method_not_allowed`).
         * The `Allow` header is already set when it runs. Default: 405 "Method Not Allowed".
         */
        Engine &set_method_not_allowed_handler(Handler handler);

        /** @brief Registers a callback run after every response is written, before the context is released. */
        Engine &on_request_finalized(FinalizedCallback callback);

        /**
         * @brief Serves one request.
         *
         * Safe to call concurrently. Never throws because of handler code; only
         * allocation failure can escape.
         *
         * @param request Parsed request. Must stay alive for the duration of the call.
         * @param writer Transport sink; `write()` is called exactly once.
         */
        void serve_one(Request &request, IResponseWriter &writer);

        /** @brief Freezes the route table. Implicit on the first `serve_one()`. */
        void freeze();
        [[nodiscard]] bool is_frozen() const noexcept { return _tree.is_frozen(); }

        [[nodiscard]] std::vector<RouteInfo> route_list() const { return _tree.routes(); }
        [[nodiscard]] const RouteTree &tree() const noexcept { return _tree; }
        [[nodiscard]] const ContextPool &pool() const noexcept { return _pool; }
        [[nodiscard]] const EngineOptions &engine_options() const noexcept { return _options; }
        [[nodiscard]] Stats stats() const noexcept;
    };

} // namespace weft

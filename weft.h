/**
 * @file weft/weft.h
 * @brief Single include for the weft routing engine.
 *
 * weft routes already-parsed HTTP requests through per-route handler chains:
 * - `Engine` / `RouteGroup`: route and middleware registration, dispatch
 * - `RouteTree`: static, `:param` and `*catch_all` path matching
 * - `Context` / `ContextPool`: pooled per-request state and chain control
 * - `FixedWindowRateLimiter`, `TokenBucketRateLimiter`, `FragmentCache`: shared guards
 * - middleware built on them: rate limiting, response caching, logging, timeouts
 *
 * @code
 * weft::Engine engine;
 * engine.use(weft::logging_middleware(my_log));
 * engine.get("/users/:id", [](weft::Context &ctx) {
 *     ctx.text("user " + ctx.path_param("id"));
 * });
 * // in the transport, per parsed request:
 * engine.serve_one(request, writer);
 * @endcode
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Http
 */
#ifndef WEFT_H_
#define WEFT_H_

#include "./types.h"
#include "./request.h"
#include "./response.h"
#include "./routing/types.h"
#include "./routing/path_parameters.h"
#include "./routing/radix_tree.h"
#include "./routing/context.h"
#include "./routing/context_pool.h"
#include "./routing/middleware.h"
#include "./routing/route_group.h"
#include "./routing/engine_options.h"
#include "./routing/engine.h"
#include "./guard/rate_limiter.h"
#include "./guard/fragment_cache.h"
#include "./middleware/rate_limit.h"
#include "./middleware/response_cache.h"
#include "./middleware/logging.h"
#include "./middleware/timeout.h"

#endif // WEFT_H_

/**
 * @file weft/routing/engine.cpp
 * @brief Dispatch loop and recovery boundary of `weft::Engine`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./engine.h"

#include <exception>  // For std::exception
#include <stdexcept>  // For std::invalid_argument, std::logic_error

#include <qb/io/uri.h> // For qb::io::uri::decode

#include "../logger.h"

namespace weft {

Engine::Engine(EngineOptions options)
    : RouteGroup(_tree, "", {})
    , _options(options)
    , _pool(options.get_max_idle_contexts())
    , _not_found_handler([](Context &ctx) { ctx.text("Not Found", Status::NOT_FOUND); })
    , _method_not_allowed_handler([](Context &ctx) {
        ctx.text("Method Not Allowed", Status::METHOD_NOT_ALLOWED);
    }) {}

Engine &
Engine::set_not_found_handler(Handler handler) {
    if (!handler)
        throw std::invalid_argument("Engine::set_not_found_handler: handler cannot be empty");
    ensure_mutable("set_not_found_handler");
    _not_found_handler = std::move(handler);
    return *this;
}

Engine &
Engine::set_method_not_allowed_handler(Handler handler) {
    if (!handler)
        throw std::invalid_argument("Engine::set_method_not_allowed_handler: handler cannot be empty");
    ensure_mutable("set_method_not_allowed_handler");
    _method_not_allowed_handler = std::move(handler);
    return *this;
}

Engine &
Engine::on_request_finalized(FinalizedCallback callback) {
    ensure_mutable("on_request_finalized");
    _on_finalized = std::move(callback);
    return *this;
}

HandlerChainPtr
Engine::special_chain(const Handler &handler) const {
    HandlerChain chain = _middleware;
    chain.push_back(handler);
    return std::make_shared<const HandlerChain>(std::move(chain));
}

void
Engine::freeze_routes() {
    _not_found_chain = special_chain(_not_found_handler);
    _method_not_allowed_chain = special_chain(_method_not_allowed_handler);
    _tree.freeze();
    LOG_WEFT_INFO("Engine serving " << _tree.size() << " routes with "
                  << _middleware.size() << " global middleware");
}

void
Engine::freeze() {
    std::call_once(_freeze_once, [this] { freeze_routes(); });
}

bool
Engine::try_trailing_slash_redirect(Context &ctx, const Request &request) {
    const std::string path(request.path());
    if (path.empty() || path == "/")
        return false;

    std::string alternate = path;
    if (alternate.back() == '/')
        alternate.pop_back();
    else
        alternate.push_back('/');

    if (!_tree.match(request.method(), alternate))
        return false;

    const auto query = request.raw_query();
    if (!query.empty()) {
        alternate += '?';
        alternate += query;
    }
    const Status code = request.method() == Method::GET ? Status::MOVED_PERMANENTLY
                                                        : Status::PERMANENT_REDIRECT;
    LOG_WEFT_DEBUG("Trailing slash redirect: " << request.method() << " " << path << " -> " << alternate);
    ctx.redirect(alternate, code);
    _redirects.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void
Engine::serve_one(Request &request, IResponseWriter &writer) {
    freeze();

    auto lease = _pool.acquire();
    Context &ctx = *lease;
    const auto path = request.path();

    if (path.size() > _options.get_max_path_length()) {
        LOG_WEFT_WARN("Path length exceeds maximum (" << path.size() << " > "
                      << _options.get_max_path_length() << "): " << path.substr(0, 100) << "...");
        ctx.init(request, &writer, {}, nullptr);
        ctx.text("Path too long", Status::BAD_REQUEST);
        finalize(ctx, writer);
        return;
    }

    LOG_WEFT_TRACE("Routing request: " << request.method() << " " << path);

    if (auto matched = _tree.match(request.method(), path)) {
        if (_options.get_decode_path_parameters()) {
            for (auto &param : matched->params)
                param.second = qb::io::uri::decode(param.second);
        }
        ctx.init(request, &writer, std::move(matched->params), std::move(matched->chain), matched->pattern);
        execute(ctx);
        finalize(ctx, writer);
        return;
    }

    if (_options.get_redirect_trailing_slash()) {
        ctx.init(request, &writer, {}, nullptr);
        if (try_trailing_slash_redirect(ctx, request)) {
            finalize(ctx, writer);
            return;
        }
    }

    if (_options.get_handle_method_not_allowed()) {
        const auto methods = _tree.allowed_methods(path);
        if (!methods.empty()) {
            std::string allow;
            for (const auto method : methods) {
                if (!allow.empty())
                    allow += ", ";
                allow += method.name();
            }
            LOG_WEFT_DEBUG("Method not allowed: " << request.method() << " " << path << " (Allow: " << allow << ")");
            ctx.init(request, &writer, {}, _method_not_allowed_chain);
            ctx.response().set_header("Allow", std::move(allow));
            _method_not_allowed.fetch_add(1, std::memory_order_relaxed);
            execute(ctx);
            finalize(ctx, writer);
            return;
        }
    }

    LOG_WEFT_DEBUG("No route matched for: " << request.method() << " " << path << " (404)");
    ctx.init(request, &writer, {}, _not_found_chain);
    _not_found.fetch_add(1, std::memory_order_relaxed);
    execute(ctx);
    finalize(ctx, writer);
}

void
Engine::execute(Context &ctx) {
    try {
        ctx.next();
    } catch (const std::exception &e) {
        recover(ctx, e.what());
    } catch (...) {
        recover(ctx, "non-standard exception");
    }
}

void
Engine::recover(Context &ctx, const char *what) {
    _panics.fetch_add(1, std::memory_order_relaxed);
    LOG_WEFT_ERROR("Recovered from handler exception - Method: " << ctx.method()
                   << ", Path: " << ctx.path() << ", Error: " << what);
    ctx.add_error(what, ContextError::Kind::Panic);
    ctx.abort();
    ctx.response().reset();
    if (_options.get_expose_error_details())
        ctx.text(std::string("Internal Server Error: ") + what, Status::INTERNAL_SERVER_ERROR);
    else
        ctx.text("Internal Server Error", Status::INTERNAL_SERVER_ERROR);
}

void
Engine::finalize(Context &ctx, IResponseWriter &writer) {
    try {
        writer.write(ctx.response());
    } catch (const std::exception &e) {
        _write_failures.fetch_add(1, std::memory_order_relaxed);
        LOG_WEFT_ERROR("Response write failed - Method: " << ctx.method()
                       << ", Path: " << ctx.path() << ", Error: " << e.what());
        ctx.add_error(std::string("response write failed: ") + e.what());
    }

    _served.fetch_add(1, std::memory_order_relaxed);

    if (_on_finalized) {
        try {
            _on_finalized(ctx);
        } catch (const std::exception &e) {
            LOG_WEFT_ERROR("Finalization callback failed - Path: " << ctx.path() << ", Error: " << e.what());
        }
    }
}

Engine::Stats
Engine::stats() const noexcept {
    Stats s;
    s.served = _served.load(std::memory_order_relaxed);
    s.panics = _panics.load(std::memory_order_relaxed);
    s.not_found = _not_found.load(std::memory_order_relaxed);
    s.method_not_allowed = _method_not_allowed.load(std::memory_order_relaxed);
    s.redirects = _redirects.load(std::memory_order_relaxed);
    s.write_failures = _write_failures.load(std::memory_order_relaxed);
    return s;
}

} // namespace weft

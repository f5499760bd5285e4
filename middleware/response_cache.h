/**
 * @file weft/middleware/response_cache.h
 * @brief Middleware serving repeated GET/HEAD requests from a `FragmentCache`.
 *
 * On a hit the cached response is replayed and the chain is aborted. On a
 * miss the chain runs and a successful, error-free response is stored for the
 * configured TTL. A cached entry is a `qb::json` object holding the status
 * code, every response header and the body.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <algorithm>   // For std::find
#include <chrono>      // For std::chrono::milliseconds
#include <functional>  // For std::function
#include <memory>      // For std::shared_ptr, std::make_shared
#include <stdexcept>   // For std::invalid_argument
#include <string>      // For std::string
#include <utility>     // For std::move
#include <vector>      // For std::vector

#include <qb/json.h>  // For qb::json

#include "../guard/fragment_cache.h" // For weft::FragmentCache
#include "../logger.h"               // For LOG_WEFT_TRACE, LOG_WEFT_DEBUG
#include "../routing/middleware.h"   // For weft::IMiddleware, weft::Context

namespace weft {

    class ResponseCacheOptions {
    public:
        using KeyFunction = std::function<std::string(const Context &)>;

        ResponseCacheOptions() : _cacheable_statuses{Status::OK} {}

        template<typename Rep, typename Period>
        ResponseCacheOptions &ttl(const std::chrono::duration<Rep, Period> &value) noexcept {
            _ttl = std::chrono::duration_cast<std::chrono::milliseconds>(value);
            return *this;
        }

        ResponseCacheOptions &cacheable_statuses(std::vector<Status> statuses) {
            _cacheable_statuses = std::move(statuses);
            return *this;
        }

        /** @brief Overrides the cache key. Default: method, path and raw query. */
        ResponseCacheOptions &key_function(KeyFunction fn) {
            _key_function = std::move(fn);
            return *this;
        }

        [[nodiscard]] std::chrono::milliseconds get_ttl() const noexcept { return _ttl; }
        [[nodiscard]] const std::vector<Status> &get_cacheable_statuses() const noexcept { return _cacheable_statuses; }

        [[nodiscard]] bool is_cacheable(Status status) const {
            return std::find(_cacheable_statuses.begin(), _cacheable_statuses.end(), status) != _cacheable_statuses.end();
        }

        [[nodiscard]] std::string make_key(const Context &ctx) const {
            if (_key_function)
                return _key_function(ctx);
            std::string key(ctx.method().name());
            key += ' ';
            key += ctx.path();
            const auto query = ctx.request().raw_query();
            if (!query.empty()) {
                key += '?';
                key += query;
            }
            return key;
        }

    private:
        std::chrono::milliseconds _ttl = std::chrono::seconds(10);
        std::vector<Status> _cacheable_statuses;
        KeyFunction _key_function;
    };

    class ResponseCacheMiddleware : public IMiddleware {
    public:
        /** @throws std::invalid_argument if `cache` is null. */
        explicit ResponseCacheMiddleware(std::shared_ptr<FragmentCache> cache,
                                         ResponseCacheOptions options = ResponseCacheOptions(),
                                         std::string name = "ResponseCacheMiddleware")
            : _cache(std::move(cache)), _options(std::move(options)), _name(std::move(name)) {
            if (!_cache)
                throw std::invalid_argument("ResponseCacheMiddleware: cache cannot be null");
        }

        void process(Context &ctx) override {
            if (ctx.method() != Method::GET && ctx.method() != Method::HEAD) {
                ctx.next();
                return;
            }

            const auto key = _options.make_key(ctx);
            if (auto cached = _cache->get(key)) {
                if (replay(ctx, *cached)) {
                    LOG_WEFT_TRACE("[" << _name << "] HIT " << key);
                    ctx.set_header("X-Cache", "HIT");
                    ctx.abort();
                    return;
                }
                LOG_WEFT_DEBUG("[" << _name << "] dropping unreadable entry " << key);
                _cache->erase(key);
            }

            ctx.next();

            ctx.set_header("X-Cache", "MISS");
            const auto &response = ctx.response();
            if (!_options.is_cacheable(response.status()) || ctx.has_errors())
                return;
            _cache->set_for(key, serialize(response), _options.get_ttl());
        }

        [[nodiscard]] std::string name() const override { return _name; }

    private:
        static std::string serialize(const Response &response) {
            qb::json headers = qb::json::object();
            for (const auto &[name, values] : response.headers()) {
                if (name == "X-Cache")
                    continue;
                headers[name] = values;
            }
            qb::json entry = {{"status", response.status().code()},
                              {"headers", std::move(headers)},
                              {"body", response.body()}};
            return entry.dump();
        }

        /** @return false if `entry` is not a response stored by this middleware. */
        static bool replay(Context &ctx, const std::string &entry) {
            const auto parsed = qb::json::parse(entry, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object())
                return false;
            const auto status = parsed.find("status");
            const auto headers = parsed.find("headers");
            const auto body = parsed.find("body");
            if (status == parsed.end() || !status->is_number_integer() ||
                headers == parsed.end() || !headers->is_object() ||
                body == parsed.end() || !body->is_string())
                return false;
            for (const auto &[name, values] : headers->items()) {
                if (!values.is_array())
                    return false;
                for (const auto &value : values)
                    if (!value.is_string())
                        return false;
            }

            Response response(Status(status->get<int>()), body->get<std::string>());
            for (const auto &[name, values] : headers->items())
                for (const auto &value : values)
                    response.add_header(name, value.get<std::string>());
            ctx.send(std::move(response));
            return true;
        }

        std::shared_ptr<FragmentCache> _cache;
        ResponseCacheOptions _options;
        std::string _name;
    };

    [[nodiscard]] inline std::shared_ptr<ResponseCacheMiddleware>
    response_cache_middleware(std::shared_ptr<FragmentCache> cache,
                              ResponseCacheOptions options = ResponseCacheOptions(),
                              const std::string &name = "ResponseCacheMiddleware") {
        return std::make_shared<ResponseCacheMiddleware>(std::move(cache), std::move(options), name);
    }

} // namespace weft

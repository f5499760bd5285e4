/**
 * @file weft/middleware/rate_limit.h
 * @brief Middleware rejecting clients that exceed the allowance of an `IRateLimiter`.
 *
 * The middleware derives a client key from the request, asks the shared
 * limiter for a decision, and either continues the chain or answers with
 * 429 and aborts. Standard `X-RateLimit-*` headers are set on both paths.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <chrono>      // For std::chrono::duration_cast, seconds
#include <functional>  // For std::function
#include <memory>      // For std::shared_ptr, std::make_shared
#include <stdexcept>   // For std::invalid_argument
#include <string>      // For std::string, std::to_string
#include <utility>     // For std::move

#include "../guard/rate_limiter.h"  // For weft::IRateLimiter, weft::RateLimitDecision
#include "../logger.h"              // For LOG_WEFT_DEBUG
#include "../routing/middleware.h"  // For weft::IMiddleware, weft::Context
#include "../types.h"               // For weft::Status

namespace weft {

    /**
     * @brief Response and keying behaviour of `RateLimitMiddleware`.
     */
    class RateLimitMiddlewareOptions {
    public:
        using ClientIdExtractor = std::function<std::string(const Context &)>;

        RateLimitMiddlewareOptions() = default;

        RateLimitMiddlewareOptions &status_code(Status code) noexcept {
            _status_code = code;
            return *this;
        }

        RateLimitMiddlewareOptions &message(std::string msg) {
            _message = std::move(msg);
            return *this;
        }

        /** @brief Overrides how the client key is derived from a request. */
        RateLimitMiddlewareOptions &client_id_extractor(ClientIdExtractor extractor) {
            _extractor = std::move(extractor);
            return *this;
        }

        /** @brief Enables or disables the `X-RateLimit-*` and `Retry-After` headers. */
        RateLimitMiddlewareOptions &send_headers(bool enabled) noexcept {
            _send_headers = enabled;
            return *this;
        }

        [[nodiscard]] Status get_status_code() const noexcept { return _status_code; }
        [[nodiscard]] const std::string &get_message() const noexcept { return _message; }
        [[nodiscard]] bool get_send_headers() const noexcept { return _send_headers; }

        /**
         * @brief Client key for `ctx`.
         *
         * Uses the custom extractor when set. Otherwise the first address of
         * `X-Forwarded-For`, then the transport's remote address, then
         * "unknown_client".
         */
        [[nodiscard]] std::string extract_client_id(const Context &ctx) const {
            if (_extractor)
                return _extractor(ctx);

            const auto forwarded = ctx.header("X-Forwarded-For");
            if (!forwarded.empty()) {
                auto first = forwarded.substr(0, forwarded.find(','));
                const auto begin = first.find_first_not_of(' ');
                const auto end = first.find_last_not_of(' ');
                if (begin != std::string::npos)
                    return first.substr(begin, end - begin + 1);
            }
            const auto &remote = ctx.request().remote_address();
            if (!remote.empty())
                return remote;
            return "unknown_client";
        }

    private:
        Status _status_code = Status::TOO_MANY_REQUESTS;
        std::string _message = "Rate limit exceeded. Please try again later.";
        ClientIdExtractor _extractor;
        bool _send_headers = true;
    };

    class RateLimitMiddleware : public IMiddleware {
    public:
        /**
         * @param limiter Shared limiter state. Must not be null.
         * @param options Response and keying behaviour.
         * @param name Name used in logs.
         * @throws std::invalid_argument if `limiter` is null.
         */
        explicit RateLimitMiddleware(std::shared_ptr<IRateLimiter> limiter,
                                     RateLimitMiddlewareOptions options = RateLimitMiddlewareOptions(),
                                     std::string name = "RateLimitMiddleware")
            : _limiter(std::move(limiter)), _options(std::move(options)), _name(std::move(name)) {
            if (!_limiter)
                throw std::invalid_argument("RateLimitMiddleware: limiter cannot be null");
        }

        void process(Context &ctx) override {
            const auto client_id = _options.extract_client_id(ctx);
            const auto decision = _limiter->check(client_id);

            if (_options.get_send_headers())
                add_headers(ctx.response(), decision);

            if (!decision.allowed) {
                LOG_WEFT_DEBUG("[" << _name << "] Rejected client '" << client_id << "' on " << ctx.path());
                ctx.text(_options.get_message(), _options.get_status_code());
                ctx.abort();
                return;
            }
            ctx.next();
        }

        [[nodiscard]] std::string name() const override { return _name; }

        [[nodiscard]] const std::shared_ptr<IRateLimiter> &limiter() const noexcept { return _limiter; }
        [[nodiscard]] const RateLimitMiddlewareOptions &get_options() const noexcept { return _options; }

    private:
        std::shared_ptr<IRateLimiter> _limiter;
        RateLimitMiddlewareOptions _options;
        std::string _name;

        static long long seconds_up(std::chrono::milliseconds ms) noexcept {
            return (ms.count() + 999) / 1000;
        }

        static void add_headers(Response &response, const RateLimitDecision &decision) {
            response.set_header("X-RateLimit-Limit", std::to_string(decision.limit));
            response.set_header("X-RateLimit-Remaining", std::to_string(decision.remaining));
            response.set_header("X-RateLimit-Reset", std::to_string(seconds_up(decision.reset_after)));
            if (!decision.allowed)
                response.set_header("Retry-After", std::to_string(seconds_up(decision.retry_after)));
        }
    };

    /** @brief Creates a `RateLimitMiddleware` over `limiter`. */
    [[nodiscard]] inline std::shared_ptr<RateLimitMiddleware>
    rate_limit_middleware(std::shared_ptr<IRateLimiter> limiter,
                          RateLimitMiddlewareOptions options = RateLimitMiddlewareOptions(),
                          const std::string &name = "RateLimitMiddleware") {
        return std::make_shared<RateLimitMiddleware>(std::move(limiter), std::move(options), name);
    }

} // namespace weft

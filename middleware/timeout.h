/**
 * @file weft/middleware/timeout.h
 * @brief Cooperative per-request deadline.
 *
 * The engine never interrupts a running handler. `TimeoutMiddleware` sets a
 * deadline on the context that long-running handlers poll through
 * `Context::is_cancelled()`. If the deadline has passed once the rest of the
 * chain returns, whatever the rest of the chain produced is discarded and
 * replaced by a timeout response. Headers set before the deadline was armed,
 * such as those of outer middleware, are kept.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <chrono>     // For std::chrono::milliseconds
#include <memory>     // For std::shared_ptr, std::make_shared
#include <stdexcept>  // For std::invalid_argument
#include <string>     // For std::string
#include <utility>    // For std::move

#include "../logger.h"             // For LOG_WEFT_WARN
#include "../routing/middleware.h" // For weft::IMiddleware, weft::Context

namespace weft {

    class TimeoutMiddleware : public IMiddleware {
    public:
        /**
         * @param timeout Time allowed for the rest of the chain. Must be positive.
         * @param status Status of the replacement response. Default 504.
         * @throws std::invalid_argument if `timeout` is not positive.
         */
        template<typename Rep, typename Period>
        explicit TimeoutMiddleware(const std::chrono::duration<Rep, Period> &timeout,
                                   Status status = Status::GATEWAY_TIMEOUT,
                                   std::string message = "Request timed out",
                                   std::string name = "TimeoutMiddleware")
            : _timeout(std::chrono::duration_cast<std::chrono::milliseconds>(timeout))
            , _status(status)
            , _message(std::move(message))
            , _name(std::move(name)) {
            if (_timeout.count() <= 0)
                throw std::invalid_argument("TimeoutMiddleware: timeout must be positive");
        }

        void process(Context &ctx) override {
            const Response::Headers outer_headers = ctx.response().headers();
            ctx.set_deadline(Context::Clock::now() + _timeout);
            ctx.next();

            if (!ctx.deadline_exceeded())
                return;
            LOG_WEFT_WARN("[" << _name << "] " << ctx.method() << " " << ctx.path()
                          << " exceeded " << _timeout.count() << "ms");
            ctx.add_error("request exceeded " + std::to_string(_timeout.count()) + "ms deadline");
            Response replacement;
            for (const auto &[name, values] : outer_headers)
                for (const auto &value : values)
                    replacement.add_header(name, value);
            ctx.send(std::move(replacement));
            ctx.text(_message, _status);
            ctx.abort();
        }

        [[nodiscard]] std::string name() const override { return _name; }
        [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return _timeout; }

    private:
        std::chrono::milliseconds _timeout;
        Status _status;
        std::string _message;
        std::string _name;
    };

    template<typename Rep, typename Period>
    [[nodiscard]] std::shared_ptr<TimeoutMiddleware>
    timeout_middleware(const std::chrono::duration<Rep, Period> &timeout,
                       Status status = Status::GATEWAY_TIMEOUT) {
        return std::make_shared<TimeoutMiddleware>(timeout, status);
    }

} // namespace weft

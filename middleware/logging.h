/**
 * @file weft/middleware/logging.h
 * @brief Middleware reporting each request and its outcome to a user callback.
 *
 * The request line is logged before the rest of the chain runs. Status,
 * latency and any errors recorded on the context are logged once the chain
 * has unwound. Logging goes through a `LogFunction` so applications can
 * route it to nanolog, a file, or a test buffer.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Middleware
 */
#pragma once

#include <chrono>      // For std::chrono::steady_clock
#include <functional>  // For std::function
#include <memory>      // For std::shared_ptr, std::make_shared
#include <sstream>     // For std::ostringstream
#include <stdexcept>   // For std::invalid_argument
#include <string>      // For std::string
#include <utility>     // For std::move

#include "../routing/middleware.h" // For weft::IMiddleware, weft::Context

namespace weft {

    /** @brief Severity of messages produced by `LoggingMiddleware`. */
    enum class LogLevel {
        Debug,
        Info,
        Warning,
        Error
    };

    class LoggingMiddleware : public IMiddleware {
    public:
        using LogFunction = std::function<void(LogLevel level, const std::string &message)>;

        /**
         * @param log_fn Receives every message. Must not be null.
         * @param request_level Level of the request line.
         * @param response_level Level of the outcome line for 1xx-4xx responses.
         *        5xx responses and requests with errors are always logged at `Error`.
         * @throws std::invalid_argument if `log_fn` is null.
         */
        explicit LoggingMiddleware(LogFunction log_fn,
                                   LogLevel request_level = LogLevel::Info,
                                   LogLevel response_level = LogLevel::Debug,
                                   std::string name = "LoggingMiddleware")
            : _log(std::move(log_fn))
            , _request_level(request_level)
            , _response_level(response_level)
            , _name(std::move(name)) {
            if (!_log)
                throw std::invalid_argument("LoggingMiddleware: log function cannot be null");
        }

        void process(Context &ctx) override {
            const auto started = std::chrono::steady_clock::now();
            _log(_request_level, "Request: " + std::string(ctx.method().name()) + " " + std::string(ctx.path()));

            ctx.next();

            const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - started);
            const auto status = ctx.response().status();

            std::ostringstream out;
            out << "Response: " << status << " for " << ctx.method() << " " << ctx.path()
                << " in " << elapsed.count() << "us";
            if (ctx.is_aborted())
                out << " (aborted)";
            for (const auto &error : ctx.errors())
                out << " | error: " << error.message;

            const bool failed = status.is_server_error() || ctx.has_errors();
            _log(failed ? LogLevel::Error : _response_level, out.str());
        }

        [[nodiscard]] std::string name() const override { return _name; }

    private:
        LogFunction _log;
        LogLevel _request_level;
        LogLevel _response_level;
        std::string _name;
    };

    [[nodiscard]] inline std::shared_ptr<LoggingMiddleware>
    logging_middleware(LoggingMiddleware::LogFunction log_fn,
                       LogLevel request_level = LogLevel::Info,
                       LogLevel response_level = LogLevel::Debug,
                       const std::string &name = "LoggingMiddleware") {
        return std::make_shared<LoggingMiddleware>(std::move(log_fn), request_level, response_level, name);
    }

} // namespace weft

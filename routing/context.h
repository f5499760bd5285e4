/**
 * @file weft/routing/context.h
 * @brief Per-request state threaded through a handler chain.
 *
 * A `Context` carries everything a handler needs while one request is
 * served: the request, the captured path parameters, the response being
 * built, an untyped key/value store shared between middleware, the errors
 * accumulated so far, and the cursor that drives the handler chain.
 *
 * Contexts are pooled and reused. A context is only valid between the
 * engine's `init()` and the end of `Engine::serve_one()`; handlers must not
 * keep a reference to it after they return. Work that outlives the request
 * takes a `DetachedContext` from `copy()` instead.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <any>          // For std::any (custom data)
#include <chrono>       // For std::chrono::steady_clock (deadline)
#include <optional>     // For std::optional
#include <string>       // For std::string
#include <string_view>  // For std::string_view
#include <utility>      // For std::move
#include <vector>       // For std::vector (errors)

#include <qb/json.h>                           // For qb::json
#include <qb/system/container/unordered_map.h> // For qb::unordered_map

#include "../request.h"         // For weft::Request
#include "../response.h"        // For weft::Response, weft::IResponseWriter
#include "./path_parameters.h"  // For weft::PathParameters
#include "./types.h"            // For weft::Handler, weft::HandlerChainPtr

namespace weft {

    /**
     * @brief An error recorded on a context by a handler or by the engine.
     */
    struct ContextError {
        enum class Kind {
            Private, ///< Diagnostic only, never shown to the client.
            Public,  ///< Safe to expose in a response body.
            Panic    ///< An exception escaped a handler and was recovered by the engine.
        };

        std::string message;
        Kind kind = Kind::Private;
    };

    /**
     * @brief Typed key for `Context` custom data.
     *
     * Declaring keys once, e.g. `inline const ContextKey<std::string> user_id{"user_id"};`,
     * lets producers and consumers agree on the stored type at compile time.
     */
    template<typename T>
    class ContextKey {
        std::string _name;

    public:
        using value_type = T;

        explicit ContextKey(std::string name) : _name(std::move(name)) {}
        [[nodiscard]] const std::string &name() const noexcept { return _name; }
    };

    /** @brief Status, body size and written flag of a context's response. */
    struct ResponseSnapshot {
        Status status;
        std::size_t size = 0;
        bool written = false;
    };

    using CustomDataMap = qb::unordered_map<std::string, std::any>;

    namespace detail {

    template<typename T>
    std::optional<T> any_get(const CustomDataMap &data, const std::string &key) {
        auto it = data.find(key);
        if (it == data.end())
            return std::nullopt;
        if (const T *value = std::any_cast<T>(&it->second))
            return *value;
        return std::nullopt;
    }

    } // namespace detail

    /**
     * @brief Owning snapshot of a request's data, safe to use after the request ends.
     *
     * Holds its own copy of the request (sharing its cancellation flag), the path
     * parameters, the custom data, the matched pattern and the errors recorded up
     * to the moment `Context::copy()` was called.
     */
    class DetachedContext {
        friend class Context;

        Request _request;
        PathParameters _params;
        CustomDataMap _data;
        std::string _full_path;
        std::vector<ContextError> _errors;

    public:
        [[nodiscard]] const Request &request() const noexcept { return _request; }
        [[nodiscard]] const PathParameters &path_parameters() const noexcept { return _params; }
        [[nodiscard]] std::string path_param(const std::string &name, const std::string &not_found = "") const {
            auto value = _params.get(name);
            return value ? std::string(*value) : not_found;
        }
        [[nodiscard]] const std::string &full_path() const noexcept { return _full_path; }
        [[nodiscard]] const std::vector<ContextError> &errors() const noexcept { return _errors; }

        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const {
            return detail::any_get<T>(_data, key);
        }

        template<typename T>
        [[nodiscard]] std::optional<T> get(const ContextKey<T> &key) const {
            return detail::any_get<T>(_data, key.name());
        }

        [[nodiscard]] bool has(const std::string &key) const noexcept {
            return _data.find(key) != _data.end();
        }

        /** @brief True once the originating client went away. */
        [[nodiscard]] bool is_cancelled() const noexcept { return _request.is_cancelled(); }
    };

    /**
     * @brief Request-scoped state and handler chain driver.
     *
     * Chain execution follows the onion model. `next()` runs the handler at the
     * cursor and returns once that handler returns, so statements written before
     * `next()` run in chain order and statements after it in reverse order. A
     * handler that returns without calling `next()` ends the chain. `abort()`
     * stops any further `next()` from starting a handler, but the statements
     * remaining in handlers already on the stack still run.
     */
    class Context {
    public:
        using Clock = std::chrono::steady_clock;

    private:
        Request *_request = nullptr;
        IResponseWriter *_writer = nullptr;
        Response _response;
        PathParameters _params;
        std::string_view _full_path;
        HandlerChainPtr _chain;
        std::size_t _cursor = 0;
        bool _aborted = false;
        bool _written = false;
        CustomDataMap _data;
        std::vector<ContextError> _errors;
        std::optional<Clock::time_point> _deadline;

    public:
        Context() = default;
        Context(const Context &) = delete;
        Context &operator=(const Context &) = delete;
        Context(Context &&) = delete;
        Context &operator=(Context &&) = delete;

        /**
         * @brief Clears every field then binds a new request.
         *
         * @param request The request being served. Must outlive the context's use.
         * @param writer Transport sink; may be null for contexts driven by tests.
         * @param params Path parameters captured by the route tree.
         * @param chain Handler chain to run; may be null, in which case `next()` does nothing.
         * @param full_path Registered route pattern, empty when no route matched.
         */
        void init(Request &request, IResponseWriter *writer, PathParameters params,
                  HandlerChainPtr chain, std::string_view full_path = {});

        /** @brief Drops every reference and all per-request state. */
        void reset() noexcept;

        // --- Request ---

        [[nodiscard]] Request &request();
        [[nodiscard]] const Request &request() const;
        [[nodiscard]] bool has_request() const noexcept { return _request != nullptr; }
        [[nodiscard]] Method method() const { return request().method(); }
        [[nodiscard]] std::string_view path() const { return request().path(); }

        /** @brief Pattern of the matched route (e.g. "/users/:id"), empty for unmatched requests. */
        [[nodiscard]] std::string_view full_path() const noexcept { return _full_path; }

        [[nodiscard]] const PathParameters &path_parameters() const noexcept { return _params; }
        [[nodiscard]] PathParameters &path_parameters() noexcept { return _params; }

        /** @brief Value of a `:name` or `*name` segment, `not_found` if absent. */
        [[nodiscard]] std::string path_param(const std::string &name, const std::string &not_found = "") const;

        [[nodiscard]] std::string query(const std::string &name, const std::string &not_found = "") const {
            return request().query(name, 0, not_found);
        }

        [[nodiscard]] std::string header(const std::string &name, const std::string &not_found = "") const {
            return request().header(name, 0, not_found);
        }

        // --- Response ---

        [[nodiscard]] Response &response() noexcept { return _response; }
        [[nodiscard]] const Response &response() const noexcept { return _response; }
        [[nodiscard]] IResponseWriter *writer() const noexcept { return _writer; }

        Context &status(Status code) noexcept {
            _response.set_status(code);
            return *this;
        }

        Context &set_header(const std::string &name, std::string value) {
            _response.set_header(name, std::move(value));
            return *this;
        }

        /** @brief Replaces the response body and its content type. */
        void data(Status code, std::string content_type, std::string body);

        void text(std::string body, Status code = Status::OK) {
            data(code, "text/plain; charset=utf-8", std::move(body));
        }

        void html(std::string body, Status code = Status::OK) {
            data(code, "text/html; charset=utf-8", std::move(body));
        }

        void json(const qb::json &value, Status code = Status::OK) {
            data(code, "application/json; charset=utf-8", value.dump());
        }

        /** @brief Sets `Location` and a redirect status. */
        void redirect(const std::string &location, Status code = Status::FOUND);

        /** @brief 204 with an empty body. */
        void no_content();

        /** @brief Replaces the whole response, headers included. */
        void send(Response response) {
            _response = std::move(response);
            _written = true;
        }

        /** @brief True once a render helper produced the response. */
        [[nodiscard]] bool is_written() const noexcept { return _written; }

        [[nodiscard]] ResponseSnapshot snapshot() const noexcept {
            return ResponseSnapshot{_response.status(), _response.body().size(), _written};
        }

        // --- Chain control ---

        /** @brief Runs the handler at the cursor, unless aborted or at the end of the chain. */
        void next();

        /** @brief Prevents any further handler from starting. */
        void abort() noexcept { _aborted = true; }

        void abort_with_status(Status code) noexcept {
            _response.set_status(code);
            _aborted = true;
        }

        /** @brief Records a public error, renders it as text with `code`, and aborts. */
        void abort_with_error(Status code, std::string message);

        [[nodiscard]] bool is_aborted() const noexcept { return _aborted; }

        /** @brief Index of the next handler `next()` would run. */
        [[nodiscard]] std::size_t handler_index() const noexcept { return _cursor; }
        [[nodiscard]] std::size_t chain_size() const noexcept { return _chain ? _chain->size() : 0; }

        // --- Errors ---

        void add_error(std::string message, ContextError::Kind kind = ContextError::Kind::Private) {
            _errors.push_back(ContextError{std::move(message), kind});
        }

        [[nodiscard]] const std::vector<ContextError> &errors() const noexcept { return _errors; }
        [[nodiscard]] bool has_errors() const noexcept { return !_errors.empty(); }

        // --- Custom data ---

        /** @brief Inserts or overwrites `key`. */
        template<typename T>
        Context &set(const std::string &key, T value) {
            _data[key] = std::move(value);
            return *this;
        }

        /** @brief Typed insert; `value` converts to the key's type. */
        template<typename T>
        Context &set(const ContextKey<T> &key, typename ContextKey<T>::value_type value) {
            return set<T>(key.name(), std::move(value));
        }

        /** @return The value stored at `key` if present and of type `T`. */
        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const {
            return detail::any_get<T>(_data, key);
        }

        template<typename T>
        [[nodiscard]] std::optional<T> get(const ContextKey<T> &key) const {
            return detail::any_get<T>(_data, key.name());
        }

        /** @return Pointer to the stored value for in-place access, or nullptr. */
        template<typename T>
        [[nodiscard]] T *get_ptr(const std::string &key) {
            auto it = _data.find(key);
            return it == _data.end() ? nullptr : std::any_cast<T>(&it->second);
        }

        template<typename T>
        [[nodiscard]] const T *get_ptr(const std::string &key) const {
            auto it = _data.find(key);
            return it == _data.end() ? nullptr : std::any_cast<T>(&it->second);
        }

        [[nodiscard]] bool has(const std::string &key) const noexcept {
            return _data.find(key) != _data.end();
        }

        /** @return true if `key` existed. */
        bool remove(const std::string &key) noexcept { return _data.erase(key) > 0; }

        [[nodiscard]] std::size_t data_size() const noexcept { return _data.size(); }

        // --- Cancellation ---

        /** @brief True if the client went away or the deadline has passed. */
        [[nodiscard]] bool is_cancelled() const noexcept;

        void set_deadline(Clock::time_point deadline) noexcept { _deadline = deadline; }
        void clear_deadline() noexcept { _deadline.reset(); }
        [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept { return _deadline; }
        [[nodiscard]] bool deadline_exceeded() const noexcept {
            return _deadline && Clock::now() >= *_deadline;
        }

        /** @brief Owning copy of the request data for use after the request ends. */
        [[nodiscard]] DetachedContext copy() const;
    };

} // namespace weft

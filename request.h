/**
 * @file weft/request.h
 * @brief The parsed HTTP request handed to the engine by the transport.
 *
 * weft does not parse the wire format. The transport builds a `Request`
 * (method, target URI, headers, body, peer address) and passes it to
 * `Engine::serve_one()`. The transport also owns cancellation: it calls
 * `Request::cancel()` when the client disconnects, and handlers observe it
 * through `Context::is_cancelled()`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Http
 */
#pragma once

#include <atomic>        // For std::atomic<bool> (cancellation flag)
#include <memory>        // For std::shared_ptr
#include <string>        // For std::string
#include <string_view>   // For std::string_view
#include <vector>        // For std::vector (multi-value headers)

#include <qb/io/uri.h>   // For qb::io::uri
#include <qb/system/container/unordered_map.h> // For qb::icase_unordered_map

#include "./types.h"     // For weft::Method

namespace weft {

    /**
     * @brief An HTTP request as seen by routing and handlers.
     *
     * Header names are case-insensitive and may carry several values. Copies of a
     * request share the cancellation flag, so a `DetachedContext` still observes
     * a client disconnect.
     */
    class Request {
    public:
        /** @brief Case-insensitive header map, each name holding one or more values. */
        using Headers = qb::icase_unordered_map<std::vector<std::string>>;

    private:
        Method _method;
        qb::io::uri _uri;
        Headers _headers;
        std::string _body;
        std::string _remote_address;
        std::shared_ptr<std::atomic<bool>> _cancelled;

    public:
        Request();

        /**
         * @brief Builds a request from its parsed parts.
         * @param method Request method.
         * @param target Request target, path plus optional query (e.g. "/users/42?full=1").
         * @param headers Parsed header fields.
         * @param body Raw body bytes.
         */
        Request(Method method, const std::string &target, Headers headers = {}, std::string body = {});

        Request(const Request &) = default;
        Request(Request &&) = default;
        Request &operator=(const Request &) = default;
        Request &operator=(Request &&) = default;

        [[nodiscard]] Method method() const noexcept { return _method; }
        void set_method(Method method) noexcept { _method = method; }

        [[nodiscard]] const qb::io::uri &uri() const noexcept { return _uri; }

        /** @brief Replaces the request target. The query string is re-parsed. */
        void set_target(const std::string &target);

        /** @brief Path component of the target, still percent-encoded. */
        [[nodiscard]] std::string_view path() const noexcept;

        /**
         * @brief Value of a query parameter.
         * @param name Parameter name.
         * @param index Which value to return when the parameter is repeated.
         * @param not_found Returned when the parameter or the index is missing.
         */
        [[nodiscard]] std::string query(const std::string &name, std::size_t index = 0,
                                        const std::string &not_found = "") const;

        /** @brief Raw query string without the leading '?'. */
        [[nodiscard]] std::string_view raw_query() const noexcept;

        /** @brief First value (or the `index`-th) of a header, `not_found` when absent. */
        [[nodiscard]] std::string header(const std::string &name, std::size_t index = 0,
                                         const std::string &not_found = "") const;
        [[nodiscard]] bool has_header(const std::string &name) const noexcept;
        /** @brief Replaces every value of a header with `value`. */
        void set_header(const std::string &name, std::string value);
        /** @brief Appends a value to a header. */
        void add_header(const std::string &name, std::string value);
        void remove_header(const std::string &name);
        [[nodiscard]] const Headers &headers() const noexcept { return _headers; }

        [[nodiscard]] const std::string &body() const noexcept { return _body; }
        void set_body(std::string body) { _body = std::move(body); }

        /** @brief Peer address as reported by the transport, empty if unknown. */
        [[nodiscard]] const std::string &remote_address() const noexcept { return _remote_address; }
        void set_remote_address(std::string address) { _remote_address = std::move(address); }

        /** @brief Marks the request as abandoned by the client. Thread-safe. */
        void cancel() noexcept;
        [[nodiscard]] bool is_cancelled() const noexcept;
    };

} // namespace weft

/**
 * @file weft/response.h
 * @brief The buffered HTTP response built by handlers, and the writer that flushes it.
 *
 * Handlers never write to the connection directly. They fill the `Response`
 * owned by their `Context`; once the handler chain has unwound the engine
 * hands the finished response to the transport's `IResponseWriter`, exactly
 * once per request.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Http
 */
#pragma once

#include <string>        // For std::string
#include <vector>        // For std::vector (multi-value headers)
#include <utility>       // For std::move

#include <qb/system/container/unordered_map.h> // For qb::icase_unordered_map

#include "./types.h"     // For weft::Status

namespace weft {

    /**
     * @brief A response under construction.
     */
    class Response {
    public:
        using Headers = qb::icase_unordered_map<std::vector<std::string>>;

    private:
        Status _status;
        Headers _headers;
        std::string _body;

    public:
        Response() = default;
        explicit Response(Status status, std::string body = {})
            : _status(status), _body(std::move(body)) {}

        [[nodiscard]] Status status() const noexcept { return _status; }
        void set_status(Status status) noexcept { _status = status; }

        [[nodiscard]] std::string header(const std::string &name, std::size_t index = 0,
                                         const std::string &not_found = "") const;
        [[nodiscard]] bool has_header(const std::string &name) const noexcept;
        void set_header(const std::string &name, std::string value);
        void add_header(const std::string &name, std::string value);
        void remove_header(const std::string &name);
        [[nodiscard]] const Headers &headers() const noexcept { return _headers; }

        void set_content_type(std::string content_type) {
            set_header("Content-Type", std::move(content_type));
        }

        [[nodiscard]] const std::string &body() const noexcept { return _body; }
        [[nodiscard]] std::string &body() noexcept { return _body; }
        void set_body(std::string body) { _body = std::move(body); }

        /** @brief Back to 200 OK with no headers and an empty body. */
        void reset() noexcept;
    };

    /**
     * @brief Transport-side sink for finished responses.
     *
     * Implemented by the server that owns the connection. `write()` is called at
     * most once per request, after the handler chain has fully unwound.
     */
    class IResponseWriter {
    public:
        virtual ~IResponseWriter() = default;

        /**
         * @brief Serializes and sends `response`.
         * @throws Any exception signals a transport failure; the engine logs it.
         */
        virtual void write(const Response &response) = 0;
    };

} // namespace weft

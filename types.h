/**
 * @file weft/types.h
 * @brief HTTP method and status types shared by the whole engine.
 *
 * `Method` and `Status` wrap the llhttp enumerations so that route tables,
 * responses and logs all speak the same vocabulary as the transport that
 * parsed the request.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Http
 */
#pragma once

#include <llhttp.h>      // For HTTP_* methods, HTTP_STATUS_*, http_method_name, http_status_name
#include <array>         // For std::array (Method::common)
#include <functional>    // For std::hash
#include <ostream>       // For std::ostream
#include <string>        // For std::string
#include <string_view>   // For std::string_view
#include <qb/system/container/unordered_map.h> // For qb::icase_unordered_map
#include "./logger.h"

namespace weft {

    /**
     * @brief HTTP request method.
     *
     * Values map one-to-one onto llhttp's `http_method`. `UNINITIALIZED` is the
     * result of parsing an unknown method name and never matches a route.
     */
    class Method {
    public:
        enum class Value : int {
            UNINITIALIZED = -1,
            DEL = ::HTTP_DELETE, ///< DELETE ("DELETE" is not a usable identifier on every platform).
            GET = ::HTTP_GET,
            HEAD = ::HTTP_HEAD,
            POST = ::HTTP_POST,
            PUT = ::HTTP_PUT,
            CONNECT = ::HTTP_CONNECT,
            OPTIONS = ::HTTP_OPTIONS,
            TRACE = ::HTTP_TRACE,
            PATCH = ::HTTP_PATCH
        };

        constexpr Method() noexcept : _value(Value::UNINITIALIZED) {}
        constexpr Method(Value v) noexcept : _value(v) {}

        /// Parses a method name, case-insensitively. Unknown names give `UNINITIALIZED`.
        explicit Method(std::string_view name) : _value(Value::UNINITIALIZED) {
            const auto &map = names();
            auto it = map.find(std::string(name));
            if (it != map.end())
                _value = it->second;
        }

        constexpr bool operator==(Method other) const noexcept { return _value == other._value; }
        constexpr bool operator!=(Method other) const noexcept { return _value != other._value; }
        constexpr bool operator==(Value v) const noexcept { return _value == v; }
        constexpr bool operator!=(Value v) const noexcept { return _value != v; }
        constexpr bool operator<(Method other) const noexcept {
            return static_cast<int>(_value) < static_cast<int>(other._value);
        }

        [[nodiscard]] constexpr Value value() const noexcept { return _value; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return _value != Value::UNINITIALIZED; }

        /// Canonical upper-case name, e.g. "GET".
        [[nodiscard]] std::string_view name() const noexcept {
            if (_value == Value::UNINITIALIZED)
                return "UNINITIALIZED";
            return ::http_method_name(static_cast<::http_method>(_value));
        }

        friend std::ostream &operator<<(std::ostream &os, Method m) {
            return os << m.name();
        }

        /// Methods registered by `RouteGroup::any()`, in `Allow` header order.
        static constexpr std::array<Value, 7> common() noexcept {
            return {Value::GET, Value::HEAD, Value::POST, Value::PUT,
                    Value::PATCH, Value::DEL, Value::OPTIONS};
        }

        static constexpr Value UNINITIALIZED = Value::UNINITIALIZED;
        static constexpr Value DEL = Value::DEL;
        static constexpr Value GET = Value::GET;
        static constexpr Value HEAD = Value::HEAD;
        static constexpr Value POST = Value::POST;
        static constexpr Value PUT = Value::PUT;
        static constexpr Value CONNECT = Value::CONNECT;
        static constexpr Value OPTIONS = Value::OPTIONS;
        static constexpr Value TRACE = Value::TRACE;
        static constexpr Value PATCH = Value::PATCH;

    private:
        Value _value;

        static const qb::icase_unordered_map<Value> &names() {
            static const qb::icase_unordered_map<Value> map = {
                {"DELETE", Value::DEL},
                {"GET", Value::GET},
                {"HEAD", Value::HEAD},
                {"POST", Value::POST},
                {"PUT", Value::PUT},
                {"CONNECT", Value::CONNECT},
                {"OPTIONS", Value::OPTIONS},
                {"TRACE", Value::TRACE},
                {"PATCH", Value::PATCH}
            };
            return map;
        }
    };

    /**
     * @brief HTTP response status code.
     *
     * Any integer code can be held; the named constants cover the codes the
     * engine and its middleware produce.
     */
    class Status {
    public:
        enum class Value : int {
            OK = ::HTTP_STATUS_OK,
            CREATED = ::HTTP_STATUS_CREATED,
            ACCEPTED = ::HTTP_STATUS_ACCEPTED,
            NO_CONTENT = ::HTTP_STATUS_NO_CONTENT,
            MOVED_PERMANENTLY = ::HTTP_STATUS_MOVED_PERMANENTLY,
            FOUND = ::HTTP_STATUS_FOUND,
            SEE_OTHER = ::HTTP_STATUS_SEE_OTHER,
            NOT_MODIFIED = ::HTTP_STATUS_NOT_MODIFIED,
            TEMPORARY_REDIRECT = ::HTTP_STATUS_TEMPORARY_REDIRECT,
            PERMANENT_REDIRECT = ::HTTP_STATUS_PERMANENT_REDIRECT,
            BAD_REQUEST = ::HTTP_STATUS_BAD_REQUEST,
            UNAUTHORIZED = ::HTTP_STATUS_UNAUTHORIZED,
            FORBIDDEN = ::HTTP_STATUS_FORBIDDEN,
            NOT_FOUND = ::HTTP_STATUS_NOT_FOUND,
            METHOD_NOT_ALLOWED = ::HTTP_STATUS_METHOD_NOT_ALLOWED,
            REQUEST_TIMEOUT = ::HTTP_STATUS_REQUEST_TIMEOUT,
            CONFLICT = ::HTTP_STATUS_CONFLICT,
            PAYLOAD_TOO_LARGE = ::HTTP_STATUS_PAYLOAD_TOO_LARGE,
            URI_TOO_LONG = ::HTTP_STATUS_URI_TOO_LONG,
            UNPROCESSABLE_ENTITY = ::HTTP_STATUS_UNPROCESSABLE_ENTITY,
            TOO_MANY_REQUESTS = ::HTTP_STATUS_TOO_MANY_REQUESTS,
            INTERNAL_SERVER_ERROR = ::HTTP_STATUS_INTERNAL_SERVER_ERROR,
            NOT_IMPLEMENTED = ::HTTP_STATUS_NOT_IMPLEMENTED,
            BAD_GATEWAY = ::HTTP_STATUS_BAD_GATEWAY,
            SERVICE_UNAVAILABLE = ::HTTP_STATUS_SERVICE_UNAVAILABLE,
            GATEWAY_TIMEOUT = ::HTTP_STATUS_GATEWAY_TIMEOUT
        };

        /// Defaults to 200 OK.
        constexpr Status() noexcept : _value(Value::OK) {}
        constexpr Status(Value v) noexcept : _value(v) {}
        constexpr Status(int code) noexcept : _value(static_cast<Value>(code)) {}

        constexpr bool operator==(Status other) const noexcept { return _value == other._value; }
        constexpr bool operator!=(Status other) const noexcept { return _value != other._value; }
        constexpr bool operator==(Value v) const noexcept { return _value == v; }
        constexpr bool operator!=(Value v) const noexcept { return _value != v; }
        constexpr bool operator==(int code) const noexcept { return static_cast<int>(_value) == code; }
        constexpr bool operator!=(int code) const noexcept { return static_cast<int>(_value) != code; }
        constexpr bool operator<(Status other) const noexcept { return code() < other.code(); }

        [[nodiscard]] constexpr Value value() const noexcept { return _value; }
        [[nodiscard]] constexpr int code() const noexcept { return static_cast<int>(_value); }

        [[nodiscard]] constexpr bool is_success() const noexcept { return code() >= 200 && code() < 300; }
        [[nodiscard]] constexpr bool is_redirect() const noexcept { return code() >= 300 && code() < 400; }
        [[nodiscard]] constexpr bool is_client_error() const noexcept { return code() >= 400 && code() < 500; }
        [[nodiscard]] constexpr bool is_server_error() const noexcept { return code() >= 500 && code() < 600; }

        /// Reason phrase, e.g. "Not Found".
        [[nodiscard]] std::string_view name() const noexcept {
            const char *n = ::http_status_name(static_cast<::http_status>(_value));
            return n ? n : "Unknown Status";
        }

        friend std::ostream &operator<<(std::ostream &os, Status s) {
            return os << s.code() << ' ' << s.name();
        }

        static constexpr Value OK = Value::OK;
        static constexpr Value CREATED = Value::CREATED;
        static constexpr Value ACCEPTED = Value::ACCEPTED;
        static constexpr Value NO_CONTENT = Value::NO_CONTENT;
        static constexpr Value MOVED_PERMANENTLY = Value::MOVED_PERMANENTLY;
        static constexpr Value FOUND = Value::FOUND;
        static constexpr Value SEE_OTHER = Value::SEE_OTHER;
        static constexpr Value NOT_MODIFIED = Value::NOT_MODIFIED;
        static constexpr Value TEMPORARY_REDIRECT = Value::TEMPORARY_REDIRECT;
        static constexpr Value PERMANENT_REDIRECT = Value::PERMANENT_REDIRECT;
        static constexpr Value BAD_REQUEST = Value::BAD_REQUEST;
        static constexpr Value UNAUTHORIZED = Value::UNAUTHORIZED;
        static constexpr Value FORBIDDEN = Value::FORBIDDEN;
        static constexpr Value NOT_FOUND = Value::NOT_FOUND;
        static constexpr Value METHOD_NOT_ALLOWED = Value::METHOD_NOT_ALLOWED;
        static constexpr Value REQUEST_TIMEOUT = Value::REQUEST_TIMEOUT;
        static constexpr Value CONFLICT = Value::CONFLICT;
        static constexpr Value PAYLOAD_TOO_LARGE = Value::PAYLOAD_TOO_LARGE;
        static constexpr Value URI_TOO_LONG = Value::URI_TOO_LONG;
        static constexpr Value UNPROCESSABLE_ENTITY = Value::UNPROCESSABLE_ENTITY;
        static constexpr Value TOO_MANY_REQUESTS = Value::TOO_MANY_REQUESTS;
        static constexpr Value INTERNAL_SERVER_ERROR = Value::INTERNAL_SERVER_ERROR;
        static constexpr Value NOT_IMPLEMENTED = Value::NOT_IMPLEMENTED;
        static constexpr Value BAD_GATEWAY = Value::BAD_GATEWAY;
        static constexpr Value SERVICE_UNAVAILABLE = Value::SERVICE_UNAVAILABLE;
        static constexpr Value GATEWAY_TIMEOUT = Value::GATEWAY_TIMEOUT;

    private:
        Value _value;
    };

} // namespace weft

namespace std {

    template<>
    struct hash<weft::Method> {
        size_t operator()(weft::Method m) const noexcept {
            return std::hash<int>()(static_cast<int>(m.value()));
        }
    };

    template<>
    struct hash<weft::Status> {
        size_t operator()(weft::Status s) const noexcept {
            return std::hash<int>()(s.code());
        }
    };

} // namespace std

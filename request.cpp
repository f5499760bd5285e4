/**
 * @file weft/request.cpp
 * @brief Out-of-line parts of `weft::Request`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Http
 */
#include "./request.h"

namespace weft {

Request::Request()
    : _method(Method::GET)
    , _uri("/")
    , _cancelled(std::make_shared<std::atomic<bool>>(false)) {}

Request::Request(Method method, const std::string &target, Headers headers, std::string body)
    : _method(method)
    , _uri(target)
    , _headers(std::move(headers))
    , _body(std::move(body))
    , _cancelled(std::make_shared<std::atomic<bool>>(false)) {}

void
Request::set_target(const std::string &target) {
    _uri = qb::io::uri(target);
}

std::string_view
Request::path() const noexcept {
    return _uri.path();
}

std::string
Request::query(const std::string &name, std::size_t index, const std::string &not_found) const {
    return _uri.query(name, index, not_found);
}

std::string_view
Request::raw_query() const noexcept {
    return _uri.encoded_queries();
}

std::string
Request::header(const std::string &name, std::size_t index, const std::string &not_found) const {
    auto it = _headers.find(name);
    if (it == _headers.end() || index >= it->second.size())
        return not_found;
    return it->second[index];
}

bool
Request::has_header(const std::string &name) const noexcept {
    return _headers.find(name) != _headers.end();
}

void
Request::set_header(const std::string &name, std::string value) {
    _headers[name] = {std::move(value)};
}

void
Request::add_header(const std::string &name, std::string value) {
    _headers[name].push_back(std::move(value));
}

void
Request::remove_header(const std::string &name) {
    _headers.erase(name);
}

void
Request::cancel() noexcept {
    _cancelled->store(true, std::memory_order_release);
}

bool
Request::is_cancelled() const noexcept {
    return _cancelled->load(std::memory_order_acquire);
}

} // namespace weft

/**
 * @file weft/response.cpp
 * @brief Out-of-line parts of `weft::Response`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Http
 */
#include "./response.h"

namespace weft {

std::string
Response::header(const std::string &name, std::size_t index, const std::string &not_found) const {
    auto it = _headers.find(name);
    if (it == _headers.end() || index >= it->second.size())
        return not_found;
    return it->second[index];
}

bool
Response::has_header(const std::string &name) const noexcept {
    return _headers.find(name) != _headers.end();
}

void
Response::set_header(const std::string &name, std::string value) {
    _headers[name] = {std::move(value)};
}

void
Response::add_header(const std::string &name, std::string value) {
    _headers[name].push_back(std::move(value));
}

void
Response::remove_header(const std::string &name) {
    _headers.erase(name);
}

void
Response::reset() noexcept {
    _status = Status::OK;
    _headers.clear();
    _body.clear();
}

} // namespace weft

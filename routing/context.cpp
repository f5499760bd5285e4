/**
 * @file weft/routing/context.cpp
 * @brief Chain driving, rendering and lifecycle of `weft::Context`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./context.h"

#include <stdexcept> // For std::logic_error

namespace weft {

void
Context::init(Request &request, IResponseWriter *writer, PathParameters params,
              HandlerChainPtr chain, std::string_view full_path) {
    reset();
    _request = &request;
    _writer = writer;
    _params = std::move(params);
    _chain = std::move(chain);
    _full_path = full_path;
}

void
Context::reset() noexcept {
    _request = nullptr;
    _writer = nullptr;
    _response.reset();
    _params.clear();
    _full_path = {};
    _chain.reset();
    _cursor = 0;
    _aborted = false;
    _written = false;
    _data.clear();
    _errors.clear();
    _deadline.reset();
}

Request &
Context::request() {
    if (!_request)
        throw std::logic_error("Context has no request bound");
    return *_request;
}

const Request &
Context::request() const {
    if (!_request)
        throw std::logic_error("Context has no request bound");
    return *_request;
}

std::string
Context::path_param(const std::string &name, const std::string &not_found) const {
    auto value = _params.get(name);
    return value ? std::string(*value) : not_found;
}

void
Context::data(Status code, std::string content_type, std::string body) {
    _response.set_status(code);
    _response.set_content_type(std::move(content_type));
    _response.set_body(std::move(body));
    _written = true;
}

void
Context::redirect(const std::string &location, Status code) {
    _response.set_status(code);
    _response.set_header("Location", location);
    _written = true;
}

void
Context::no_content() {
    _response.set_status(Status::NO_CONTENT);
    _response.remove_header("Content-Type");
    _response.body().clear();
    _written = true;
}

void
Context::next() {
    if (_aborted || !_chain || _cursor >= _chain->size())
        return;
    const Handler &handler = (*_chain)[_cursor++];
    handler(*this);
}

void
Context::abort_with_error(Status code, std::string message) {
    add_error(message, ContextError::Kind::Public);
    text(std::move(message), code);
    _aborted = true;
}

bool
Context::is_cancelled() const noexcept {
    if (_request && _request->is_cancelled())
        return true;
    return deadline_exceeded();
}

DetachedContext
Context::copy() const {
    DetachedContext detached;
    if (_request)
        detached._request = *_request;
    detached._params = _params;
    detached._data = _data;
    detached._full_path = std::string(_full_path);
    detached._errors = _errors;
    return detached;
}

} // namespace weft

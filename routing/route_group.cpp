/**
 * @file weft/routing/route_group.cpp
 * @brief Chain assembly and prefix handling of `weft::RouteGroup`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./route_group.h"

#include <iterator>  // For std::make_move_iterator
#include <memory>    // For std::make_shared
#include <stdexcept> // For std::logic_error

namespace weft {

std::string
RouteGroup::join_paths(const std::string &prefix, const std::string &relative) {
    if (relative.empty())
        return prefix.empty() ? "/" : prefix;

    std::string base = prefix;
    if (!base.empty() && base.back() == '/')
        base.pop_back();
    if (relative.front() != '/')
        base += '/';
    return base + relative;
}

void
RouteGroup::ensure_mutable(const char *operation) const {
    if (_tree->is_frozen())
        throw std::logic_error(std::string("RouteGroup::") + operation +
                               ": routes are frozen once serving starts");
}

void
RouteGroup::register_route(Method method, const std::string &pattern, HandlerChain handlers) {
    HandlerChain chain;
    chain.reserve(_middleware.size() + handlers.size());
    chain.insert(chain.end(), _middleware.begin(), _middleware.end());
    chain.insert(chain.end(), std::make_move_iterator(handlers.begin()),
                 std::make_move_iterator(handlers.end()));
    _tree->add(method, join_paths(_prefix, pattern), std::make_shared<const HandlerChain>(std::move(chain)));
}

} // namespace weft

/**
 * @file weft/routing/radix_tree.cpp
 * @brief Route registration and lookup for `weft::RouteTree`.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#include "./radix_tree.h"

#include <algorithm>  // For std::sort, std::find
#include <stdexcept>  // For std::invalid_argument, std::logic_error

#include "../logger.h"

namespace weft {

std::vector<std::string_view>
RouteTree::split_pattern(std::string_view pattern) {
    if (pattern.empty() || pattern.front() != '/')
        throw RoutePatternError("Route pattern must start with '/': '" + std::string(pattern) + "'");

    std::vector<std::string_view> segments;
    if (pattern.size() == 1)
        return segments;

    std::size_t start = 1;
    while (true) {
        const auto slash = pattern.find('/', start);
        if (slash == std::string_view::npos) {
            segments.push_back(pattern.substr(start));
            break;
        }
        segments.push_back(pattern.substr(start, slash - start));
        start = slash + 1;
    }

    std::vector<std::string> seen_names;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto seg = segments[i];
        const bool last = (i + 1 == segments.size());
        if (seg.empty()) {
            // Only a trailing slash may produce an empty segment.
            if (!last)
                throw RoutePatternError("Empty segment in route pattern: '" + std::string(pattern) + "'");
            continue;
        }
        if (seg.front() != ':' && seg.front() != '*')
            continue;
        if (seg.size() < 2)
            throw RoutePatternError("Segment '" + std::string(seg) + "' needs a name in route pattern: '" +
                                    std::string(pattern) + "'");
        if (seg.front() == '*' && !last)
            throw RoutePatternError("Catch-all '" + std::string(seg) +
                                    "' must be the last segment of route pattern: '" + std::string(pattern) + "'");
        std::string name(seg.substr(1));
        if (std::find(seen_names.begin(), seen_names.end(), name) != seen_names.end())
            throw RoutePatternError("Duplicate name '" + name + "' in route pattern: '" + std::string(pattern) + "'");
        seen_names.push_back(std::move(name));
    }
    return segments;
}

bool
RouteTree::split_path(std::string_view path, std::vector<std::string_view> &segments) {
    if (path.empty())
        path = "/";
    if (path.front() != '/')
        return false;
    if (path.size() == 1)
        return true;

    std::size_t start = 1;
    while (true) {
        const auto slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            segments.push_back(path.substr(start));
            return true;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
}

void
RouteTree::add(Method method, const std::string &pattern, HandlerChainPtr chain) {
    if (_frozen)
        throw std::logic_error("Cannot register route '" + pattern + "': routes are frozen once serving starts");
    if (!chain || chain->empty())
        throw std::invalid_argument("Route '" + pattern + "' has no handlers");
    for (const auto &handler : *chain) {
        if (!handler)
            throw std::invalid_argument("Route '" + pattern + "' contains a null handler");
    }

    const auto segments = split_pattern(pattern);

    auto &root = _roots[method];
    if (!root)
        root = std::make_unique<Node>(NodeType::ROOT, "");

    Node *current = root.get();
    for (const auto seg : segments) {
        if (!seg.empty() && seg.front() == '*') {
            const std::string name(seg.substr(1));
            if (!current->catch_all_child) {
                current->catch_all_child = std::make_unique<Node>(NodeType::CATCH_ALL, name);
            } else if (current->catch_all_child->segment != name) {
                throw RouteConflictError("Catch-all '*" + name + "' conflicts with existing '*" +
                                         current->catch_all_child->segment + "' in route '" + pattern + "'");
            }
            current = current->catch_all_child.get();
        } else if (!seg.empty() && seg.front() == ':') {
            const std::string name(seg.substr(1));
            if (!current->param_child) {
                current->param_child = std::make_unique<Node>(NodeType::PARAMETER, name);
            } else if (current->param_child->segment != name) {
                throw RouteConflictError("Parameter ':" + name + "' conflicts with existing ':" +
                                         current->param_child->segment + "' in route '" + pattern + "'");
            }
            current = current->param_child.get();
        } else {
            auto it = current->static_children.find(seg);
            if (it == current->static_children.end()) {
                auto node = std::make_unique<Node>(NodeType::STATIC, std::string(seg));
                std::string_view key = node->segment;
                it = current->static_children.emplace(key, std::move(node)).first;
            }
            current = it->second.get();
        }
    }

    if (current->chain)
        throw RouteConflictError("Route " + std::string(method.name()) + " '" + pattern +
                                 "' is already registered");

    current->chain = std::move(chain);
    current->pattern = pattern;
    ++_route_count;
    LOG_WEFT_DEBUG("Registered route " << method << " " << pattern << " ("
                   << current->chain->size() << " handlers)");
}

const RouteTree::Node *
RouteTree::find(const Node &node, const std::vector<std::string_view> &segments,
                std::size_t index, PathParameters &params) {
    if (index == segments.size())
        return node.chain ? &node : nullptr;

    const auto seg = segments[index];

    auto it = node.static_children.find(seg);
    if (it != node.static_children.end()) {
        if (const auto *found = find(*it->second, segments, index + 1, params))
            return found;
    }

    if (node.param_child && !seg.empty()) {
        const auto &name = node.param_child->segment;
        params.set(name, seg);
        if (const auto *found = find(*node.param_child, segments, index + 1, params))
            return found;
        params.erase(name);
    }

    if (node.catch_all_child && node.catch_all_child->chain) {
        std::string rest(seg);
        for (std::size_t i = index + 1; i < segments.size(); ++i) {
            rest += '/';
            rest += segments[i];
        }
        params.set(node.catch_all_child->segment, rest);
        return node.catch_all_child.get();
    }

    return nullptr;
}

std::optional<RouteMatch>
RouteTree::match(Method method, std::string_view path) const {
    auto root_it = _roots.find(method);
    if (root_it == _roots.end())
        return std::nullopt;

    std::vector<std::string_view> segments;
    if (!split_path(path, segments))
        return std::nullopt;

    RouteMatch result;
    const Node *terminal = find(*root_it->second, segments, 0, result.params);
    if (!terminal)
        return std::nullopt;

    result.chain = terminal->chain;
    result.pattern = terminal->pattern;
    return result;
}

std::vector<Method>
RouteTree::allowed_methods(std::string_view path) const {
    std::vector<Method> methods;
    std::vector<std::string_view> segments;
    if (!split_path(path, segments))
        return methods;

    for (const auto &[method, root] : _roots) {
        PathParameters scratch;
        if (find(*root, segments, 0, scratch))
            methods.push_back(method);
    }
    return methods;
}

void
RouteTree::collect(const Node &node, Method method, std::vector<RouteInfo> &out) {
    if (node.chain)
        out.push_back(RouteInfo{method, node.pattern, node.chain->size()});
    for (const auto &[key, child] : node.static_children)
        collect(*child, method, out);
    if (node.param_child)
        collect(*node.param_child, method, out);
    if (node.catch_all_child)
        collect(*node.catch_all_child, method, out);
}

std::vector<RouteInfo>
RouteTree::routes() const {
    std::vector<RouteInfo> out;
    out.reserve(_route_count);
    for (const auto &[method, root] : _roots)
        collect(*root, method, out);
    std::sort(out.begin(), out.end(), [](const RouteInfo &a, const RouteInfo &b) {
        if (a.pattern != b.pattern)
            return a.pattern < b.pattern;
        return a.method < b.method;
    });
    return out;
}

void
RouteTree::clear() noexcept {
    _roots.clear();
    _route_count = 0;
    _frozen = false;
}

} // namespace weft

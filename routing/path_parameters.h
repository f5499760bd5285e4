/**
 * @file weft/routing/path_parameters.h
 * @brief Named values captured from the request path during route matching.
 *
 * A route such as `/users/:id/files/*path` produces two entries, `id` and
 * `path`. Keys and values are owned, so a set of parameters can outlive the
 * route tree lookup that produced it.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <optional>    // For std::optional
#include <string>      // For std::string
#include <string_view> // For std::string_view

#include <qb/system/container/unordered_map.h> // For qb::unordered_map

namespace weft {

    class PathParameters {
    public:
        using Storage = qb::unordered_map<std::string, std::string>;

    private:
        Storage _params;

    public:
        PathParameters() = default;

        /** @brief Inserts or overwrites a parameter. */
        void set(std::string_view key, std::string_view value) {
            _params.insert_or_assign(std::string(key), std::string(value));
        }

        /** @return The value bound to `key`, or `std::nullopt`. */
        [[nodiscard]] std::optional<std::string_view> get(const std::string &key) const noexcept {
            auto it = _params.find(key);
            if (it != _params.end())
                return std::string_view(it->second);
            return std::nullopt;
        }

        [[nodiscard]] bool has(const std::string &key) const noexcept {
            return _params.find(key) != _params.end();
        }

        [[nodiscard]] const Storage &get_all() const noexcept { return _params; }

        /** @return Number of entries removed, 0 or 1. */
        std::size_t erase(const std::string &key) noexcept { return _params.erase(key); }

        void clear() noexcept { _params.clear(); }
        [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }
        [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

        [[nodiscard]] auto begin() noexcept { return _params.begin(); }
        [[nodiscard]] auto begin() const noexcept { return _params.begin(); }
        [[nodiscard]] auto end() noexcept { return _params.end(); }
        [[nodiscard]] auto end() const noexcept { return _params.end(); }
    };

} // namespace weft

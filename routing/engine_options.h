/**
 * @file weft/routing/engine_options.h
 * @brief Runtime switches of the dispatch engine.
 *
 * @author qb - C++ Actor Framework
 * @copyright Copyright (c) 2011-2025 qb - isndev (cpp.actor)
 * Licensed under the Apache License, Version 2.0 (http://www.apache.org/licenses/LICENSE-2.0)
 * @ingroup Routing
 */
#pragma once

#include <cstddef> // For std::size_t

namespace weft {

    /**
     * @brief Configuration of an `Engine`.
     *
     * Defaults:
     * - trailing-slash redirect: off (`/a` and `/a/` are distinct, a miss is a 404)
     * - 405 handling: off (a path served for another method is a 404)
     * - max path length: 4096 bytes, longer paths get 400 "Path too long"
     * - path parameter decoding: on (percent-decoded with `qb::io::uri::decode`)
     * - max idle pooled contexts: 1024
     * - exception text in 500 bodies: off
     */
    class EngineOptions {
    public:
        EngineOptions() noexcept = default;

        /**
         * @brief On a miss, redirect to the same path with the trailing slash
         *        added or removed if that variant has a route.
         * GET requests get 301, other methods 308 so the body is replayed.
         */
        EngineOptions &redirect_trailing_slash(bool enabled) noexcept {
            _redirect_trailing_slash = enabled;
            return *this;
        }

        /** @brief Answer 405 with an `Allow` header when the path exists for other methods. */
        EngineOptions &handle_method_not_allowed(bool enabled) noexcept {
            _handle_method_not_allowed = enabled;
            return *this;
        }

        EngineOptions &max_path_length(std::size_t length) noexcept {
            _max_path_length = length;
            return *this;
        }

        EngineOptions &decode_path_parameters(bool enabled) noexcept {
            _decode_path_parameters = enabled;
            return *this;
        }

        EngineOptions &max_idle_contexts(std::size_t count) noexcept {
            _max_idle_contexts = count;
            return *this;
        }

        /** @brief Put the exception message in 500 bodies. Development only. */
        EngineOptions &expose_error_details(bool enabled) noexcept {
            _expose_error_details = enabled;
            return *this;
        }

        /** @brief Friendly routing and verbose errors. */
        [[nodiscard]] static EngineOptions development() noexcept {
            return EngineOptions()
                    .redirect_trailing_slash(true)
                    .handle_method_not_allowed(true)
                    .expose_error_details(true);
        }

        /** @brief Strict routing, generic error bodies. */
        [[nodiscard]] static EngineOptions production() noexcept {
            return EngineOptions()
                    .handle_method_not_allowed(true)
                    .expose_error_details(false);
        }

        [[nodiscard]] bool get_redirect_trailing_slash() const noexcept { return _redirect_trailing_slash; }
        [[nodiscard]] bool get_handle_method_not_allowed() const noexcept { return _handle_method_not_allowed; }
        [[nodiscard]] std::size_t get_max_path_length() const noexcept { return _max_path_length; }
        [[nodiscard]] bool get_decode_path_parameters() const noexcept { return _decode_path_parameters; }
        [[nodiscard]] std::size_t get_max_idle_contexts() const noexcept { return _max_idle_contexts; }
        [[nodiscard]] bool get_expose_error_details() const noexcept { return _expose_error_details; }

    private:
        bool _redirect_trailing_slash = false;
        bool _handle_method_not_allowed = false;
        std::size_t _max_path_length = 4096;
        bool _decode_path_parameters = true;
        std::size_t _max_idle_contexts = 1024;
        bool _expose_error_details = false;
    };

} // namespace weft

// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

/**
 * @file config_parser.h
 * @brief Typed lookups over a flat string configuration map
 *
 * Usage:
 * @code
 * using kcenon::tracing::config_parser;
 *
 * config_map config = {{"enabled", "true"}, {"enrichment_headers", "x-tenant, x-client"}};
 *
 * bool enabled = config_parser::get<bool>(config, "enabled", true);
 * auto headers = config_parser::get_list<std::string>(config, "enrichment_headers", {});
 * @endcode
 */

#include "string_utils.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace kcenon::tracing {

/**
 * @brief Type alias for configuration map
 */
using config_map = std::unordered_map<std::string, std::string>;

/**
 * @class config_parser
 * @brief Type-safe parsing of configuration values with default fallback
 *
 * Values that are present but cannot be parsed fall back to the default;
 * callers that must tell the two apart use get_optional together with
 * has_key.
 */
class config_parser {
   public:
    template <typename T>
    static T get(const config_map& config, const std::string& key, const T& default_value) {
        auto parsed = get_optional<T>(config, key);
        return parsed ? *parsed : default_value;
    }

    /**
     * @brief Look up and parse a value
     * @return Empty if the key is missing or the value does not parse
     */
    template <typename T>
    static std::optional<T> get_optional(const config_map& config, const std::string& key) {
        auto it = config.find(key);
        if (it == config.end()) {
            return std::nullopt;
        }
        return parse_value<T>(it->second);
    }

    static bool has_key(const config_map& config, const std::string& key) {
        return config.find(key) != config.end();
    }

    /**
     * @brief Get a list of values from a comma-separated string
     *
     * Elements are trimmed; blank and unparseable elements are skipped. A
     * present but empty value yields an empty list, which lets a
     * configuration switch a default list off.
     */
    template <typename T>
    static std::vector<T> get_list(const config_map& config, const std::string& key,
                                   const std::vector<T>& default_values) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_values;
        }

        std::vector<T> values;
        for (const auto& piece : utils::split_trimmed(it->second, ',')) {
            if (auto parsed = parse_value<T>(piece)) {
                values.push_back(*parsed);
            }
        }
        return values;
    }

   private:
    template <typename T>
    static std::optional<T> parse_value(const std::string& str) {
        if constexpr (std::is_same_v<T, bool>) {
            return parse_bool(str);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return str;
        } else if constexpr (std::is_integral_v<T>) {
            try {
                std::size_t consumed = 0;
                if constexpr (std::is_signed_v<T>) {
                    auto value = std::stoll(str, &consumed);
                    if (consumed != str.size()) {
                        return std::nullopt;
                    }
                    return static_cast<T>(value);
                } else {
                    auto value = std::stoull(str, &consumed);
                    if (consumed != str.size()) {
                        return std::nullopt;
                    }
                    return static_cast<T>(value);
                }
            } catch (const std::logic_error&) {
                return std::nullopt;
            }
        } else if constexpr (std::is_floating_point_v<T>) {
            try {
                return static_cast<T>(std::stold(str));
            } catch (const std::logic_error&) {
                return std::nullopt;
            }
        } else {
            static_assert(std::is_same_v<T, bool>, "config_parser: unsupported value type");
        }
    }

    /**
     * @brief "true"/"1"/"yes"/"on" and "false"/"0"/"no"/"off", case-insensitive
     */
    static std::optional<bool> parse_bool(const std::string& str) {
        auto lower = utils::to_lower(utils::trim(str));
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        return std::nullopt;
    }
};

}  // namespace kcenon::tracing

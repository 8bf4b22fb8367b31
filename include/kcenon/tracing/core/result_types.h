#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file result_types.h
 * @brief Result pattern type definitions for the tracing system
 *
 * Tracing operations that can fail report through common_system's
 * Result<T> so that callers across the ecosystem handle errors the same way.
 * Errors raised by traced business code are never converted into results;
 * only the instrumentation layer itself reports this way.
 */

#include "error_codes.h"
#include <kcenon/common/patterns/result.h>

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace kcenon { namespace tracing {

/**
 * @struct error_info
 * @brief Extended error information with context
 */
struct error_info {
    tracing_error_code code;
    std::string message;
    std::optional<std::string> context{std::nullopt};

    error_info(tracing_error_code c,
               const std::string& msg = "",
               const std::optional<std::string>& ctx = std::nullopt)
        : code(c)
        , message(msg.empty() ? error_code_to_string(c) : msg)
        , context(ctx) {}

    /**
     * @brief Get formatted error string
     * @return Formatted error message with context information
     */
    std::string to_string() const {
        std::string result = "[" + error_code_to_string(code) + "] " + message;
        if (context.has_value()) {
            result += " Context: " + context.value();
        }
        return result;
    }

    /**
     * @brief Convert to common_system error_info
     */
    common::error_info to_common_error() const {
        common::error_info info(static_cast<int>(code), message, "tracing_system");
        if (context) {
            info.details = context;
        }
        return info;
    }

    /**
     * @brief Create from common_system error_info
     */
    static error_info from_common_error(const common::error_info& common_err) {
        error_info info(static_cast<tracing_error_code>(common_err.code),
                        common_err.message);
        if (common_err.details) {
            info.context = common_err.details;
        }
        return info;
    }
};

template<typename T>
using result = common::Result<T>;

using result_void = common::VoidResult;

/**
 * @brief Create a successful result
 */
template<typename T>
common::Result<std::decay_t<T>> make_success(T&& value) {
    return common::ok<std::decay_t<T>>(std::forward<T>(value));
}

/**
 * @brief Create an error result
 * @tparam T The expected value type
 * @param code The error code
 * @param message Optional error message
 */
template<typename T>
common::Result<T> make_error(tracing_error_code code,
                             const std::string& message = "") {
    error_info err(code, message);
    return common::Result<T>::err(err.to_common_error());
}

/**
 * @brief Create an error result with context
 */
template<typename T>
common::Result<T> make_error_with_context(tracing_error_code code,
                                          const std::string& message,
                                          const std::string& context) {
    error_info err(code, message, context);
    return common::Result<T>::err(err.to_common_error());
}

inline common::VoidResult make_void_error(tracing_error_code code,
                                          const std::string& message = "") {
    error_info err(code, message);
    return common::VoidResult::err(err.to_common_error());
}

inline common::VoidResult make_void_success() {
    return common::VoidResult(std::monostate{});
}

/**
 * @brief Recover the tracing error code carried by a failed result
 */
template<typename R>
tracing_error_code error_code_of(const R& failed) {
    return static_cast<tracing_error_code>(failed.error().code);
}

} } // namespace kcenon::tracing

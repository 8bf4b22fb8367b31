#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file span_types.h
 * @brief Value types shared by spans, tracers and the interception engine
 */

#include "../context/span_context.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kcenon { namespace tracing {

/**
 * @enum span_kind
 * @brief Role of a span in a distributed interaction
 */
enum class span_kind {
    internal,   ///< In-process operation
    server,     ///< Handling of a received request
    client,     ///< Outgoing request
    producer,   ///< Message publication
    consumer    ///< Message processing
};

/**
 * @enum status_code
 * @brief Outcome of a span
 */
enum class status_code {
    unset,
    ok,
    error
};

inline std::string to_string(span_kind kind) {
    switch (kind) {
        case span_kind::internal: return "internal";
        case span_kind::server:   return "server";
        case span_kind::client:   return "client";
        case span_kind::producer: return "producer";
        case span_kind::consumer: return "consumer";
    }
    return "internal";
}

inline std::string to_string(status_code code) {
    switch (code) {
        case status_code::unset: return "unset";
        case status_code::ok:    return "ok";
        case status_code::error: return "error";
    }
    return "unset";
}

/**
 * @brief Typed span attribute value
 */
using attribute_value = std::variant<std::string, std::int64_t, double, bool>;

/**
 * @brief Render any attribute value as text
 */
std::string to_string(const attribute_value& value);

/**
 * @struct span_event
 * @brief Timestamped annotation recorded on a span
 */
struct span_event {
    std::string name;
    std::chrono::system_clock::time_point timestamp;
    std::unordered_map<std::string, std::string> attributes;
};

/**
 * @struct span_link
 * @brief Non-parental reference to another span, possibly in another trace
 */
struct span_link {
    span_context context;
    std::unordered_map<std::string, std::string> attributes;
};

} } // namespace kcenon::tracing

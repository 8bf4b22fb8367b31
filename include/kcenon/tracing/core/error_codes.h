#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file error_codes.h
 * @brief Tracing system specific error codes
 *
 * Error codes follow the numbering scheme used across the kcenon ecosystem:
 * one thousand-wide range per subsystem, 0 for success, 9999 for unknown.
 */

#include <cstdint>
#include <string>

namespace kcenon { namespace tracing {

/**
 * @enum tracing_error_code
 * @brief Error codes for tracing system operations
 */
enum class tracing_error_code : std::uint32_t {
    // Success
    success = 0,

    // Span context errors (1000-1999)
    missing_trace_id = 1000,
    missing_span_id = 1001,
    invalid_trace_id = 1002,
    invalid_span_id = 1003,
    invalid_trace_flags = 1004,
    invalid_traceparent = 1005,

    // Span lifecycle errors (2000-2999)
    invalid_span = 2000,
    span_already_finished = 2001,
    no_active_span = 2002,
    tracer_unavailable = 2003,

    // Configuration errors (3000-3999)
    invalid_configuration = 3000,
    configuration_parse_error = 3001,

    // Export errors (4000-4999)
    exporter_unavailable = 4000,
    export_failed = 4001,

    // Unknown error
    unknown_error = 9999
};

/**
 * @brief Convert error code to string representation
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string error_code_to_string(tracing_error_code code) {
    switch (code) {
        case tracing_error_code::success:
            return "Success";

        // Span context errors
        case tracing_error_code::missing_trace_id:
            return "Trace id is missing";
        case tracing_error_code::missing_span_id:
            return "Span id is missing";
        case tracing_error_code::invalid_trace_id:
            return "Invalid trace id";
        case tracing_error_code::invalid_span_id:
            return "Invalid span id";
        case tracing_error_code::invalid_trace_flags:
            return "Invalid trace flags";
        case tracing_error_code::invalid_traceparent:
            return "Invalid traceparent header";

        // Span lifecycle errors
        case tracing_error_code::invalid_span:
            return "Invalid span";
        case tracing_error_code::span_already_finished:
            return "Span already finished";
        case tracing_error_code::no_active_span:
            return "No active span";
        case tracing_error_code::tracer_unavailable:
            return "Tracer unavailable";

        // Configuration errors
        case tracing_error_code::invalid_configuration:
            return "Invalid configuration";
        case tracing_error_code::configuration_parse_error:
            return "Configuration parse error";

        // Export errors
        case tracing_error_code::exporter_unavailable:
            return "Exporter unavailable";
        case tracing_error_code::export_failed:
            return "Export failed";

        case tracing_error_code::unknown_error:
        default:
            return "Unknown error";
    }
}

} } // namespace kcenon::tracing

#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file attribute_names.h
 * @brief Attribute and event names written by the tracing layer
 *
 * Names follow the OpenTelemetry semantic conventions: dot-separated
 * namespaces, snake_case leaves.
 */

namespace kcenon { namespace tracing { namespace attribute_names {

// Source code location of the intercepted operation
inline constexpr const char* code_function = "code.function";
inline constexpr const char* code_namespace = "code.namespace";

// Exception recording
inline constexpr const char* exception_event = "exception";
inline constexpr const char* exception_type = "exception.type";
inline constexpr const char* exception_message = "exception.message";

// Resource
inline constexpr const char* service_name = "service.name";

// Messaging
inline constexpr const char* messaging_system = "messaging.system";
inline constexpr const char* messaging_destination = "messaging.destination.name";
inline constexpr const char* messaging_operation = "messaging.operation";
inline constexpr const char* messaging_message_id = "messaging.message.id";

// Prefix for request headers copied onto a span
inline constexpr const char* http_request_header_prefix = "http.request.header.";

} } } // namespace kcenon::tracing::attribute_names

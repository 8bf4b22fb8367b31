#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file span_enricher.h
 * @brief Best-effort enrichment of the active span from application code
 *
 * Every operation here is safe to call from business logic: with no usable
 * active span it logs a warning and returns, and failures raised while
 * collecting attributes are logged instead of propagated.
 */

#include "../attributes/telemetry_attributes.h"

#include <optional>
#include <string>

namespace kcenon { namespace tracing {

/**
 * @class span_enricher
 * @brief Static helpers that write onto the span active on the calling thread
 */
class span_enricher {
public:
    span_enricher() = delete;

    /**
     * @brief Set each entry with a non-blank key and value, in order
     *
     * Later entries overwrite earlier ones with the same key. An empty map
     * does nothing.
     */
    static void add_attributes(const attribute_map& attributes);

    /**
     * @brief Set the attributes exposed by a domain object; null is ignored
     */
    static void add_attributes(const telemetry_attributes* source);
    static void add_attributes(const telemetry_attributes& source);

    /**
     * @brief Record a named event; blank names are ignored
     */
    static void add_event(const std::string& name);

    /**
     * @brief Record a named event carrying the usable entries of a map
     *
     * If no entry survives filtering a bare event is recorded.
     */
    static void add_event(const std::string& name, const attribute_map& attributes);
    static void add_event(const std::string& name, const telemetry_attributes& source);

    static std::optional<std::string> current_trace_id();
    static std::optional<std::string> current_span_id();
};

} } // namespace kcenon::tracing

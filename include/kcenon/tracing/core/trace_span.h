#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file trace_span.h
 * @brief Span record created by a tracer and mutated while it is active
 */

#include "span_types.h"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon { namespace tracing {

/**
 * @struct trace_span
 * @brief One unit of traced work
 *
 * A span is owned by the code that started it. Application code reaches it
 * only through the active span (see span_scope) and never finishes it
 * directly. A span is not synchronized: it belongs to the call that created
 * it and is only touched from that call's thread.
 */
struct trace_span {
    std::string trace_id;
    std::string span_id;
    std::string parent_span_id;
    std::uint8_t trace_flags{span_context::sampled_flag};
    std::string name;
    std::string service_name;
    span_kind kind{span_kind::internal};

    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::chrono::microseconds duration{0};

    status_code status{status_code::unset};
    std::string status_message;

    std::unordered_map<std::string, attribute_value> attributes;
    std::vector<span_event> events;
    std::vector<span_link> links;

    span_context context() const {
        return span_context(trace_id, span_id, trace_flags, false);
    }

    bool is_finished() const {
        return end_time != std::chrono::system_clock::time_point{};
    }

    void set_attribute(const std::string& key, attribute_value value) {
        attributes[key] = std::move(value);
    }

    /**
     * @brief Look up an attribute (nullptr if absent)
     */
    const attribute_value* find_attribute(const std::string& key) const {
        auto it = attributes.find(key);
        return it == attributes.end() ? nullptr : &it->second;
    }

    void add_event(std::string event_name,
                   std::unordered_map<std::string, std::string> event_attributes = {}) {
        events.push_back(span_event{std::move(event_name), std::chrono::system_clock::now(),
                                    std::move(event_attributes)});
    }

    void add_link(span_link link) { links.push_back(std::move(link)); }

    /**
     * @brief Record an exception as an "exception" event
     * @param type Exception type name
     * @param message Exception message
     */
    void record_exception(const std::string& type, const std::string& message);

    /**
     * @brief Set the span status; a description is kept only for errors
     */
    void set_status(status_code code, const std::string& description = "") {
        status = code;
        status_message = (code == status_code::error) ? description : std::string{};
    }

    void calculate_duration() {
        duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
    }
};

} } // namespace kcenon::tracing

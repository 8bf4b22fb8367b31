#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file trace_carrier.h
 * @brief Trace coordinates travelling inside an asynchronous message
 */

#include <optional>
#include <string>

namespace kcenon { namespace tracing {

/**
 * @class trace_carrier
 * @brief Base for messages that carry their producer's span coordinates
 *
 * The producer fills the fields before publishing (see
 * span_link_builder::inject). The consumer reads them opportunistically:
 * missing or malformed fields are normal and only mean the consumer span is
 * not linked. Values are the W3C lower-case hex forms (32, 16 and 2
 * characters).
 */
class trace_carrier {
public:
    virtual ~trace_carrier() = default;

    const std::optional<std::string>& carried_trace_id() const { return trace_id_; }
    const std::optional<std::string>& carried_span_id() const { return span_id_; }
    const std::optional<std::string>& carried_trace_flags() const { return trace_flags_; }

    void set_carried_trace_id(std::optional<std::string> value) { trace_id_ = std::move(value); }
    void set_carried_span_id(std::optional<std::string> value) { span_id_ = std::move(value); }
    void set_carried_trace_flags(std::optional<std::string> value) {
        trace_flags_ = std::move(value);
    }

    /**
     * @brief True when both trace id and span id are present and non-empty
     *
     * Says nothing about whether they are well formed.
     */
    bool has_trace_context() const {
        return trace_id_ && !trace_id_->empty() && span_id_ && !span_id_->empty();
    }

    void clear_trace_context() {
        trace_id_.reset();
        span_id_.reset();
        trace_flags_.reset();
    }

protected:
    trace_carrier() = default;
    trace_carrier(const trace_carrier&) = default;
    trace_carrier(trace_carrier&&) = default;
    trace_carrier& operator=(const trace_carrier&) = default;
    trace_carrier& operator=(trace_carrier&&) = default;

private:
    std::optional<std::string> trace_id_;
    std::optional<std::string> span_id_;
    std::optional<std::string> trace_flags_;
};

} } // namespace kcenon::tracing

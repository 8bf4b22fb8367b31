#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file tracer_interface.h
 * @brief Abstract tracer primitive the instrumentation layer is built on
 */

#include "../core/result_types.h"
#include "../core/trace_span.h"

#include <memory>
#include <string>
#include <vector>

namespace kcenon { namespace tracing {

/**
 * @struct span_start_options
 * @brief Everything a tracer needs to start one span
 */
struct span_start_options {
    std::string name;
    span_kind kind{span_kind::internal};

    /// Explicit parent; when null the span active on the calling thread is used
    std::shared_ptr<trace_span> parent;

    /// Ignore any active span and start a new trace
    bool new_root{false};

    /// Non-parental references attached at start
    std::vector<span_link> links;
};

/**
 * @class tracer_interface
 * @brief Creates and finishes spans
 *
 * Implementations must be safe to share between threads; a single tracer
 * instance serves every concurrent call.
 */
class tracer_interface {
public:
    virtual ~tracer_interface() = default;

    /**
     * @brief Start a span
     * @return The new span, not yet active on any thread
     */
    virtual result<std::shared_ptr<trace_span>> start_span(const span_start_options& options) = 0;

    /**
     * @brief Finish a span; fails with span_already_finished on a second call
     */
    virtual result_void finish_span(const std::shared_ptr<trace_span>& span) = 0;
};

} } // namespace kcenon::tracing

#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file span_scope.h
 * @brief Thread-local active span tracking
 *
 * Each thread keeps its own stack of active spans. Activating a span pushes
 * it; leaving the scope pops it and restores the previous one, so nested
 * intercepted calls attach to their caller and nothing leaks between
 * threads serving concurrent requests.
 */

#include "../core/trace_span.h"

#include <cstddef>
#include <memory>

namespace kcenon { namespace tracing {

/**
 * @brief The span active on the calling thread, or nullptr
 */
std::shared_ptr<trace_span> active_span();

/**
 * @brief Number of spans currently stacked on the calling thread
 */
std::size_t active_span_depth();

/**
 * @class span_scope
 * @brief RAII activation of a span on the calling thread
 *
 * A scope built from nullptr is inert, which lets callers activate the
 * result of a failed span start without branching.
 */
class span_scope {
public:
    explicit span_scope(std::shared_ptr<trace_span> span);
    ~span_scope();

    span_scope(const span_scope&) = delete;
    span_scope& operator=(const span_scope&) = delete;
    span_scope(span_scope&&) = delete;
    span_scope& operator=(span_scope&&) = delete;

    trace_span* operator->() const { return span_.get(); }
    const std::shared_ptr<trace_span>& span() const { return span_; }

private:
    std::shared_ptr<trace_span> span_;
    bool pushed_{false};
};

} } // namespace kcenon::tracing

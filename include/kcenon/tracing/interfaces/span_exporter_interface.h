#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file span_exporter_interface.h
 * @brief Receiver of finished spans
 */

#include "../core/result_types.h"
#include "../core/trace_span.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon { namespace tracing {

/**
 * @class span_exporter_interface
 * @brief Abstract interface for span exporters
 */
class span_exporter_interface {
public:
    virtual ~span_exporter_interface() = default;

    /**
     * @brief Export a batch of finished spans
     */
    virtual result_void export_spans(const std::vector<trace_span>& spans) = 0;

    /**
     * @brief Flush any pending spans
     */
    virtual result_void flush() = 0;

    /**
     * @brief Shutdown the exporter; later exports fail
     */
    virtual result_void shutdown() = 0;

    virtual std::unordered_map<std::string, std::size_t> get_stats() const = 0;
};

} } // namespace kcenon::tracing

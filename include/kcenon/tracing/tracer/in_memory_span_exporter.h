#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file in_memory_span_exporter.h
 * @brief Exporter that keeps finished spans in memory for inspection
 */

#include "../interfaces/span_exporter_interface.h"

#include <atomic>
#include <mutex>
#include <optional>

namespace kcenon { namespace tracing {

/**
 * @class in_memory_span_exporter
 * @brief Thread-safe span sink used by tests and examples
 */
class in_memory_span_exporter : public span_exporter_interface {
public:
    result_void export_spans(const std::vector<trace_span>& spans) override;
    result_void flush() override;
    result_void shutdown() override;
    std::unordered_map<std::string, std::size_t> get_stats() const override;

    /**
     * @brief Snapshot of every span exported so far, in finish order
     */
    std::vector<trace_span> finished_spans() const;

    /**
     * @brief First exported span with the given name
     */
    std::optional<trace_span> find(const std::string& name) const;

    std::size_t size() const;
    void reset();

private:
    mutable std::mutex mutex_;
    std::vector<trace_span> spans_;
    std::atomic<bool> shut_down_{false};
    std::atomic<std::size_t> rejected_spans_{0};
};

} } // namespace kcenon::tracing

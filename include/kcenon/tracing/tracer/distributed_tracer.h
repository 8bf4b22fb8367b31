#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file distributed_tracer.h
 * @brief Default tracer primitive
 *
 * Creates spans with random W3C-sized identifiers, parents them under the
 * span active on the calling thread, and hands every finished span to the
 * configured exporter right away. It does not batch, sample or talk to the
 * network; those belong to whatever exporter is plugged in.
 */

#include "../interfaces/span_exporter_interface.h"
#include "../interfaces/tracer_interface.h"

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

namespace kcenon { namespace tracing {

/**
 * @class distributed_tracer
 * @brief Thread-safe tracer_interface implementation
 */
class distributed_tracer : public tracer_interface {
public:
    explicit distributed_tracer(std::string service_name = "tracing_system");
    ~distributed_tracer() override;

    distributed_tracer(const distributed_tracer&) = delete;
    distributed_tracer& operator=(const distributed_tracer&) = delete;

    result<std::shared_ptr<trace_span>> start_span(const span_start_options& options) override;
    result_void finish_span(const std::shared_ptr<trace_span>& span) override;

    /**
     * @brief Convenience overload for a plain span
     */
    result<std::shared_ptr<trace_span>> start_span(const std::string& name,
                                                   span_kind kind = span_kind::internal);

    void set_exporter(std::shared_ptr<span_exporter_interface> exporter);
    std::shared_ptr<span_exporter_interface> get_exporter() const;

    const std::string& service_name() const;

    /**
     * @brief Counters: started_spans, finished_spans, failed_exports
     */
    std::unordered_map<std::string, std::size_t> get_stats() const;

    static std::string generate_trace_id();
    static std::string generate_span_id();

private:
    struct tracer_impl;
    std::unique_ptr<tracer_impl> impl_;
};

} } // namespace kcenon::tracing

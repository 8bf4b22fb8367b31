#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file span_link_builder.h
 * @brief Starts consumer spans linked to the producer that sent the message
 *
 * A consumer span keeps its own trace (it is parented under whatever is
 * active on the consuming thread) and references the producer span through
 * a span_link, so both traces can be navigated from either side.
 */

#include "../interfaces/tracer_interface.h"
#include "trace_carrier.h"

#include <memory>
#include <optional>
#include <string>

namespace kcenon { namespace tracing {

/**
 * @class span_link_builder
 * @brief Producer-side injection and consumer-side linked span creation
 */
class span_link_builder {
public:
    explicit span_link_builder(std::shared_ptr<tracer_interface> tracer);

    /**
     * @brief Start a span linked to the carried coordinates
     *
     * Coordinates that do not decode to a valid context are logged at
     * warning level and a plain span is started instead.
     */
    result<std::shared_ptr<trace_span>> start_span(
        const std::string& name,
        span_kind kind,
        const std::optional<std::string>& trace_id,
        const std::optional<std::string>& span_id,
        const std::optional<std::string>& trace_flags = std::nullopt) const;

    result<std::shared_ptr<trace_span>> start_span(const std::string& name,
                                                   span_kind kind,
                                                   const trace_carrier& carrier) const;

    /**
     * @brief Write a span's coordinates onto an outgoing message
     */
    static void inject(const trace_span& span, trace_carrier& carrier);

    /**
     * @brief Write the active span's coordinates onto an outgoing message
     * @return false if there is no active span with a valid context
     */
    static bool inject_active(trace_carrier& carrier);

private:
    std::shared_ptr<tracer_interface> tracer_;
};

} } // namespace kcenon::tracing

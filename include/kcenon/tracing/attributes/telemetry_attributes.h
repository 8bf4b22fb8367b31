#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file telemetry_attributes.h
 * @brief Contract for domain objects that expose span attributes
 *
 * @code
 * struct order : public telemetry_attributes {
 *     std::string id;
 *     std::optional<std::string> coupon;
 *
 *     attribute_map attributes() const override {
 *         return {{"order.id", id}, {"order.coupon", coupon}};
 *     }
 * };
 *
 * span_enricher::add_attributes(current_order);
 * @endcode
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon { namespace tracing {

/**
 * @brief Insertion-ordered attribute entries
 *
 * An absent value means "not applicable to this instance"; such entries are
 * skipped when applied to a span. When a key repeats, the later entry wins.
 */
using attribute_map = std::vector<std::pair<std::string, std::optional<std::string>>>;

/**
 * @class telemetry_attributes
 * @brief Implemented by objects that can describe themselves on a span
 */
class telemetry_attributes {
public:
    virtual ~telemetry_attributes() = default;

    /**
     * @brief Project the object's current state into span attributes
     *
     * Keys are stable dot-separated identifiers such as "order.id".
     * Must not have side effects.
     */
    virtual attribute_map attributes() const = 0;
};

} } // namespace kcenon::tracing

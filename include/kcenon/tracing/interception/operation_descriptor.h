#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file operation_descriptor.h
 * @brief Declarative description of a traced operation and its resolved form
 */

#include "../core/span_types.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace kcenon { namespace tracing {

/**
 * @struct span_attribute
 * @brief Binds the argument at a position to an attribute key
 *
 * The key is ignored for arguments implementing telemetry_attributes; their
 * whole attribute map is merged instead.
 */
struct span_attribute {
    std::size_t position;
    std::string key;
};

/**
 * @struct traced_method
 * @brief Declaration attached to an operation that should be traced
 *
 * @code
 * traced_method method;
 * method.declaring_type = "shop::order_service";
 * method.function = "place_order";
 * method.kind = span_kind::server;
 * method.attributes = {"component:checkout"};
 * method.parameters = {{0, "order.id"}};
 * @endcode
 */
struct traced_method {
    std::string declaring_type;
    std::string function;

    /// Explicit span name; when empty it is derived as "<type>.<function>"
    std::string name;
    span_kind kind{span_kind::internal};

    /// Static attributes written as "key:value"
    std::vector<std::string> attributes;
    std::vector<span_attribute> parameters;
};

/**
 * @class operation_descriptor
 * @brief A traced_method resolved once and reused for every invocation
 */
class operation_descriptor {
public:
    static constexpr const char* anonymous_name = "anonymous_operation";

    /**
     * @brief Resolve the span name and parse the static attributes
     *
     * Malformed static attribute entries (no ':' or a blank key) are dropped
     * with a debug log.
     */
    static operation_descriptor resolve(const traced_method& method);

    const std::string& span_name() const { return span_name_; }
    span_kind kind() const { return kind_; }
    const std::string& code_function() const { return code_function_; }
    const std::string& code_namespace() const { return code_namespace_; }

    const std::vector<std::pair<std::string, std::string>>& static_attributes() const {
        return static_attributes_;
    }

    /**
     * @brief Attribute key bound to an argument position, or nullptr
     */
    const std::string* parameter_key(std::size_t position) const;

    /**
     * @brief Span name for a declaration: explicit name, else the last
     *        component of the declaring type joined to the function name
     */
    static std::string derive_span_name(const traced_method& method);

private:
    operation_descriptor() = default;

    std::string span_name_;
    span_kind kind_{span_kind::internal};
    std::string code_function_;
    std::string code_namespace_;
    std::vector<std::pair<std::string, std::string>> static_attributes_;
    std::vector<std::pair<std::size_t, std::string>> parameter_keys_;
};

} } // namespace kcenon::tracing

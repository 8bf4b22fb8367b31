#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file parameter_binding.h
 * @brief Conversion of intercepted arguments into span attributes
 *
 * The conversion is chosen at compile time from the argument type:
 * - std::optional, raw pointers and smart pointers are unwrapped; empty ones
 *   are skipped
 * - telemetry_attributes implementations merge their whole attribute map
 * - string-like values, bool, integers and floating point keep their type
 * - anything with an ADL to_string() or an operator<< is rendered as text
 *
 * Binding a type matching none of these fails to compile; is_bindable()
 * lets callers test for that first.
 */

#include "../attributes/telemetry_attributes.h"
#include "../core/trace_span.h"
#include "../logging/tracing_logger.h"
#include "../utils/string_utils.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace kcenon { namespace tracing {

namespace detail {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_smart_pointer : std::false_type {};
template <typename T, typename D>
struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type {};
template <typename T>
struct is_smart_pointer<std::shared_ptr<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_string_like_v = std::is_convertible_v<const T&, std::string_view>;

template <typename T, typename = void>
struct has_adl_to_string : std::false_type {};
template <typename T>
struct has_adl_to_string<
    T, std::void_t<decltype(std::string(to_string(std::declval<const T&>())))>>
    : std::true_type {};

template <typename T, typename = void>
struct is_streamable : std::false_type {};
template <typename T>
struct is_streamable<
    T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template <typename T>
inline constexpr bool always_false_v = false;

} // namespace detail

/**
 * @brief True if bind_parameter accepts T
 */
template <typename T>
constexpr bool is_bindable() {
    using U = std::remove_cv_t<std::remove_reference_t<T>>;

    if constexpr (std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::nullopt_t>) {
        return true;
    } else if constexpr (detail::is_optional<U>::value) {
        return is_bindable<typename U::value_type>();
    } else if constexpr (std::is_pointer_v<U> && detail::is_string_like_v<U>) {
        return true;
    } else if constexpr (std::is_pointer_v<U>) {
        using pointee = std::remove_pointer_t<U>;
        if constexpr (std::is_void_v<pointee> || std::is_function_v<pointee>) {
            return false;
        } else {
            return is_bindable<pointee>();
        }
    } else if constexpr (detail::is_smart_pointer<U>::value) {
        return is_bindable<typename U::element_type>();
    } else if constexpr (std::is_base_of_v<telemetry_attributes, U>) {
        return true;
    } else {
        return detail::is_string_like_v<U> || std::is_arithmetic_v<U> ||
               detail::has_adl_to_string<U>::value || detail::is_streamable<U>::value;
    }
}

/**
 * @brief Merge a telemetry_attributes map onto a span, skipping absent values
 */
inline void merge_attributes(trace_span& span, const telemetry_attributes& source) {
    for (const auto& [key, value] : source.attributes()) {
        if (!utils::is_blank(key) && value) {
            span.set_attribute(key, *value);
        }
    }
}

/**
 * @brief Write one argument onto a span under the given key
 */
template <typename T>
void bind_parameter(trace_span& span, const std::string& key, const T& value) {
    using U = std::remove_cv_t<T>;

    if constexpr (std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::nullopt_t>) {
        return;
    } else if constexpr (detail::is_optional<U>::value) {
        if (value) {
            bind_parameter(span, key, *value);
        }
    } else if constexpr (std::is_pointer_v<U> && detail::is_string_like_v<U>) {
        if (value != nullptr) {
            bind_parameter(span, key, std::string_view(value));
        }
    } else if constexpr (std::is_pointer_v<U> || detail::is_smart_pointer<U>::value) {
        if (value) {
            bind_parameter(span, key, *value);
        }
    } else if constexpr (std::is_base_of_v<telemetry_attributes, U>) {
        merge_attributes(span, value);
    } else {
        if (utils::is_blank(key)) {
            tracing_logger::debug("skipping parameter bound to a blank key on '" + span.name + "'");
            return;
        }

        if constexpr (detail::is_string_like_v<U>) {
            span.set_attribute(key, std::string(std::string_view(value)));
        } else if constexpr (std::is_same_v<U, bool>) {
            span.set_attribute(key, attribute_value(std::in_place_type<bool>, value));
        } else if constexpr (std::is_same_v<U, char>) {
            span.set_attribute(key, std::string(1, value));
        } else if constexpr (std::is_integral_v<U>) {
            span.set_attribute(key, static_cast<std::int64_t>(value));
        } else if constexpr (std::is_floating_point_v<U>) {
            span.set_attribute(key, static_cast<double>(value));
        } else if constexpr (detail::has_adl_to_string<U>::value) {
            span.set_attribute(key, std::string(to_string(value)));
        } else if constexpr (detail::is_streamable<U>::value) {
            std::ostringstream os;
            os << value;
            span.set_attribute(key, os.str());
        } else {
            static_assert(detail::always_false_v<U>,
                          "parameter type cannot be rendered as a span attribute; "
                          "provide to_string() or operator<<");
        }
    }
}

} } // namespace kcenon::tracing

#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file span_context.h
 * @brief Span context value type and its string codec
 *
 * A span context is the (trace-id, span-id, trace-flags) triple identifying a
 * span for propagation. The codec turns it into three plain hex strings that
 * can ride on a serialized message, and back. Decoding never throws: any
 * malformed or partial input yields an invalid context, which callers treat
 * as "no context".
 */

#include "../core/result_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon { namespace tracing {

/**
 * @class span_context
 * @brief Immutable identity of a span
 */
class span_context {
public:
    static constexpr std::size_t trace_id_length = 32;
    static constexpr std::size_t span_id_length = 16;
    static constexpr std::uint8_t sampled_flag = 0x01;

    span_context() = default;

    span_context(std::string trace_id,
                 std::string span_id,
                 std::uint8_t trace_flags = 0,
                 bool remote = false)
        : trace_id_(std::move(trace_id))
        , span_id_(std::move(span_id))
        , trace_flags_(trace_flags)
        , remote_(remote) {}

    /**
     * @brief The invalid sentinel returned whenever a context cannot be built
     */
    static span_context invalid() { return span_context{}; }

    const std::string& trace_id() const { return trace_id_; }
    const std::string& span_id() const { return span_id_; }
    std::uint8_t trace_flags() const { return trace_flags_; }
    bool is_sampled() const { return (trace_flags_ & sampled_flag) != 0; }

    /**
     * @brief True for contexts reconstructed from another process
     */
    bool is_remote() const { return remote_; }

    /**
     * @brief Both identifiers are well-formed lowercase hex and non-zero
     */
    bool is_valid() const;

    /**
     * @brief Render as a W3C traceparent header value
     * @return "00-<trace-id>-<span-id>-<flags>", or empty for an invalid context
     */
    std::string to_traceparent() const;

    /**
     * @brief Parse a W3C traceparent header value into a remote context
     */
    static result<span_context> from_traceparent(std::string_view header);

    /**
     * @brief Compares ids and flags; is_remote() is not part of the identity
     */
    bool operator==(const span_context& other) const {
        return trace_id_ == other.trace_id_ && span_id_ == other.span_id_ &&
               trace_flags_ == other.trace_flags_;
    }
    bool operator!=(const span_context& other) const { return !(*this == other); }

private:
    std::string trace_id_;
    std::string span_id_;
    std::uint8_t trace_flags_{0};
    bool remote_{false};
};

/**
 * @struct encoded_span_context
 * @brief The three passenger strings written onto an outgoing message
 */
struct encoded_span_context {
    std::string trace_id;     ///< 32 hex characters
    std::string span_id;      ///< 16 hex characters
    std::string trace_flags;  ///< 2 hex characters
};

/**
 * @class span_context_codec
 * @brief Encodes and decodes span contexts to and from hex strings
 */
class span_context_codec {
public:
    /**
     * @brief Encode a context into its hex fields
     */
    static encoded_span_context encode(const span_context& context);

    /**
     * @brief Decode hex fields into a remote context
     * @param trace_id 32 lowercase hex characters
     * @param span_id 16 lowercase hex characters
     * @param trace_flags 2 hex characters; absent means "not sampled"
     * @return A valid remote context, or span_context::invalid()
     */
    static span_context decode(const std::optional<std::string>& trace_id,
                               const std::optional<std::string>& span_id,
                               const std::optional<std::string>& trace_flags = std::nullopt);

    /**
     * @brief Same rules as decode(), reporting which field was rejected
     */
    static result<span_context> parse(const std::optional<std::string>& trace_id,
                                      const std::optional<std::string>& span_id,
                                      const std::optional<std::string>& trace_flags = std::nullopt);

    static bool is_valid_trace_id(std::string_view value);
    static bool is_valid_span_id(std::string_view value);

    static std::string format_trace_flags(std::uint8_t flags);
    static std::optional<std::uint8_t> parse_trace_flags(std::string_view value);
};

} } // namespace kcenon::tracing

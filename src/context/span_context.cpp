// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file span_context.cpp
 * @brief Span context validation and hex codec
 */

#include <kcenon/tracing/context/span_context.h>
#include <kcenon/tracing/logging/tracing_logger.h>

#include <algorithm>

namespace kcenon { namespace tracing {

namespace {

constexpr std::string_view traceparent_version = "00";
constexpr std::size_t traceparent_length = 55;  // 2 + 1 + 32 + 1 + 16 + 1 + 2

bool is_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_id(std::string_view value, std::size_t length) {
    if (value.size() != length) {
        return false;
    }
    if (!std::all_of(value.begin(), value.end(), is_lower_hex)) {
        return false;
    }
    // All-zero identifiers are reserved as invalid
    return value.find_first_not_of('0') != std::string_view::npos;
}

} // namespace

bool span_context::is_valid() const {
    return span_context_codec::is_valid_trace_id(trace_id_) &&
           span_context_codec::is_valid_span_id(span_id_);
}

std::string span_context::to_traceparent() const {
    if (!is_valid()) {
        return {};
    }
    return std::string(traceparent_version) + "-" + trace_id_ + "-" + span_id_ + "-" +
           span_context_codec::format_trace_flags(trace_flags_);
}

result<span_context> span_context::from_traceparent(std::string_view header) {
    if (header.size() < traceparent_length || header[2] != '-' || header[35] != '-' ||
        header[52] != '-') {
        return make_error<span_context>(tracing_error_code::invalid_traceparent,
                                        "Malformed traceparent: " + std::string(header));
    }

    auto version = header.substr(0, 2);
    if (!std::all_of(version.begin(), version.end(), is_lower_hex) || version == "ff") {
        return make_error<span_context>(tracing_error_code::invalid_traceparent,
                                        "Unsupported traceparent version");
    }
    // Version 00 has no trailing fields
    if (version == traceparent_version && header.size() != traceparent_length) {
        return make_error<span_context>(tracing_error_code::invalid_traceparent,
                                        "Unexpected data after version 00 traceparent");
    }

    return span_context_codec::parse(std::string(header.substr(3, 32)),
                                     std::string(header.substr(36, 16)),
                                     std::string(header.substr(53, 2)));
}

encoded_span_context span_context_codec::encode(const span_context& context) {
    return encoded_span_context{context.trace_id(), context.span_id(),
                                format_trace_flags(context.trace_flags())};
}

span_context span_context_codec::decode(const std::optional<std::string>& trace_id,
                                        const std::optional<std::string>& span_id,
                                        const std::optional<std::string>& trace_flags) {
    auto parsed = parse(trace_id, span_id, trace_flags);
    if (parsed.is_err()) {
        tracing_logger::debug("Discarding carried span context: " +
                              error_info::from_common_error(parsed.error()).to_string());
        return span_context::invalid();
    }
    return parsed.value();
}

result<span_context> span_context_codec::parse(const std::optional<std::string>& trace_id,
                                               const std::optional<std::string>& span_id,
                                               const std::optional<std::string>& trace_flags) {
    if (!trace_id || trace_id->empty()) {
        return make_error<span_context>(tracing_error_code::missing_trace_id);
    }
    if (!span_id || span_id->empty()) {
        return make_error<span_context>(tracing_error_code::missing_span_id);
    }
    if (!is_valid_trace_id(*trace_id)) {
        return make_error_with_context<span_context>(tracing_error_code::invalid_trace_id,
                                                     "Trace id must be 32 lowercase hex digits",
                                                     *trace_id);
    }
    if (!is_valid_span_id(*span_id)) {
        return make_error_with_context<span_context>(tracing_error_code::invalid_span_id,
                                                     "Span id must be 16 lowercase hex digits",
                                                     *span_id);
    }

    std::uint8_t flags = 0;
    if (trace_flags) {
        auto parsed_flags = parse_trace_flags(*trace_flags);
        if (!parsed_flags) {
            return make_error_with_context<span_context>(tracing_error_code::invalid_trace_flags,
                                                         "Trace flags must be 2 hex digits",
                                                         *trace_flags);
        }
        flags = *parsed_flags;
    }

    return make_success(span_context(*trace_id, *span_id, flags, true));
}

bool span_context_codec::is_valid_trace_id(std::string_view value) {
    return is_id(value, span_context::trace_id_length);
}

bool span_context_codec::is_valid_span_id(std::string_view value) {
    return is_id(value, span_context::span_id_length);
}

std::string span_context_codec::format_trace_flags(std::uint8_t flags) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(2, '0');
    out[0] = digits[(flags >> 4) & 0x0f];
    out[1] = digits[flags & 0x0f];
    return out;
}

std::optional<std::uint8_t> span_context_codec::parse_trace_flags(std::string_view value) {
    if (value.size() != 2) {
        return std::nullopt;
    }
    int high = hex_value(value[0]);
    int low = hex_value(value[1]);
    if (high < 0 || low < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>((high << 4) | low);
}

} } // namespace kcenon::tracing

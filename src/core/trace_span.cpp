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
 * @file trace_span.cpp
 * @brief Span helpers
 */

#include <kcenon/tracing/core/trace_span.h>
#include <kcenon/tracing/attributes/attribute_names.h>

#include <sstream>
#include <type_traits>
#include <variant>

namespace kcenon { namespace tracing {

std::string to_string(const attribute_value& value) {
    return std::visit([](const auto& v) -> std::string {
        using value_type = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<value_type, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<value_type, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<value_type, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else {
            return std::to_string(v);
        }
    }, value);
}

void trace_span::record_exception(const std::string& type, const std::string& message) {
    add_event(attribute_names::exception_event,
              {{attribute_names::exception_type, type},
               {attribute_names::exception_message, message}});
}

} } // namespace kcenon::tracing

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

#include <kcenon/tracing/interception/operation_descriptor.h>
#include <kcenon/tracing/logging/tracing_logger.h>
#include <kcenon/tracing/utils/string_utils.h>

#include <algorithm>

namespace kcenon { namespace tracing {

namespace {

std::string simple_type_name(const std::string& declaring_type) {
    auto trimmed = utils::trim(declaring_type);
    auto pos = trimmed.rfind("::");
    if (pos == std::string::npos) {
        return trimmed;
    }
    return trimmed.substr(pos + 2);
}

} // namespace

std::string operation_descriptor::derive_span_name(const traced_method& method) {
    if (!utils::is_blank(method.name)) {
        return method.name;
    }

    auto type_name = simple_type_name(method.declaring_type);
    auto function = utils::trim(method.function);
    if (type_name.empty() && function.empty()) {
        return anonymous_name;
    }
    if (type_name.empty()) {
        return function;
    }
    if (function.empty()) {
        return type_name;
    }
    return type_name + "." + function;
}

operation_descriptor operation_descriptor::resolve(const traced_method& method) {
    operation_descriptor descriptor;
    descriptor.span_name_ = derive_span_name(method);
    descriptor.kind_ = method.kind;
    descriptor.code_function_ = utils::trim(method.function);
    descriptor.code_namespace_ = utils::trim(method.declaring_type);

    for (const auto& entry : method.attributes) {
        auto colon = entry.find(':');
        if (colon == std::string::npos) {
            tracing_logger::debug("dropping static attribute without ':' on '" +
                                  descriptor.span_name_ + "': " + entry);
            continue;
        }
        auto key = utils::trim(std::string_view(entry).substr(0, colon));
        if (key.empty()) {
            tracing_logger::debug("dropping static attribute with blank key on '" +
                                  descriptor.span_name_ + "': " + entry);
            continue;
        }
        descriptor.static_attributes_.emplace_back(
            std::move(key), utils::trim(std::string_view(entry).substr(colon + 1)));
    }

    for (const auto& binding : method.parameters) {
        auto existing = std::find_if(
            descriptor.parameter_keys_.begin(), descriptor.parameter_keys_.end(),
            [&binding](const auto& bound) { return bound.first == binding.position; });
        if (existing != descriptor.parameter_keys_.end()) {
            tracing_logger::debug("parameter " + std::to_string(binding.position) +
                                  " bound twice on '" + descriptor.span_name_ +
                                  "', keeping '" + binding.key + "'");
            existing->second = binding.key;
            continue;
        }
        descriptor.parameter_keys_.emplace_back(binding.position, binding.key);
    }

    return descriptor;
}

const std::string* operation_descriptor::parameter_key(std::size_t position) const {
    for (const auto& bound : parameter_keys_) {
        if (bound.first == position) {
            return &bound.second;
        }
    }
    return nullptr;
}

} } // namespace kcenon::tracing

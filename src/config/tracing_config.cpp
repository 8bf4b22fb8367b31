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

#include <kcenon/tracing/config/tracing_config.h>
#include <kcenon/tracing/utils/string_utils.h>

namespace kcenon { namespace tracing {

namespace {

const char* const boolean_keys[] = {
    "enabled", "record_code_metadata", "record_exceptions", "link_carried_context"
};

} // namespace

result_void tracing_config::validate() const {
    if (utils::is_blank(service_name)) {
        return make_void_error(tracing_error_code::invalid_configuration,
                               "service_name must not be empty");
    }
    for (const auto& prefix : skip_path_prefixes) {
        if (prefix.empty() || prefix.front() != '/') {
            return make_void_error(tracing_error_code::invalid_configuration,
                                   "skip path prefix must start with '/': " + prefix);
        }
    }
    return make_void_success();
}

result<tracing_config> tracing_config::from_map(const config_map& values) {
    for (const auto* key : boolean_keys) {
        if (config_parser::has_key(values, key) &&
            !config_parser::get_optional<bool>(values, key)) {
            return make_error_with_context<tracing_config>(
                tracing_error_code::configuration_parse_error,
                "not a boolean: " + values.at(key), key);
        }
    }

    tracing_config config;
    config.service_name = utils::trim(
        config_parser::get<std::string>(values, "service_name", config.service_name));
    config.enabled = config_parser::get<bool>(values, "enabled", config.enabled);
    config.record_code_metadata =
        config_parser::get<bool>(values, "record_code_metadata", config.record_code_metadata);
    config.record_exceptions =
        config_parser::get<bool>(values, "record_exceptions", config.record_exceptions);
    config.link_carried_context =
        config_parser::get<bool>(values, "link_carried_context", config.link_carried_context);
    config.enrichment_headers = config_parser::get_list<std::string>(
        values, "enrichment_headers", config.enrichment_headers);
    config.skip_path_prefixes = config_parser::get_list<std::string>(
        values, "skip_path_prefixes", config.skip_path_prefixes);

    auto valid = config.validate();
    if (valid.is_err()) {
        return result<tracing_config>::err(valid.error());
    }
    return make_success(std::move(config));
}

} } // namespace kcenon::tracing

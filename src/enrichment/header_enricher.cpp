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

#include <kcenon/tracing/enrichment/header_enricher.h>
#include <kcenon/tracing/attributes/attribute_names.h>
#include <kcenon/tracing/context/span_scope.h>
#include <kcenon/tracing/enrichment/span_enricher.h>
#include <kcenon/tracing/logging/tracing_logger.h>
#include <kcenon/tracing/utils/string_utils.h>

#include <algorithm>

namespace kcenon { namespace tracing {

header_enricher::header_enricher(std::vector<std::string> header_names,
                                 std::vector<std::string> skip_path_prefixes)
    : skip_path_prefixes_(std::move(skip_path_prefixes)) {
    for (const auto& name : header_names) {
        auto normalized = utils::to_lower(utils::trim(name));
        if (normalized.empty()) {
            continue;
        }
        if (std::find(header_names_.begin(), header_names_.end(), normalized) ==
            header_names_.end()) {
            header_names_.push_back(std::move(normalized));
        }
    }
}

header_enricher::header_enricher(const tracing_config& config)
    : header_enricher(config.enrichment_headers, config.skip_path_prefixes) {
}

bool header_enricher::should_skip(std::string_view path) const {
    return std::any_of(skip_path_prefixes_.begin(), skip_path_prefixes_.end(),
                       [path](const std::string& prefix) {
                           return path.substr(0, prefix.size()) == prefix;
                       });
}

attribute_map header_enricher::collect(const header_map& headers) const {
    attribute_map attributes;
    for (const auto& name : header_names_) {
        auto it = std::find_if(headers.begin(), headers.end(), [&name](const auto& header) {
            return utils::iequals(header.first, name);
        });
        if (it == headers.end() || utils::is_blank(it->second)) {
            continue;
        }
        attributes.emplace_back(attribute_names::http_request_header_prefix + name, it->second);
    }
    return attributes;
}

std::size_t header_enricher::enrich(std::string_view path, const header_map& headers) const {
    if (should_skip(path)) {
        return 0;
    }

    auto span = active_span();
    if (!span || !span->context().is_valid()) {
        tracing_logger::debug("no valid span for header enrichment of " + std::string(path));
        return 0;
    }

    auto attributes = collect(headers);
    span_enricher::add_attributes(attributes);
    return attributes.size();
}

} } // namespace kcenon::tracing

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

#include <kcenon/tracing/enrichment/span_enricher.h>
#include <kcenon/tracing/context/span_scope.h>
#include <kcenon/tracing/logging/tracing_logger.h>
#include <kcenon/tracing/utils/string_utils.h>

#include <exception>
#include <unordered_map>

namespace kcenon { namespace tracing {

namespace {

/**
 * @brief The active span if it can still be written to
 */
std::shared_ptr<trace_span> writable_span(const std::string& operation) {
    auto span = active_span();
    if (!span) {
        tracing_logger::warning(operation + ": no active span, ignoring");
        return nullptr;
    }
    if (!span->context().is_valid()) {
        tracing_logger::warning(operation + ": active span has an invalid context, ignoring");
        return nullptr;
    }
    if (span->is_finished()) {
        tracing_logger::warning(operation + ": span '" + span->name +
                                "' already ended, ignoring");
        return nullptr;
    }
    return span;
}

bool is_usable(const attribute_map::value_type& entry) {
    return !utils::is_blank(entry.first) && entry.second.has_value() &&
           !utils::is_blank(*entry.second);
}

std::unordered_map<std::string, std::string> usable_entries(const attribute_map& attributes) {
    std::unordered_map<std::string, std::string> entries;
    for (const auto& entry : attributes) {
        if (is_usable(entry)) {
            entries[entry.first] = *entry.second;
        }
    }
    return entries;
}

std::optional<span_context> current_context() {
    auto span = active_span();
    if (!span) {
        return std::nullopt;
    }
    auto context = span->context();
    if (!context.is_valid()) {
        return std::nullopt;
    }
    return context;
}

} // namespace

void span_enricher::add_attributes(const attribute_map& attributes) {
    if (attributes.empty()) {
        return;
    }

    try {
        auto span = writable_span("add_attributes");
        if (!span) {
            return;
        }
        for (const auto& entry : attributes) {
            if (is_usable(entry)) {
                span->set_attribute(entry.first, *entry.second);
            }
        }
    } catch (const std::exception& e) {
        tracing_logger::warning(std::string("add_attributes failed: ") + e.what());
    } catch (...) {
        tracing_logger::warning("add_attributes failed: unknown exception");
    }
}

void span_enricher::add_attributes(const telemetry_attributes* source) {
    if (source == nullptr) {
        return;
    }
    add_attributes(*source);
}

void span_enricher::add_attributes(const telemetry_attributes& source) {
    attribute_map attributes;
    try {
        attributes = source.attributes();
    } catch (const std::exception& e) {
        tracing_logger::warning(std::string("collecting span attributes failed: ") + e.what());
        return;
    } catch (...) {
        tracing_logger::warning("collecting span attributes failed: unknown exception");
        return;
    }
    add_attributes(attributes);
}

void span_enricher::add_event(const std::string& name) {
    add_event(name, attribute_map{});
}

void span_enricher::add_event(const std::string& name, const attribute_map& attributes) {
    if (utils::is_blank(name)) {
        tracing_logger::debug("add_event: blank event name, ignoring");
        return;
    }

    try {
        auto span = writable_span("add_event '" + name + "'");
        if (!span) {
            return;
        }
        span->add_event(name, usable_entries(attributes));
    } catch (const std::exception& e) {
        tracing_logger::warning("add_event '" + name + "' failed: " + e.what());
    } catch (...) {
        tracing_logger::warning("add_event '" + name + "' failed: unknown exception");
    }
}

void span_enricher::add_event(const std::string& name, const telemetry_attributes& source) {
    attribute_map attributes;
    try {
        attributes = source.attributes();
    } catch (const std::exception& e) {
        tracing_logger::warning("collecting attributes for event '" + name +
                                "' failed: " + e.what());
        return;
    } catch (...) {
        tracing_logger::warning("collecting attributes for event '" + name +
                                "' failed: unknown exception");
        return;
    }
    add_event(name, attributes);
}

std::optional<std::string> span_enricher::current_trace_id() {
    auto context = current_context();
    if (!context) {
        return std::nullopt;
    }
    return context->trace_id();
}

std::optional<std::string> span_enricher::current_span_id() {
    auto context = current_context();
    if (!context) {
        return std::nullopt;
    }
    return context->span_id();
}

} } // namespace kcenon::tracing

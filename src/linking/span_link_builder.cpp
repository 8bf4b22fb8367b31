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

#include <kcenon/tracing/linking/span_link_builder.h>
#include <kcenon/tracing/context/span_scope.h>
#include <kcenon/tracing/logging/tracing_logger.h>

namespace kcenon { namespace tracing {

span_link_builder::span_link_builder(std::shared_ptr<tracer_interface> tracer)
    : tracer_(std::move(tracer)) {
}

result<std::shared_ptr<trace_span>> span_link_builder::start_span(
    const std::string& name,
    span_kind kind,
    const std::optional<std::string>& trace_id,
    const std::optional<std::string>& span_id,
    const std::optional<std::string>& trace_flags) const {
    if (!tracer_) {
        return make_error<std::shared_ptr<trace_span>>(tracing_error_code::tracer_unavailable);
    }

    span_start_options options;
    options.name = name;
    options.kind = kind;

    auto linked = span_context_codec::decode(trace_id, span_id, trace_flags);
    if (!linked.is_valid()) {
        tracing_logger::warning("creating span '" + name +
                                "' without link due to invalid carried context");
        return tracer_->start_span(options);
    }

    tracing_logger::debug("creating span '" + name + "' with link to trace " +
                          linked.trace_id() + ", span " + linked.span_id());
    options.links.push_back(span_link{linked, {}});
    return tracer_->start_span(options);
}

result<std::shared_ptr<trace_span>> span_link_builder::start_span(
    const std::string& name, span_kind kind, const trace_carrier& carrier) const {
    return start_span(name, kind, carrier.carried_trace_id(), carrier.carried_span_id(),
                      carrier.carried_trace_flags());
}

void span_link_builder::inject(const trace_span& span, trace_carrier& carrier) {
    auto encoded = span_context_codec::encode(span.context());
    carrier.set_carried_trace_id(encoded.trace_id);
    carrier.set_carried_span_id(encoded.span_id);
    carrier.set_carried_trace_flags(encoded.trace_flags);
}

bool span_link_builder::inject_active(trace_carrier& carrier) {
    auto span = active_span();
    if (!span || !span->context().is_valid()) {
        tracing_logger::debug("no active span to inject into outgoing message");
        return false;
    }
    inject(*span, carrier);
    return true;
}

} } // namespace kcenon::tracing

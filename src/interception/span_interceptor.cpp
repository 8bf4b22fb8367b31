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

#include <kcenon/tracing/interception/span_interceptor.h>
#include <kcenon/tracing/attributes/attribute_names.h>
#include <kcenon/tracing/logging/tracing_logger.h>

#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#include <cstdlib>
#endif

namespace kcenon { namespace tracing {

namespace {

std::string readable_type_name(const std::type_info& type) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return type.name();
}

} // namespace

span_interceptor::span_interceptor(std::shared_ptr<tracer_interface> tracer,
                                   tracing_config config)
    : tracer_(std::move(tracer))
    , config_(std::move(config))
    , links_(tracer_) {
}

std::shared_ptr<trace_span> span_interceptor::start(const operation_descriptor& descriptor,
                                                    const trace_carrier* carrier) const {
    if (!tracer_) {
        tracing_logger::warning("no tracer configured, running '" + descriptor.span_name() +
                                "' untraced");
        return nullptr;
    }

    try {
        span_start_options options;
        options.name = descriptor.span_name();
        options.kind = descriptor.kind();
        if (carrier != nullptr) {
            tracing_logger::info("trace context found in arguments of '" +
                                 descriptor.span_name() + "', linking to producer span");
        }

        auto started = carrier != nullptr
            ? links_.start_span(descriptor.span_name(), descriptor.kind(), *carrier)
            : tracer_->start_span(options);

        if (started.is_err() || !started.value()) {
            tracing_logger::warning("could not start span '" + descriptor.span_name() +
                                    "', running untraced" +
                                    (started.is_err() ? ": " + started.error().message
                                                      : std::string{}));
            return nullptr;
        }

        return started.value();
    } catch (const std::exception& e) {
        tracing_logger::warning("tracer failed while starting '" + descriptor.span_name() +
                                "', running untraced: " + e.what());
    } catch (...) {
        tracing_logger::warning("tracer failed while starting '" + descriptor.span_name() +
                                "', running untraced: unknown exception");
    }
    return nullptr;
}

void span_interceptor::apply_static_attributes(trace_span& span,
                                               const operation_descriptor& descriptor) {
    for (const auto& [key, value] : descriptor.static_attributes()) {
        span.set_attribute(key, value);
    }
}

void span_interceptor::apply_code_metadata(trace_span& span,
                                           const operation_descriptor& descriptor) const {
    if (!config_.record_code_metadata) {
        return;
    }
    if (!descriptor.code_function().empty()) {
        span.set_attribute(attribute_names::code_function, descriptor.code_function());
    }
    if (!descriptor.code_namespace().empty()) {
        span.set_attribute(attribute_names::code_namespace, descriptor.code_namespace());
    }
}

void span_interceptor::report_annotation_failure(const trace_span& span, const char* stage,
                                                 const std::string& reason) {
    tracing_logger::warning(std::string("failed to add ") + stage + " to '" + span.name +
                            "': " + reason);
}

void span_interceptor::report_unbindable(const trace_span& span, std::size_t position,
                                         const std::string& key) {
    tracing_logger::warning("argument " + std::to_string(position) + " of '" + span.name +
                            "' cannot be rendered as attribute '" + key + "', skipping");
}

void span_interceptor::mark_ok(trace_span& span) noexcept {
    span.status = status_code::ok;
    span.status_message.clear();
}

void span_interceptor::record_failure(trace_span& span,
                                      std::exception_ptr failure) const noexcept {
    std::string type = "unknown";
    std::string message = "unknown exception";
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        type = readable_type_name(typeid(e));
        message = e.what();
    } catch (...) {
        // Not derived from std::exception; the defaults above describe it
    }

    try {
        if (config_.record_exceptions) {
            span.record_exception(type, message);
        }
        span.set_status(status_code::error, message);
    } catch (const std::exception& e) {
        span.status = status_code::error;
        tracing_logger::warning("failed to record exception on '" + span.name + "': " + e.what());
    }
}

void span_interceptor::finish(const std::shared_ptr<trace_span>& span) const noexcept {
    try {
        auto finished = tracer_->finish_span(span);
        if (finished.is_err()) {
            tracing_logger::warning("failed to end span '" + span->name + "': " +
                                    finished.error().message);
        }
    } catch (const std::exception& e) {
        tracing_logger::warning(std::string("tracer failed while ending a span: ") + e.what());
    } catch (...) {
        tracing_logger::warning("tracer failed while ending a span: unknown exception");
    }
}

} } // namespace kcenon::tracing

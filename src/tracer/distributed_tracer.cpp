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
 * @file distributed_tracer.cpp
 * @brief Implementation of the default tracer
 */

#include <kcenon/tracing/tracer/distributed_tracer.h>
#include <kcenon/tracing/context/span_scope.h>
#include <kcenon/tracing/logging/tracing_logger.h>

#include <atomic>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace kcenon { namespace tracing {

namespace {

std::string random_hex_64() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t id = 0;
    while (id == 0) {
        id = dis(gen);
    }
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << id;
    return ss.str();
}

} // namespace

/**
 * @brief Private implementation of distributed tracer
 */
struct distributed_tracer::tracer_impl {
    std::string service_name;

    mutable std::mutex exporter_mutex;
    std::shared_ptr<span_exporter_interface> exporter;

    std::atomic<std::size_t> started_spans{0};
    std::atomic<std::size_t> finished_spans{0};
    std::atomic<std::size_t> exported_spans{0};
    std::atomic<std::size_t> failed_exports{0};

    explicit tracer_impl(std::string name) : service_name(std::move(name)) {}

    void export_span(const trace_span& span) {
        std::shared_ptr<span_exporter_interface> target;
        {
            std::lock_guard<std::mutex> lock(exporter_mutex);
            target = exporter;
        }
        if (!target) {
            return;
        }

        auto result = target->export_spans({span});
        if (result.is_ok()) {
            ++exported_spans;
        } else {
            ++failed_exports;
            tracing_logger::warning("failed to export span '" + span.name + "': " +
                                    result.error().message);
        }
    }
};

distributed_tracer::distributed_tracer(std::string service_name)
    : impl_(std::make_unique<tracer_impl>(std::move(service_name))) {
}

distributed_tracer::~distributed_tracer() = default;

result<std::shared_ptr<trace_span>> distributed_tracer::start_span(
    const span_start_options& options) {
    if (options.name.empty()) {
        return make_error<std::shared_ptr<trace_span>>(tracing_error_code::invalid_span,
                                                       "Span name must not be empty");
    }

    auto parent = options.parent;
    if (!parent && !options.new_root) {
        parent = active_span();
    }

    auto span = std::make_shared<trace_span>();
    if (parent && parent->context().is_valid()) {
        span->trace_id = parent->trace_id;
        span->parent_span_id = parent->span_id;
        span->trace_flags = parent->trace_flags;
    } else {
        span->trace_id = generate_trace_id();
    }
    span->span_id = generate_span_id();
    span->name = options.name;
    span->service_name = impl_->service_name;
    span->kind = options.kind;
    span->links = options.links;
    span->start_time = std::chrono::system_clock::now();

    ++impl_->started_spans;
    return span;
}

result<std::shared_ptr<trace_span>> distributed_tracer::start_span(const std::string& name,
                                                                   span_kind kind) {
    span_start_options options;
    options.name = name;
    options.kind = kind;
    return start_span(options);
}

result_void distributed_tracer::finish_span(const std::shared_ptr<trace_span>& span) {
    if (!span) {
        return make_void_error(tracing_error_code::invalid_span, "Cannot finish a null span");
    }

    if (span->is_finished()) {
        return make_void_error(tracing_error_code::span_already_finished,
                               "Span '" + span->name + "' already finished");
    }

    span->end_time = std::chrono::system_clock::now();
    span->calculate_duration();
    ++impl_->finished_spans;

    impl_->export_span(*span);
    return make_void_success();
}

void distributed_tracer::set_exporter(std::shared_ptr<span_exporter_interface> exporter) {
    std::lock_guard<std::mutex> lock(impl_->exporter_mutex);
    impl_->exporter = std::move(exporter);
}

std::shared_ptr<span_exporter_interface> distributed_tracer::get_exporter() const {
    std::lock_guard<std::mutex> lock(impl_->exporter_mutex);
    return impl_->exporter;
}

const std::string& distributed_tracer::service_name() const {
    return impl_->service_name;
}

std::unordered_map<std::string, std::size_t> distributed_tracer::get_stats() const {
    return {
        {"started_spans", impl_->started_spans.load()},
        {"finished_spans", impl_->finished_spans.load()},
        {"exported_spans", impl_->exported_spans.load()},
        {"failed_exports", impl_->failed_exports.load()}
    };
}

std::string distributed_tracer::generate_trace_id() {
    return random_hex_64() + random_hex_64();
}

std::string distributed_tracer::generate_span_id() {
    return random_hex_64();
}

} } // namespace kcenon::tracing

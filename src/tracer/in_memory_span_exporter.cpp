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

#include <kcenon/tracing/tracer/in_memory_span_exporter.h>

namespace kcenon { namespace tracing {

result_void in_memory_span_exporter::export_spans(const std::vector<trace_span>& spans) {
    if (shut_down_.load()) {
        rejected_spans_ += spans.size();
        return make_void_error(tracing_error_code::exporter_unavailable,
                               "In-memory exporter is shut down");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    spans_.insert(spans_.end(), spans.begin(), spans.end());
    return make_void_success();
}

result_void in_memory_span_exporter::flush() {
    return make_void_success();
}

result_void in_memory_span_exporter::shutdown() {
    shut_down_.store(true);
    return make_void_success();
}

std::unordered_map<std::string, std::size_t> in_memory_span_exporter::get_stats() const {
    return {
        {"exported_spans", size()},
        {"rejected_spans", rejected_spans_.load()}
    };
}

std::vector<trace_span> in_memory_span_exporter::finished_spans() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_;
}

std::optional<trace_span> in_memory_span_exporter::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& span : spans_) {
        if (span.name == name) {
            return span;
        }
    }
    return std::nullopt;
}

std::size_t in_memory_span_exporter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spans_.size();
}

void in_memory_span_exporter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    spans_.clear();
}

} } // namespace kcenon::tracing

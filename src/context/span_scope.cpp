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
 * @file span_scope.cpp
 * @brief Thread-local active span stack
 */

#include <kcenon/tracing/context/span_scope.h>

#include <vector>

namespace kcenon { namespace tracing {

namespace {

thread_local std::vector<std::shared_ptr<trace_span>> active_spans;

} // namespace

std::shared_ptr<trace_span> active_span() {
    if (active_spans.empty()) {
        return nullptr;
    }
    return active_spans.back();
}

std::size_t active_span_depth() {
    return active_spans.size();
}

span_scope::span_scope(std::shared_ptr<trace_span> span)
    : span_(std::move(span)) {
    if (span_) {
        active_spans.push_back(span_);
        pushed_ = true;
    }
}

span_scope::~span_scope() {
    if (!pushed_) {
        return;
    }
    // Scopes are strictly nested, so ours is on top
    if (!active_spans.empty() && active_spans.back() == span_) {
        active_spans.pop_back();
    }
}

} } // namespace kcenon::tracing

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
 * @file tracing_logger.cpp
 * @brief Implementation of the tracing logger injection point
 */

#include <kcenon/tracing/logging/tracing_logger.h>

#include <atomic>
#include <mutex>
#include <shared_mutex>

namespace kcenon { namespace tracing {

namespace {

struct logger_state {
    mutable std::shared_mutex mutex;
    std::shared_ptr<common::interfaces::ILogger> logger;
    std::atomic<std::size_t> dropped{0};
};

logger_state& state() {
    static logger_state instance;
    return instance;
}

} // namespace

void tracing_logger::set_logger(std::shared_ptr<common::interfaces::ILogger> logger) {
    auto& s = state();
    std::unique_lock lock(s.mutex);
    s.logger = std::move(logger);
}

std::shared_ptr<common::interfaces::ILogger> tracing_logger::get_logger() {
    auto& s = state();
    std::shared_lock lock(s.mutex);
    return s.logger;
}

bool tracing_logger::is_enabled(log_level level) {
    auto logger = get_logger();
    return logger && logger->is_enabled(level);
}

void tracing_logger::log(log_level level, const std::string& message) {
    auto logger = get_logger();
    if (!logger || !logger->is_enabled(level)) {
        return;
    }

    auto result = logger->log(level, "[tracing] " + message);
    if (result.is_err()) {
        state().dropped.fetch_add(1, std::memory_order_relaxed);
    }
}

std::size_t tracing_logger::dropped_messages() {
    return state().dropped.load(std::memory_order_relaxed);
}

} } // namespace kcenon::tracing

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
 * @file console_logger.cpp
 * @brief Console ILogger implementation
 */

#include <kcenon/tracing/logging/console_logger.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace kcenon { namespace tracing {

common::VoidResult console_logger::log(common::interfaces::log_level level,
                                       const std::string& message) {
    if (!is_enabled(level)) {
        return common::ok();
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    // Thread-safe time conversion
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        std::clog << "[" << std::put_time(&tm_buf, "%H:%M:%S")
                  << "] [" << common::interfaces::to_string(level) << "] "
                  << message << '\n';
    }

    log_count_++;
    return common::ok();
}

common::VoidResult console_logger::log(common::interfaces::log_level level,
                                       const std::string& message,
                                       const std::string& file,
                                       int line,
                                       const std::string& function) {
    return log(level, message + " [" + file + ":" + std::to_string(line) + " " + function + "]");
}

common::VoidResult console_logger::log(const common::interfaces::log_entry& entry) {
    return log(entry.level, entry.message, entry.file, entry.line, entry.function);
}

bool console_logger::is_enabled(common::interfaces::log_level level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

common::VoidResult console_logger::set_level(common::interfaces::log_level level) {
    min_level_ = level;
    return common::ok();
}

common::interfaces::log_level console_logger::get_level() const {
    return min_level_.load();
}

common::VoidResult console_logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    std::clog << std::flush;
    return common::ok();
}

} } // namespace kcenon::tracing

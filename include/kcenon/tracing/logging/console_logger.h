#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file console_logger.h
 * @brief Minimal ILogger writing timestamped lines to std::clog
 */

#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>

namespace kcenon { namespace tracing {

/**
 * @class console_logger
 * @brief ILogger implementation for examples and local debugging
 */
class console_logger : public common::interfaces::ILogger {
public:
    explicit console_logger(common::interfaces::log_level min_level =
                                common::interfaces::log_level::info)
        : min_level_(min_level) {}

    common::VoidResult log(common::interfaces::log_level level,
                           const std::string& message) override;

    common::VoidResult log(common::interfaces::log_level level,
                           const std::string& message,
                           const std::string& file,
                           int line,
                           const std::string& function) override;

    common::VoidResult log(const common::interfaces::log_entry& entry) override;

    bool is_enabled(common::interfaces::log_level level) const override;

    common::VoidResult set_level(common::interfaces::log_level level) override;

    common::interfaces::log_level get_level() const override;

    common::VoidResult flush() override;

    std::size_t get_log_count() const { return log_count_.load(); }

private:
    std::atomic<common::interfaces::log_level> min_level_;
    std::atomic<std::size_t> log_count_{0};
    std::mutex write_mutex_;
};

} } // namespace kcenon::tracing

#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file tracing_logger.h
 * @brief Logger injection point for the tracing system
 *
 * The tracing layer never owns a logging backend. Applications inject any
 * common_system ILogger implementation; until one is injected every log call
 * is a no-op. Instrumentation problems (no active span, malformed carried
 * context, tracer failures) are reported here and never reach business code.
 *
 * @code
 * tracing_logger::set_logger(std::make_shared<console_logger>(log_level::debug));
 * tracing_logger::warning("No active span to enrich");
 * @endcode
 */

#include <kcenon/common/interfaces/logger_interface.h>

#include <cstddef>
#include <memory>
#include <string>

namespace kcenon { namespace tracing {

using log_level = common::interfaces::log_level;

/**
 * @class tracing_logger
 * @brief Process-wide holder for the injected ILogger
 *
 * Thread-safe: the logger pointer is guarded by a shared mutex, so logging
 * from many threads only takes a shared lock.
 */
class tracing_logger {
public:
    /**
     * @brief Set or replace the logger instance
     * @param logger New logger, or nullptr to silence tracing logs
     */
    static void set_logger(std::shared_ptr<common::interfaces::ILogger> logger);

    /**
     * @brief Get the current logger instance (may be nullptr)
     */
    static std::shared_ptr<common::interfaces::ILogger> get_logger();

    static bool is_enabled(log_level level);

    static void log(log_level level, const std::string& message);

    static void debug(const std::string& message) { log(log_level::debug, message); }
    static void info(const std::string& message) { log(log_level::info, message); }
    static void warning(const std::string& message) { log(log_level::warning, message); }
    static void error(const std::string& message) { log(log_level::error, message); }

    /**
     * @brief Number of messages the injected logger failed to write
     */
    static std::size_t dropped_messages();
};

} } // namespace kcenon::tracing

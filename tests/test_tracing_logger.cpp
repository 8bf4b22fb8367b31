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
 * @file test_tracing_logger.cpp
 * @brief Unit tests for logger injection and the console logger
 */

#include <gtest/gtest.h>
#include <kcenon/tracing/logging/console_logger.h>
#include <kcenon/tracing/logging/tracing_logger.h>

#include "recording_logger.h"

#include <memory>

using namespace kcenon::tracing;

namespace {

class failing_logger : public recording_logger {
public:
    kcenon::common::VoidResult log(common_if::log_level level,
                                   const std::string& message) override {
        recording_logger::log(level, message);
        return kcenon::common::VoidResult::err(
            kcenon::common::error_info(1, "sink unavailable", "test"));
    }
};

class quiet_logger : public recording_logger {
public:
    bool is_enabled(common_if::log_level level) const override {
        return level >= common_if::log_level::warning;
    }
};

} // namespace

class TracingLoggerTest : public ::testing::Test {
protected:
    void TearDown() override { tracing_logger::set_logger(nullptr); }
};

TEST_F(TracingLoggerTest, LoggingWithoutLoggerIsNoOp) {
    tracing_logger::set_logger(nullptr);
    EXPECT_NO_THROW(tracing_logger::warning("nobody listens"));
    EXPECT_FALSE(tracing_logger::is_enabled(log_level::error));
}

TEST_F(TracingLoggerTest, ForwardsPrefixedMessages) {
    auto logger = std::make_shared<recording_logger>();
    tracing_logger::set_logger(logger);

    tracing_logger::info("carrier detected");
    tracing_logger::debug("link created");

    EXPECT_EQ(logger->size(), 2u);
    EXPECT_TRUE(logger->contains("[tracing] carrier detected"));
    EXPECT_EQ(logger->count(log_level::debug), 1u);
    EXPECT_EQ(tracing_logger::get_logger(), logger);
}

TEST_F(TracingLoggerTest, RespectsLoggerLevel) {
    auto logger = std::make_shared<quiet_logger>();
    tracing_logger::set_logger(logger);

    tracing_logger::debug("filtered");
    tracing_logger::warning("kept");

    EXPECT_EQ(logger->size(), 1u);
    EXPECT_TRUE(logger->contains("kept"));
}

TEST_F(TracingLoggerTest, FailedWritesAreCountedNotPropagated) {
    auto logger = std::make_shared<failing_logger>();
    tracing_logger::set_logger(logger);

    auto before = tracing_logger::dropped_messages();
    EXPECT_NO_THROW(tracing_logger::warning("lost"));
    EXPECT_EQ(tracing_logger::dropped_messages(), before + 1);
}

TEST_F(TracingLoggerTest, ConsoleLoggerHonoursMinimumLevel) {
    console_logger logger(log_level::warning);

    EXPECT_FALSE(logger.is_enabled(log_level::info));
    EXPECT_TRUE(logger.is_enabled(log_level::error));

    ASSERT_TRUE(logger.log(log_level::info, "below threshold").is_ok());
    ASSERT_TRUE(logger.log(log_level::error, "above threshold").is_ok());
    EXPECT_EQ(logger.get_log_count(), 1u);

    ASSERT_TRUE(logger.set_level(log_level::debug).is_ok());
    EXPECT_EQ(logger.get_level(), log_level::debug);
    EXPECT_TRUE(logger.is_enabled(log_level::info));
}

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, tracing_system contributors
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <kcenon/tracing/interception/span_interceptor.h>
#include <kcenon/tracing/logging/tracing_logger.h>
#include <kcenon/tracing/tracer/distributed_tracer.h>
#include <kcenon/tracing/tracer/in_memory_span_exporter.h>

#include "test_helpers.h"

namespace integration_tests {

/**
 * @class TracingSystemFixture
 * @brief Base fixture wiring a tracer, an in-memory exporter and a logger
 *
 * Each test gets a fresh tracer whose finished spans land in exporter_, a
 * span_interceptor sharing that tracer, and a recording logger injected
 * into tracing_logger for the duration of the test.
 */
class TracingSystemFixture : public ::testing::Test {
protected:
    void SetUp() override {
        exporter_ = std::make_shared<kcenon::tracing::in_memory_span_exporter>();
        tracer_ = std::make_shared<kcenon::tracing::distributed_tracer>(ServiceName());
        tracer_->set_exporter(exporter_);

        logger_ = std::make_shared<CapturingLogger>();
        kcenon::tracing::tracing_logger::set_logger(logger_);

        interceptor_ = std::make_unique<kcenon::tracing::span_interceptor>(tracer_, Config());
    }

    void TearDown() override {
        kcenon::tracing::tracing_logger::set_logger(nullptr);
        interceptor_.reset();
        tracer_.reset();
        exporter_.reset();
    }

    virtual std::string ServiceName() const { return "integration"; }

    virtual kcenon::tracing::tracing_config Config() const {
        kcenon::tracing::tracing_config config;
        config.service_name = ServiceName();
        return config;
    }

    /**
     * @brief Wait for a condition to become true with timeout
     */
    template<typename Predicate>
    bool WaitForCondition(Predicate pred,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto start = std::chrono::steady_clock::now();
        while (!pred()) {
            if (std::chrono::steady_clock::now() - start > timeout) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    /**
     * @brief Finished spans with the given name, in finish order
     */
    std::vector<kcenon::tracing::trace_span> SpansNamed(const std::string& name) const {
        std::vector<kcenon::tracing::trace_span> matching;
        for (const auto& span : exporter_->finished_spans()) {
            if (span.name == name) {
                matching.push_back(span);
            }
        }
        return matching;
    }

    std::shared_ptr<kcenon::tracing::in_memory_span_exporter> exporter_;
    std::shared_ptr<kcenon::tracing::distributed_tracer> tracer_;
    std::shared_ptr<CapturingLogger> logger_;
    std::unique_ptr<kcenon::tracing::span_interceptor> interceptor_;
};

} // namespace integration_tests

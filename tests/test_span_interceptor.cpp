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
 * @file test_span_interceptor.cpp
 * @brief Unit tests for method interception
 */

#include <gtest/gtest.h>
#include <kcenon/tracing/attributes/attribute_names.h>
#include <kcenon/tracing/attributes/telemetry_attributes.h>
#include <kcenon/tracing/enrichment/span_enricher.h>
#include <kcenon/tracing/interception/span_interceptor.h>
#include <kcenon/tracing/logging/tracing_logger.h>
#include <kcenon/tracing/tracer/distributed_tracer.h>
#include <kcenon/tracing/tracer/in_memory_span_exporter.h>

#include "recording_logger.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kcenon::tracing;

namespace {

class order_not_found : public std::runtime_error {
public:
    explicit order_not_found(const std::string& id)
        : std::runtime_error("Order not found: " + id) {}
};

struct order_event final : public trace_carrier {
    std::string order_id;
};

class unavailable_tracer : public tracer_interface {
public:
    result<std::shared_ptr<trace_span>> start_span(const span_start_options&) override {
        ++start_calls;
        return make_error<std::shared_ptr<trace_span>>(tracing_error_code::tracer_unavailable,
                                                       "collector offline");
    }

    result_void finish_span(const std::shared_ptr<trace_span>&) override {
        ++finish_calls;
        return make_void_success();
    }

    int start_calls{0};
    int finish_calls{0};
};

// Telemetry source whose attributes() always throws, optionally a non-std type
class unreadable_payload : public telemetry_attributes {
public:
    explicit unreadable_payload(bool throw_int) : throw_int_(throw_int) {}

    attribute_map attributes() const override {
        if (throw_int_) {
            throw 42;
        }
        throw std::runtime_error("payload store offline");
    }

private:
    bool throw_int_;
};

class throwing_tracer : public tracer_interface {
public:
    result<std::shared_ptr<trace_span>> start_span(const span_start_options&) override {
        throw 7;
    }

    result_void finish_span(const std::shared_ptr<trace_span>&) override {
        return make_void_success();
    }
};

std::string text_attribute(const trace_span& span, const std::string& key) {
    const auto* value = span.find_attribute(key);
    return value == nullptr ? "<absent>" : to_string(*value);
}

} // namespace

class SpanInterceptorTest : public ::testing::Test {
protected:
    void SetUp() override {
        exporter = std::make_shared<in_memory_span_exporter>();
        tracer = std::make_shared<distributed_tracer>("orders");
        tracer->set_exporter(exporter);
        logger = std::make_shared<recording_logger>();
        tracing_logger::set_logger(logger);
    }

    void TearDown() override { tracing_logger::set_logger(nullptr); }

    traced_method method(const std::string& function) const {
        traced_method m;
        m.declaring_type = "shop::order_service";
        m.function = function;
        return m;
    }

    std::shared_ptr<in_memory_span_exporter> exporter;
    std::shared_ptr<distributed_tracer> tracer;
    std::shared_ptr<recording_logger> logger;
};

TEST_F(SpanInterceptorTest, SuccessfulCallIsRecordedWithAttributes) {
    span_interceptor interceptor(tracer);

    auto m = method("create_order");
    m.name = "Create Order";
    m.attributes = {"operation:create"};
    m.parameters = {{0, "customer.id"}};

    auto create_order = interceptor.wrap(m, [](const std::string& customer_id) {
        return "order-for-" + customer_id;
    });

    EXPECT_EQ(create_order(std::string("C1")), "order-for-C1");

    ASSERT_EQ(exporter->size(), 1u);
    auto span = exporter->finished_spans().front();
    EXPECT_EQ(span.name, "Create Order");
    EXPECT_EQ(text_attribute(span, "operation"), "create");
    EXPECT_EQ(text_attribute(span, "customer.id"), "C1");
    EXPECT_EQ(text_attribute(span, attribute_names::code_function), "create_order");
    EXPECT_EQ(text_attribute(span, attribute_names::code_namespace), "shop::order_service");
    EXPECT_EQ(span.status, status_code::ok);
    EXPECT_TRUE(span.is_finished());
}

TEST_F(SpanInterceptorTest, FailureIsRecordedAndSameExceptionPropagates) {
    span_interceptor interceptor(tracer);

    auto m = method("get_order");
    m.parameters = {{0, "order.id"}};
    auto get_order = interceptor.wrap(m, [](const std::string& id) -> std::string {
        throw order_not_found(id);
    });

    try {
        get_order(std::string("missing"));
        FAIL() << "expected order_not_found";
    } catch (const order_not_found& e) {
        EXPECT_STREQ(e.what(), "Order not found: missing");
    }

    ASSERT_EQ(exporter->size(), 1u);
    auto span = exporter->finished_spans().front();
    EXPECT_EQ(span.name, "order_service.get_order");
    EXPECT_EQ(span.status, status_code::error);
    EXPECT_EQ(span.status_message, "Order not found: missing");
    ASSERT_EQ(span.events.size(), 1u);
    EXPECT_EQ(span.events[0].name, attribute_names::exception_event);
    EXPECT_EQ(span.events[0].attributes.at(attribute_names::exception_message),
              "Order not found: missing");
    EXPECT_NE(span.events[0].attributes.at(attribute_names::exception_type).find("order_not_found"),
              std::string::npos);
}

TEST_F(SpanInterceptorTest, ExceptionObjectIdentityIsPreserved) {
    span_interceptor interceptor(tracer);
    auto failure = std::make_shared<int>(7);

    auto op = interceptor.wrap(method("fail"), [failure]() { throw failure; });

    try {
        op();
        FAIL() << "expected a shared_ptr exception";
    } catch (const std::shared_ptr<int>& thrown) {
        EXPECT_EQ(thrown, failure);
    }

    auto span = exporter->finished_spans().front();
    EXPECT_EQ(span.status, status_code::error);
    EXPECT_EQ(span.status_message, "unknown exception");
}

TEST_F(SpanInterceptorTest, NestedCallsFormParentChildAndEndOnce) {
    span_interceptor interceptor(tracer);

    auto inner = interceptor.wrap(method("reserve_stock"), [](int quantity) { return quantity * 2; });
    auto outer = interceptor.wrap(method("place_order"), [&inner](int quantity) {
        return inner(quantity) + 1;
    });

    EXPECT_EQ(outer(3), 7);

    auto spans = exporter->finished_spans();
    ASSERT_EQ(spans.size(), 2u);
    // Inner finishes first
    EXPECT_EQ(spans[0].name, "order_service.reserve_stock");
    EXPECT_EQ(spans[1].name, "order_service.place_order");
    EXPECT_EQ(spans[0].trace_id, spans[1].trace_id);
    EXPECT_EQ(spans[0].parent_span_id, spans[1].span_id);
    EXPECT_EQ(tracer->get_stats()["finished_spans"], 2u);
    EXPECT_EQ(active_span(), nullptr);
}

TEST_F(SpanInterceptorTest, BodyCanEnrichTheActiveSpan) {
    span_interceptor interceptor(tracer);

    auto op = interceptor.wrap(method("charge"), []() {
        span_enricher::add_attributes(attribute_map{{"payment.provider", "acme"}});
        span_enricher::add_event("payment.charged");
    });
    op();

    auto span = exporter->finished_spans().front();
    EXPECT_EQ(text_attribute(span, "payment.provider"), "acme");
    ASSERT_EQ(span.events.size(), 1u);
    EXPECT_EQ(span.events[0].name, "payment.charged");
}

TEST_F(SpanInterceptorTest, ReferenceResultsAreForwarded) {
    span_interceptor interceptor(tracer);
    std::vector<int> inventory{1, 2, 3};

    auto first_item = interceptor.wrap(method("first"), [](std::vector<int>& items) -> int& {
        return items.front();
    });

    first_item(inventory) = 42;
    EXPECT_EQ(inventory.front(), 42);
    EXPECT_EQ(exporter->size(), 1u);
}

TEST_F(SpanInterceptorTest, MoveOnlyArgumentsAreForwarded) {
    span_interceptor interceptor(tracer);

    auto m = method("consume");
    m.parameters = {{0, "payload"}};
    auto consume = interceptor.wrap(m, [](std::unique_ptr<std::string> payload) {
        return payload->size();
    });

    EXPECT_EQ(consume(std::make_unique<std::string>("abcd")), 4u);
    auto span = exporter->finished_spans().front();
    EXPECT_EQ(text_attribute(span, "payload"), "abcd");
}

TEST_F(SpanInterceptorTest, InvokeWithResolvedDescriptor) {
    span_interceptor interceptor(tracer);
    auto descriptor = operation_descriptor::resolve(method("ping"));

    int calls = 0;
    interceptor.invoke(descriptor, [&calls]() { ++calls; });
    interceptor.invoke(descriptor, [&calls]() { ++calls; });

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(exporter->size(), 2u);
}

TEST_F(SpanInterceptorTest, NullParametersAreSkipped) {
    span_interceptor interceptor(tracer);

    auto m = method("lookup");
    m.parameters = {{0, "coupon"}, {1, "note"}};
    auto lookup = interceptor.wrap(m, [](std::optional<std::string>, const char*) { return true; });

    EXPECT_TRUE(lookup(std::nullopt, nullptr));
    auto span = exporter->finished_spans().front();
    EXPECT_EQ(span.find_attribute("coupon"), nullptr);
    EXPECT_EQ(span.find_attribute("note"), nullptr);
}

TEST_F(SpanInterceptorTest, CarrierArgumentProducesLink) {
    span_interceptor interceptor(tracer);

    order_event event;
    event.set_carried_trace_id("4bf92f3577b34da6a3ce929d0e0e4736");
    event.set_carried_span_id("00f067aa0ba902b7");
    event.set_carried_trace_flags("01");

    auto m = method("on_order_created");
    m.kind = span_kind::consumer;
    auto handle = interceptor.wrap(m, [](const order_event&) {});
    handle(event);

    auto span = exporter->finished_spans().front();
    EXPECT_EQ(span.kind, span_kind::consumer);
    ASSERT_EQ(span.links.size(), 1u);
    EXPECT_EQ(span.links[0].context.trace_id(), "4bf92f3577b34da6a3ce929d0e0e4736");
    EXPECT_EQ(span.links[0].context.span_id(), "00f067aa0ba902b7");
    EXPECT_NE(span.trace_id, "4bf92f3577b34da6a3ce929d0e0e4736");
    EXPECT_TRUE(logger->contains("linking to producer span"));
}

TEST_F(SpanInterceptorTest, CarrierWithoutSpanIdProducesNoLink) {
    span_interceptor interceptor(tracer);

    auto event = std::make_shared<order_event>();
    event->set_carried_trace_id("4bf92f3577b34da6a3ce929d0e0e4736");

    auto handle = interceptor.wrap(method("on_order_created"),
                                   [](std::shared_ptr<order_event>) {});
    handle(event);

    auto span = exporter->finished_spans().front();
    EXPECT_TRUE(span.links.empty());
}

TEST_F(SpanInterceptorTest, LinkingCanBeDisabled) {
    tracing_config config;
    config.link_carried_context = false;
    span_interceptor interceptor(tracer, config);

    order_event event;
    event.set_carried_trace_id("4bf92f3577b34da6a3ce929d0e0e4736");
    event.set_carried_span_id("00f067aa0ba902b7");

    interceptor.wrap(method("on_order_created"), [](const order_event*) {})(&event);
    EXPECT_TRUE(exporter->finished_spans().front().links.empty());
}

TEST_F(SpanInterceptorTest, CodeMetadataAndExceptionEventsCanBeDisabled) {
    tracing_config config;
    config.record_code_metadata = false;
    config.record_exceptions = false;
    span_interceptor interceptor(tracer, config);

    auto op = interceptor.wrap(method("fail"), []() { throw std::logic_error("bad state"); });
    EXPECT_THROW(op(), std::logic_error);

    auto span = exporter->finished_spans().front();
    EXPECT_EQ(span.find_attribute(attribute_names::code_function), nullptr);
    EXPECT_TRUE(span.events.empty());
    EXPECT_EQ(span.status, status_code::error);
    EXPECT_EQ(span.status_message, "bad state");
}

TEST_F(SpanInterceptorTest, DisabledInterceptorRunsDirectly) {
    tracing_config config;
    config.enabled = false;
    span_interceptor interceptor(tracer, config);

    auto op = interceptor.wrap(method("quiet"), [](int x) { return x + 1; });
    EXPECT_EQ(op(1), 2);
    EXPECT_EQ(exporter->size(), 0u);
}

TEST_F(SpanInterceptorTest, TracerFailureRunsOperationUntraced) {
    auto broken = std::make_shared<unavailable_tracer>();
    span_interceptor interceptor(broken);

    bool ran = false;
    auto op = interceptor.wrap(method("still_runs"), [&ran]() {
        ran = true;
        return active_span() == nullptr;
    });

    EXPECT_TRUE(op());
    EXPECT_TRUE(ran);
    EXPECT_EQ(broken->start_calls, 1);
    EXPECT_EQ(broken->finish_calls, 0);
    EXPECT_TRUE(logger->contains("running untraced"));
}

TEST_F(SpanInterceptorTest, AttributeOrderLetsLaterSourcesWin) {
    span_interceptor interceptor(tracer);

    auto m = method("tag");
    m.attributes = {"tier:static", "code.function:overridden"};
    m.parameters = {{0, "tier"}};
    auto op = interceptor.wrap(m, [](const std::string&) {});
    op(std::string("from-parameter"));

    auto span = exporter->finished_spans().front();
    EXPECT_EQ(text_attribute(span, "tier"), "from-parameter");
    EXPECT_EQ(text_attribute(span, attribute_names::code_function), "tag");
}

TEST_F(SpanInterceptorTest, FailingParameterSourceStillRunsBodyAndEndsSpan) {
    span_interceptor interceptor(tracer);

    auto m = method("consume");
    m.attributes = {"stage:ingest"};
    m.parameters = {{0, "msg"}};
    bool body_ran = false;
    auto op = interceptor.wrap(m, [&body_ran](const unreadable_payload&) { body_ran = true; });

    EXPECT_NO_THROW(op(unreadable_payload(false)));
    EXPECT_TRUE(body_ran);
    EXPECT_TRUE(logger->contains("failed to add parameter attributes"));
    EXPECT_TRUE(logger->contains("payload store offline"));

    ASSERT_EQ(exporter->size(), 1u);
    auto span = exporter->finished_spans().front();
    EXPECT_EQ(span.status, status_code::ok);
    EXPECT_EQ(text_attribute(span, "stage"), "ingest");
    // Stages after the failing one still run
    EXPECT_EQ(text_attribute(span, attribute_names::code_function), "consume");
}

TEST_F(SpanInterceptorTest, NonStandardThrowFromParameterSourceIsContained) {
    span_interceptor interceptor(tracer);

    auto m = method("consume");
    m.parameters = {{0, "msg"}};
    bool body_ran = false;
    auto op = interceptor.wrap(m, [&body_ran](const unreadable_payload&) {
        body_ran = true;
        return active_span() != nullptr;
    });

    bool traced = false;
    EXPECT_NO_THROW(traced = op(unreadable_payload(true)));
    EXPECT_TRUE(body_ran);
    EXPECT_TRUE(traced);
    EXPECT_TRUE(logger->contains("unknown exception"));

    auto stats = tracer->get_stats();
    EXPECT_EQ(stats["started_spans"], 1u);
    EXPECT_EQ(stats["finished_spans"], 1u);
    ASSERT_EQ(exporter->size(), 1u);
    EXPECT_EQ(exporter->finished_spans().front().status, status_code::ok);
}

TEST_F(SpanInterceptorTest, TracerThrowingOnStartRunsOperationUntraced) {
    span_interceptor interceptor(std::make_shared<throwing_tracer>());

    auto op = interceptor.wrap(method("still_runs"), [](int x) { return x * 2; });

    EXPECT_EQ(op(21), 42);
    EXPECT_TRUE(logger->contains("tracer failed while starting"));
}

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
 * @file order_tracing_example.cpp
 * @brief Demonstrates interception, enrichment and cross-boundary links
 *
 * This example shows how to:
 * - Load tracing settings from a key/value map
 * - Trace service methods with span_interceptor
 * - Record request headers and business attributes on the active span
 * - Carry span coordinates inside a message to a consumer thread
 * - Inspect the linked spans collected by an in-memory exporter
 */

#include <condition_variable>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "kcenon/tracing/enrichment/header_enricher.h"
#include "kcenon/tracing/enrichment/span_enricher.h"
#include "kcenon/tracing/interception/span_interceptor.h"
#include "kcenon/tracing/logging/console_logger.h"
#include "kcenon/tracing/logging/tracing_logger.h"
#include "kcenon/tracing/tracer/distributed_tracer.h"
#include "kcenon/tracing/tracer/in_memory_span_exporter.h"

using namespace kcenon::tracing;
using namespace std::chrono_literals;

/**
 * @brief Order event published to the fulfillment queue
 */
struct order_event : public trace_carrier, public telemetry_attributes {
    std::string order_id;
    std::string customer_id;
    double total{0.0};

    attribute_map attributes() const override {
        return {{"order.id", order_id},
                {"order.customer", customer_id},
                {"order.total", std::to_string(total)}};
    }
};

/**
 * @brief Single-consumer in-process queue
 */
class order_queue {
public:
    void push(order_event event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    order_event pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !events_.empty(); });
        order_event event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<order_event> events_;
};

/**
 * @brief Checkout endpoint: traced server span publishing an order
 */
class CheckoutService {
public:
    CheckoutService(const span_interceptor& interceptor, order_queue& queue)
        : interceptor_(interceptor)
        , descriptor_(operation_descriptor::resolve(place_order_method()))
        , headers_(interceptor.config())
        , queue_(queue) {}

    std::string place_order(const header_enricher::header_map& headers,
                            const std::string& customer_id, double total) {
        return interceptor_.invoke(descriptor_,
            [this](const header_enricher::header_map& request_headers,
                   const std::string& customer, double amount) {
                headers_.enrich("/orders", request_headers);

                order_event event;
                event.order_id = "ord-" + customer + "-1";
                event.customer_id = customer;
                event.total = amount;
                span_enricher::add_attributes(event);

                span_link_builder::inject_active(event);
                std::cout << "[checkout] published " << event.order_id
                          << " from span " << span_enricher::current_span_id().value_or("-")
                          << std::endl;
                queue_.push(event);
                return event.order_id;
            },
            headers, customer_id, total);
    }

private:
    static traced_method place_order_method() {
        traced_method method;
        method.declaring_type = "shop::checkout_service";
        method.function = "place_order";
        method.kind = span_kind::server;
        method.attributes = {"component: checkout"};
        method.parameters = {{1, "customer.id"}, {2, "order.requested_total"}};
        return method;
    }

    span_interceptor interceptor_;
    operation_descriptor descriptor_;
    header_enricher headers_;
    order_queue& queue_;
};

/**
 * @brief Fulfillment listener: traced consumer span linked to the producer
 */
class FulfillmentListener {
public:
    explicit FulfillmentListener(const span_interceptor& interceptor)
        : on_order_(interceptor.wrap(listener_method(),
              std::function<void(const order_event&)>([](const order_event& event) {
                  std::this_thread::sleep_for(2ms);
                  span_enricher::add_event("order.packed");
                  std::cout << "[fulfillment] packed " << event.order_id << std::endl;
              }))) {}

    void on_order(const order_event& event) { on_order_(event); }

private:
    static traced_method listener_method() {
        traced_method method;
        method.declaring_type = "shop::fulfillment_listener";
        method.function = "on_order";
        method.kind = span_kind::consumer;
        method.attributes = {"messaging.system: in-process", "messaging.operation: process"};
        method.parameters = {{0, "order"}};
        return method;
    }

    traced_operation<std::function<void(const order_event&)>> on_order_;
};

void display_span(const trace_span& span) {
    std::cout << "  " << span.name << " [" << to_string(span.kind) << ", "
              << to_string(span.status) << ", " << span.duration.count() << "us]\n";
    std::cout << "    trace " << span.trace_id << " span " << span.span_id << "\n";
    for (const auto& link : span.links) {
        std::cout << "    linked to " << link.context.to_traceparent() << "\n";
    }
    for (const auto& [key, value] : span.attributes) {
        std::cout << "    " << key << " = " << to_string(value) << "\n";
    }
    for (const auto& event : span.events) {
        std::cout << "    event: " << event.name << "\n";
    }
}

int main() {
    std::cout << "=== Order Tracing Example ===" << std::endl;

    tracing_logger::set_logger(
        std::make_shared<console_logger>(kcenon::common::interfaces::log_level::info));

    auto config = tracing_config::from_map({
        {"service_name", "shop"},
        {"enrichment_headers", "X-Tenant-Id,X-Request-Id"},
    });
    if (config.is_err()) {
        std::cerr << "Invalid tracing configuration: " << config.error().message << std::endl;
        return 1;
    }

    auto exporter = std::make_shared<in_memory_span_exporter>();
    auto tracer = std::make_shared<distributed_tracer>(config.value().service_name);
    tracer->set_exporter(exporter);

    span_interceptor interceptor(tracer, config.value());
    order_queue queue;

    CheckoutService checkout(interceptor, queue);
    FulfillmentListener fulfillment(interceptor);

    std::thread consumer([&] { fulfillment.on_order(queue.pop()); });

    auto order_id = checkout.place_order(
        {{"X-Tenant-Id", "acme"}, {"X-Request-Id", "req-7781"}}, "cust-42", 129.90);
    std::cout << "[checkout] order " << order_id << " accepted" << std::endl;

    consumer.join();

    std::cout << "\nCollected spans:" << std::endl;
    for (const auto& span : exporter->finished_spans()) {
        display_span(span);
    }

    auto stats = tracer->get_stats();
    std::cout << "\nStarted: " << stats["started_spans"]
              << ", exported: " << stats["exported_spans"] << std::endl;

    tracing_logger::set_logger(nullptr);
    return 0;
}

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
 * @file test_distributed_tracer.cpp
 * @brief Unit tests for the default tracer and the in-memory exporter
 */

#include <gtest/gtest.h>
#include <kcenon/tracing/context/span_scope.h>
#include <kcenon/tracing/tracer/distributed_tracer.h>
#include <kcenon/tracing/tracer/in_memory_span_exporter.h>

#include <memory>
#include <set>

using namespace kcenon::tracing;

class DistributedTracerTest : public ::testing::Test {
protected:
    void SetUp() override {
        exporter = std::make_shared<in_memory_span_exporter>();
        tracer.set_exporter(exporter);
    }

    distributed_tracer tracer{"checkout"};
    std::shared_ptr<in_memory_span_exporter> exporter;
};

TEST_F(DistributedTracerTest, CreateRootSpan) {
    auto span_result = tracer.start_span("test_operation", span_kind::server);
    ASSERT_TRUE(span_result.is_ok());

    auto span = span_result.value();
    EXPECT_TRUE(span_context_codec::is_valid_trace_id(span->trace_id));
    EXPECT_TRUE(span_context_codec::is_valid_span_id(span->span_id));
    EXPECT_TRUE(span->parent_span_id.empty());
    EXPECT_EQ(span->name, "test_operation");
    EXPECT_EQ(span->service_name, "checkout");
    EXPECT_EQ(span->kind, span_kind::server);
    EXPECT_EQ(span->status, status_code::unset);
    EXPECT_TRUE(span->context().is_sampled());
    EXPECT_FALSE(span->is_finished());
}

TEST_F(DistributedTracerTest, ActiveSpanBecomesParent) {
    auto parent = tracer.start_span("parent_operation").value();
    span_scope scope(parent);

    auto child = tracer.start_span("child_operation").value();
    EXPECT_EQ(child->trace_id, parent->trace_id);
    EXPECT_NE(child->span_id, parent->span_id);
    EXPECT_EQ(child->parent_span_id, parent->span_id);
}

TEST_F(DistributedTracerTest, ExplicitParentAndNewRoot) {
    auto parent = tracer.start_span("parent").value();
    auto active = tracer.start_span("active").value();
    span_scope scope(active);

    span_start_options explicit_parent;
    explicit_parent.name = "explicit";
    explicit_parent.parent = parent;
    auto child = tracer.start_span(explicit_parent).value();
    EXPECT_EQ(child->parent_span_id, parent->span_id);

    span_start_options root;
    root.name = "root";
    root.new_root = true;
    auto detached = tracer.start_span(root).value();
    EXPECT_TRUE(detached->parent_span_id.empty());
    EXPECT_NE(detached->trace_id, active->trace_id);
}

TEST_F(DistributedTracerTest, EmptyNameIsRejected) {
    auto result = tracer.start_span("");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(error_code_of(result), tracing_error_code::invalid_span);
}

TEST_F(DistributedTracerTest, FinishExportsSpanOnce) {
    auto span = tracer.start_span("work").value();

    ASSERT_TRUE(tracer.finish_span(span).is_ok());
    EXPECT_TRUE(span->is_finished());
    EXPECT_GE(span->end_time, span->start_time);

    auto second = tracer.finish_span(span);
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(error_code_of(second), tracing_error_code::span_already_finished);

    EXPECT_EQ(exporter->size(), 1u);
    ASSERT_TRUE(exporter->find("work").has_value());

    auto stats = tracer.get_stats();
    EXPECT_EQ(stats["started_spans"], 1u);
    EXPECT_EQ(stats["finished_spans"], 1u);
    EXPECT_EQ(stats["exported_spans"], 1u);
}

TEST_F(DistributedTracerTest, FinishNullSpanFails) {
    auto result = tracer.finish_span(nullptr);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(error_code_of(result), tracing_error_code::invalid_span);
}

TEST_F(DistributedTracerTest, ExportFailureIsCounted) {
    ASSERT_TRUE(exporter->shutdown().is_ok());

    auto span = tracer.start_span("after_shutdown").value();
    EXPECT_TRUE(tracer.finish_span(span).is_ok());

    EXPECT_EQ(exporter->size(), 0u);
    EXPECT_EQ(tracer.get_stats()["failed_exports"], 1u);
    EXPECT_EQ(exporter->get_stats()["rejected_spans"], 1u);
}

TEST_F(DistributedTracerTest, LinksAreAttachedAtStart) {
    span_context remote("4bf92f3577b34da6a3ce929d0e0e4736", "00f067aa0ba902b7", 1, true);

    span_start_options options;
    options.name = "consume";
    options.kind = span_kind::consumer;
    options.links.push_back(span_link{remote, {}});

    auto span = tracer.start_span(options).value();
    ASSERT_EQ(span->links.size(), 1u);
    EXPECT_EQ(span->links[0].context, remote);
    EXPECT_NE(span->trace_id, remote.trace_id());
}

TEST_F(DistributedTracerTest, GeneratedIdsAreUniqueAndWellFormed) {
    std::set<std::string> trace_ids;
    for (int i = 0; i < 1000; ++i) {
        auto id = distributed_tracer::generate_trace_id();
        EXPECT_TRUE(span_context_codec::is_valid_trace_id(id)) << id;
        trace_ids.insert(id);
    }
    EXPECT_EQ(trace_ids.size(), 1000u);
    EXPECT_TRUE(span_context_codec::is_valid_span_id(distributed_tracer::generate_span_id()));
}

TEST_F(DistributedTracerTest, ExporterResetClearsSpans) {
    auto span = tracer.start_span("work").value();
    ASSERT_TRUE(tracer.finish_span(span).is_ok());
    ASSERT_EQ(exporter->finished_spans().size(), 1u);

    exporter->reset();
    EXPECT_TRUE(exporter->finished_spans().empty());
    EXPECT_FALSE(exporter->find("work").has_value());
}

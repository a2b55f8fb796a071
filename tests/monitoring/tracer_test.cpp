#include <gtest/gtest.h>

#include "ingest/monitoring/metric_names.hpp"
#include "ingest/monitoring/tracer.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ingest::monitoring;

TEST(TracerTest, ChildSpansShareTraceId) {
    Tracer tracer;

    auto root = tracer.start_span(span::kImportSession, {{"session_id", "s1"}});
    auto child = root.child(span::kImportCopy);

    EXPECT_EQ(child.trace_id(), root.trace_id());
    EXPECT_NE(child.span_id(), root.span_id());
    EXPECT_EQ(root.span_id().size(), 16u);
    EXPECT_EQ(tracer.active_spans().size(), 2u);

    auto ended_child = child.end();
    auto ended_root = root.end();
    ASSERT_TRUE(ended_child.has_value());
    ASSERT_TRUE(ended_root.has_value());

    ASSERT_TRUE(ended_child->parent_span_id.has_value());
    EXPECT_EQ(*ended_child->parent_span_id, root.span_id());
    EXPECT_FALSE(ended_root->parent_span_id.has_value());
    EXPECT_EQ(ended_root->tags["session_id"], "s1");

    EXPECT_TRUE(tracer.active_spans().empty());
    EXPECT_EQ(tracer.trace_spans(root.trace_id()).size(), 2u);
}

TEST(TracerTest, EndingTwiceIsIgnored) {
    Tracer tracer;
    auto span = tracer.start_span("op");

    ASSERT_TRUE(span.end(SpanStatus::Success).has_value());
    EXPECT_FALSE(span.end(SpanStatus::Error).has_value());

    auto stored = tracer.find_span(span.span_id());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, SpanStatus::Success);
    ASSERT_TRUE(stored->duration.has_value());
}

TEST(TracerTest, LogsAndTagsAttachToOpenSpan) {
    Tracer tracer;
    auto span = tracer.start_span("op");
    span.log("copied", {{"files", 12}});
    span.set_tag("storage", "network");
    span.set_tags({{"retries", 2}});

    auto ended = span.end(SpanStatus::Success, {{"imported", 12}});
    ASSERT_TRUE(ended.has_value());
    ASSERT_EQ(ended->logs.size(), 1u);
    EXPECT_EQ(ended->logs[0].message, "copied");
    EXPECT_EQ(ended->logs[0].fields["files"], 12);
    EXPECT_EQ(ended->tags["storage"], "network");
    EXPECT_EQ(ended->tags["retries"], 2);
    EXPECT_EQ(ended->tags["imported"], 12);

    // after end the span is closed
    span.log("late");
    EXPECT_EQ(tracer.find_span(span.span_id())->logs.size(), 1u);
}

TEST(TracerTest, TraceEndsWithStatusFromOperation) {
    Tracer tracer;

    int value = tracer.trace("ok.op", [](SpanHandle&) { return 7; });
    EXPECT_EQ(value, 7);

    std::string failed_span;
    EXPECT_THROW(tracer.trace("bad.op", [&failed_span](SpanHandle& span) {
        failed_span = span.span_id();
        throw std::runtime_error("disk gone");
    }), std::runtime_error);

    auto stored = tracer.find_span(failed_span);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, SpanStatus::Error);
    EXPECT_EQ(stored->tags["error"], "disk gone");
    ASSERT_FALSE(stored->logs.empty());
    EXPECT_EQ(stored->logs[0].message, "Error occurred");
}

TEST(TracerTest, CompletedRingIsBounded) {
    TracerOptions options;
    options.max_completed_spans = 3;
    Tracer tracer(options);

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        auto span = tracer.start_span("op");
        ids.push_back(span.span_id());
        span.end();
    }

    EXPECT_FALSE(tracer.find_span(ids[0]).has_value());
    EXPECT_FALSE(tracer.find_span(ids[1]).has_value());
    EXPECT_TRUE(tracer.find_span(ids[4]).has_value());
}

TEST(TracerTest, PersistCallbackReceivesEndedSpans) {
    Tracer tracer;
    std::mutex mutex;
    std::vector<std::string> persisted;

    tracer.set_persist_callback([&](const Span& span) {
        if (span.operation == "broken") {
            throw std::runtime_error("sink down");
        }
        if (span.operation == "odd") {
            throw 7;
        }
        std::lock_guard lock(mutex);
        persisted.push_back(span.operation);
    });

    tracer.start_span("first").end();
    tracer.start_span("broken").end();
    tracer.start_span("odd").end();
    tracer.start_span("second").end();
    tracer.flush_persistence();

    std::lock_guard lock(mutex);
    ASSERT_EQ(persisted.size(), 2u);
    EXPECT_EQ(persisted[0], "first");
    EXPECT_EQ(persisted[1], "second");
}

TEST(TracerTest, SpanSerializesToJson) {
    Tracer tracer;
    auto span = tracer.start_span(span::kImportHash, {{"files", 3}});
    auto ended = span.end();
    ASSERT_TRUE(ended.has_value());

    nlohmann::json j = *ended;
    EXPECT_EQ(j["operation"], span::kImportHash);
    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["trace_id"], span.trace_id());
}

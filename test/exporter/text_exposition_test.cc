#include <gtest/gtest.h>
#include "../../src/exporter/text_exposition.h"
#include "exporter_test_util.h"

#include <string>

using namespace Chopsticks;

class TextExpositionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.bucket_bounds_us = {1000, 10000, 100000};
        text_ = RenderTextExposition(MakeSampleSummary(config_, true));
    }

    bool Contains(const std::string& needle) const {
        return text_.find(needle) != std::string::npos;
    }

    MetricsConfig config_;
    std::string text_;
};

TEST_F(TextExpositionTest, CountersByOperationAndOutcome) {
    EXPECT_TRUE(Contains("# TYPE chopsticks_operations_total counter\n"));
    EXPECT_TRUE(Contains("chopsticks_operations_total{operation=\"upload\",outcome=\"success\"} 3\n"));
    EXPECT_TRUE(Contains("chopsticks_operations_total{operation=\"upload\",outcome=\"failure\"} 1\n"));
    EXPECT_TRUE(Contains("chopsticks_operations_total{operation=\"download\",outcome=\"success\"} 2\n"));
    EXPECT_TRUE(Contains("chopsticks_operation_failures_total{operation=\"upload\",kind=\"timeout\"} 1\n"));
    EXPECT_TRUE(Contains("chopsticks_bytes_total{operation=\"upload\"} 3000000\n"));
}

TEST_F(TextExpositionTest, HistogramBucketsAreCumulative) {
    EXPECT_TRUE(Contains("# TYPE chopsticks_operation_latency_seconds histogram\n"));
    EXPECT_TRUE(Contains(
        "chopsticks_operation_latency_seconds_bucket{operation=\"upload\",outcome=\"success\",le=\"0.001\"} 1\n"));
    EXPECT_TRUE(Contains(
        "chopsticks_operation_latency_seconds_bucket{operation=\"upload\",outcome=\"success\",le=\"0.01\"} 3\n"));
    EXPECT_TRUE(Contains(
        "chopsticks_operation_latency_seconds_bucket{operation=\"upload\",outcome=\"success\",le=\"+Inf\"} 3\n"));
    EXPECT_TRUE(Contains(
        "chopsticks_operation_latency_seconds_count{operation=\"upload\",outcome=\"failure\"} 1\n"));
    // Operation types that never ran get no histogram
    EXPECT_FALSE(Contains("chopsticks_operation_latency_seconds_count{operation=\"delete\""));
}

TEST_F(TextExpositionTest, TransportAndLivenessSeries) {
    EXPECT_TRUE(Contains("chopsticks_invalid_records_total 2\n"));
    EXPECT_TRUE(Contains("chopsticks_dropped_snapshots_total 1\n"));
    EXPECT_TRUE(Contains("chopsticks_duplicate_snapshots_total 1\n"));
    EXPECT_TRUE(Contains("chopsticks_rejected_snapshots_total 0\n"));
    EXPECT_TRUE(Contains("chopsticks_worker_status{worker=\"worker-a\",status=\"finished\"} 1\n"));
    EXPECT_TRUE(Contains("chopsticks_worker_status{worker=\"worker-b\",status=\"stale\"} 1\n"));
    EXPECT_TRUE(Contains("chopsticks_worker_last_sequence{worker=\"worker-a\"} 5\n"));
    EXPECT_TRUE(Contains("chopsticks_stale_contributions 1\n"));
}

TEST_F(TextExpositionTest, EmptySummaryStillRenders) {
    GlobalAggregator aggregator(config_);
    std::string text = RenderTextExposition(aggregator.Summarize());
    EXPECT_NE(text.find("chopsticks_operations_total{operation=\"upload\",outcome=\"success\"} 0\n"),
            std::string::npos);
    EXPECT_NE(text.find("chopsticks_stale_contributions 0\n"), std::string::npos);
}

#include <gtest/gtest.h>
#include "../../src/exporter/console_summary.h"
#include "exporter_test_util.h"

#include <sstream>
#include <string>

using namespace Chopsticks;

class ConsoleSummaryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.bucket_bounds_us = {1000, 10000, 100000};
        config_.expected_workers = 3;
    }

    MetricsConfig config_;
};

TEST_F(ConsoleSummaryTest, RowsForOperationsThatRanPlusTotal) {
    std::string table = RenderConsoleSummary(MakeSampleSummary(config_, true));
    EXPECT_NE(table.find("operation"), std::string::npos);
    EXPECT_NE(table.find("p99 ms"), std::string::npos);
    EXPECT_NE(table.find("upload"), std::string::npos);
    EXPECT_NE(table.find("download"), std::string::npos);
    EXPECT_NE(table.find("total"), std::string::npos);
    EXPECT_EQ(table.find("delete"), std::string::npos);
    // 3 of 4 uploads succeeded
    EXPECT_NE(table.find("75.00"), std::string::npos);
}

TEST_F(ConsoleSummaryTest, CompletenessWarnings) {
    std::ostringstream out;
    PrintConsoleSummary(MakeSampleSummary(config_, true), out);
    std::string table = out.str();
    EXPECT_NE(table.find("stale workers: worker-b"), std::string::npos);
    EXPECT_NE(table.find("only 2 of 3 expected workers"), std::string::npos);
    EXPECT_NE(table.find("2 invalid operation records"), std::string::npos);
    EXPECT_NE(table.find("1 snapshots were dropped"), std::string::npos);
}

TEST_F(ConsoleSummaryTest, ZeroOperationRunHasNoWarnings) {
    config_.expected_workers = 0;
    GlobalAggregator aggregator(config_);
    std::string table = RenderConsoleSummary(aggregator.Summarize());
    EXPECT_NE(table.find("total"), std::string::npos);
    EXPECT_EQ(table.find("WARNING"), std::string::npos);
}

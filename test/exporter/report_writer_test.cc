#include <gtest/gtest.h>
#include "../../src/exporter/report_writer.h"
#include "exporter_test_util.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include <google/protobuf/util/json_util.h>

using namespace Chopsticks;

class ReportWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.bucket_bounds_us = {1000, 10000, 100000};
        std::string base = ::testing::TempDir() + "chopsticks_report_" + std::to_string(getpid());
        config_.report_path = base + ".json";
        config_.csv_path = base + ".csv";

        metadata_.run_id = "run-test";
        metadata_.scenario = "mixed_workload";
        metadata_.endpoint = "http://localhost:9000";
        metadata_.driver = "synthetic";
        metadata_.clients = 4;
        metadata_.parameters["bucket"] = "b1";
    }

    void TearDown() override {
        std::remove(config_.report_path.c_str());
        std::remove(config_.csv_path.c_str());
    }

    static std::string ReadFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    MetricsConfig config_;
    RunMetadata metadata_;
};

TEST_F(ReportWriterTest, ReportCarriesMetadataTotalsAndCompleteness) {
    ReportWriter writer(config_, metadata_);
    auto report = writer.BuildReport(MakeSampleSummary(config_, true));

    EXPECT_EQ(report.metadata().run_id(), "run-test");
    EXPECT_EQ(report.metadata().scenario(), "mixed_workload");
    EXPECT_EQ(report.metadata().parameters().at("bucket"), "b1");
    EXPECT_EQ(report.configuration().bucket_bounds_us_size(), 3);
    EXPECT_EQ(report.operations_size(), static_cast<int>(kNumOperationTypes));
    EXPECT_EQ(report.operations(0).operation(), "upload");
    EXPECT_EQ(report.operations(0).count(), 4u);
    EXPECT_DOUBLE_EQ(report.operations(0).success_rate(), 75.0);
    EXPECT_EQ(report.operations(0).failures_by_kind().at("timeout"), 1u);
    EXPECT_EQ(report.total().count(), 6u);
    EXPECT_EQ(report.workers_size(), 2);
    EXPECT_EQ(report.workers(1).status(), "stale");
    EXPECT_EQ(report.transport().duplicate_snapshots(), 1u);
    EXPECT_TRUE(report.completeness().has_stale_contributions());
    EXPECT_TRUE(report.completeness().finalized());
    EXPECT_LE(report.total().latency().p50_ms(), report.total().latency().p95_ms());
    EXPECT_LE(report.total().latency().p95_ms(), report.total().latency().p99_ms());
}

TEST_F(ReportWriterTest, WritesJsonAndCsv) {
    ReportWriter writer(config_, metadata_);
    ASSERT_TRUE(writer.Write(MakeSampleSummary(config_, true)));

    std::string json = ReadFile(config_.report_path);
    chopsticks_report::RunReportProto parsed;
    ASSERT_TRUE(google::protobuf::util::JsonStringToMessage(json, &parsed).ok());
    EXPECT_EQ(parsed.metadata().run_id(), "run-test");
    EXPECT_EQ(parsed.total().count(), 6u);
    EXPECT_NE(json.find("\"has_stale_contributions\": true"), std::string::npos);

    std::string csv = ReadFile(config_.csv_path);
    EXPECT_EQ(csv.rfind("operation,count,success,failure", 0), 0u);
    EXPECT_NE(csv.find("\nupload,4,3,1,75.000,"), std::string::npos);
    EXPECT_NE(csv.find("\ntotal,6,5,1,"), std::string::npos);
}

TEST_F(ReportWriterTest, ZeroCountersAreWrittenOut) {
    ReportWriter writer(config_, metadata_);
    GlobalAggregator aggregator(config_);
    std::string json;
    ASSERT_TRUE(writer.RenderJson(aggregator.Finalize(Clock::now()), &json));
    EXPECT_NE(json.find("\"dropped_snapshots\": \"0\""), std::string::npos);
    EXPECT_NE(json.find("\"partial_coverage\": false"), std::string::npos);
}

TEST_F(ReportWriterTest, UnwritablePathFailsWithoutThrowing) {
    config_.report_path = "/nonexistent-dir/chopsticks/report.json";
    config_.csv_path.clear();
    ReportWriter writer(config_, metadata_);
    EXPECT_FALSE(writer.Write(MakeSampleSummary(config_, false)));
}

TEST_F(ReportWriterTest, AtomicWriteReplacesExistingFile) {
    ASSERT_TRUE(WriteFileAtomically(config_.report_path, "first"));
    ASSERT_TRUE(WriteFileAtomically(config_.report_path, "second"));
    EXPECT_EQ(ReadFile(config_.report_path), "second");
    std::ifstream tmp(config_.report_path + ".tmp");
    EXPECT_FALSE(tmp.good());
}

#include <gtest/gtest.h>
#include "../../src/metrics/snapshot_codec.h"

#include <string>

using namespace Chopsticks;

class SnapshotCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        layout_ = BucketLayout({100, 1000, 10000});
        snapshot_.worker_id = "worker-a";
        snapshot_.sequence = 12;
        snapshot_.created_at = FromMicros(1700000000123456);
        snapshot_.worker_started_at = FromMicros(1700000000000000);
        snapshot_.invalid_records = 2;
        snapshot_.dropped_snapshots = 1;
        snapshot_.bucket_bounds_us = layout_.bounds_us();
        snapshot_.is_final = true;
        for (auto& op : snapshot_.operations) {
            for (auto& h : op.latency) {
                h = Histogram(layout_);
            }
        }
        OperationTotals& upload = snapshot_.operations[Index(OperationType::kUpload)];
        upload.count = 3;
        upload.success = 2;
        upload.failure = 1;
        upload.bytes = 4096;
        upload.failures_by_kind[Index(FailureKind::kAuth)] = 1;
        upload.latency[Index(Outcome::kSuccess)].Observe(layout_, 50);
        upload.latency[Index(Outcome::kSuccess)].Observe(layout_, 5000);
        upload.latency[Index(Outcome::kFailure)].Observe(layout_, 20000);
    }

    BucketLayout layout_;
    WorkerSnapshot snapshot_;
};

TEST_F(SnapshotCodecTest, WireFormatPreservesSnapshot) {
    chopsticks_metrics::WorkerSnapshotProto proto;
    EncodeSnapshot(snapshot_, &proto);
    // Only operation types that ran are sent
    EXPECT_EQ(proto.operations_size(), 1);
    EXPECT_EQ(proto.operations(0).operation(), "upload");
    EXPECT_EQ(proto.operations(0).failures_by_kind().at("auth"), 1u);

    WorkerSnapshot decoded;
    std::string error;
    ASSERT_TRUE(DecodeSnapshot(proto, &decoded, &error)) << error;
    EXPECT_EQ(decoded.worker_id, snapshot_.worker_id);
    EXPECT_EQ(decoded.sequence, 12u);
    EXPECT_EQ(decoded.created_at, snapshot_.created_at);
    EXPECT_TRUE(decoded.is_final);
    EXPECT_EQ(decoded.bucket_bounds_us, snapshot_.bucket_bounds_us);
    EXPECT_EQ(decoded.operations, snapshot_.operations);
}

TEST_F(SnapshotCodecTest, UnknownOperationIsAnError) {
    chopsticks_metrics::WorkerSnapshotProto proto;
    EncodeSnapshot(snapshot_, &proto);
    proto.mutable_operations(0)->set_operation("copy");

    WorkerSnapshot decoded;
    std::string error;
    EXPECT_FALSE(DecodeSnapshot(proto, &decoded, &error));
    EXPECT_NE(error.find("copy"), std::string::npos);
}

TEST_F(SnapshotCodecTest, HistogramSizeMismatchIsAnError) {
    chopsticks_metrics::WorkerSnapshotProto proto;
    EncodeSnapshot(snapshot_, &proto);
    proto.mutable_operations(0)->mutable_success_latency()->add_counts(0);

    WorkerSnapshot decoded;
    std::string error;
    EXPECT_FALSE(DecodeSnapshot(proto, &decoded, &error));
}

TEST_F(SnapshotCodecTest, ContradictoryCountersAreAnError) {
    chopsticks_metrics::WorkerSnapshotProto proto;
    EncodeSnapshot(snapshot_, &proto);
    auto* upload = proto.mutable_operations(0);
    upload->set_count(100);
    upload->set_success(200);
    upload->set_failure(7);
    upload->clear_success_latency();
    upload->clear_failure_latency();

    WorkerSnapshot decoded;
    std::string error;
    EXPECT_FALSE(DecodeSnapshot(proto, &decoded, &error));
    EXPECT_NE(error.find("upload"), std::string::npos);
    EXPECT_NE(error.find("count"), std::string::npos);
}

TEST_F(SnapshotCodecTest, FailureKindsMustAddUpToFailures) {
    chopsticks_metrics::WorkerSnapshotProto proto;
    EncodeSnapshot(snapshot_, &proto);
    (*proto.mutable_operations(0)->mutable_failures_by_kind())["timeout"] = 4;

    WorkerSnapshot decoded;
    std::string error;
    EXPECT_FALSE(DecodeSnapshot(proto, &decoded, &error));
    EXPECT_NE(error.find("failure kinds"), std::string::npos);
}

TEST_F(SnapshotCodecTest, HistogramsMustMatchCounters) {
    chopsticks_metrics::WorkerSnapshotProto proto;
    EncodeSnapshot(snapshot_, &proto);
    // Two successes claimed, one sample carried
    auto* counts = proto.mutable_operations(0)->mutable_success_latency()->mutable_counts();
    counts->Set(0, 0);

    WorkerSnapshot decoded;
    std::string error;
    EXPECT_FALSE(DecodeSnapshot(proto, &decoded, &error));
    EXPECT_NE(error.find("histograms"), std::string::npos);

    // Operations without samples may omit their histograms
    chopsticks_metrics::WorkerSnapshotProto empty;
    EncodeSnapshot(snapshot_, &empty);
    auto* idle = empty.add_operations();
    idle->set_operation("head");
    EXPECT_TRUE(DecodeSnapshot(empty, &decoded, &error)) << error;
}

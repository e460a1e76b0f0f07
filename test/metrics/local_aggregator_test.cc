#include <gtest/gtest.h>
#include "../../src/metrics/local_aggregator.h"

#include <chrono>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"

using namespace Chopsticks;
using namespace std::chrono_literals;

namespace {

class CapturingTransport : public SnapshotTransport {
public:
    void Send(const WorkerSnapshot& snapshot) override {
        absl::MutexLock lock(&mu_);
        sent_.push_back(snapshot);
    }
    bool Drain(std::chrono::milliseconds) override { return true; }
    void Stop() override {}
    uint64_t DroppedSnapshots() const override { return dropped_; }

    std::vector<WorkerSnapshot> sent() {
        absl::MutexLock lock(&mu_);
        return sent_;
    }

    uint64_t dropped_ = 0;

private:
    absl::Mutex mu_;
    std::vector<WorkerSnapshot> sent_;
};

} // namespace

class LocalAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.bucket_bounds_us = {100, 1000, 10000};
        config_.flush_interval = 20ms;
        config_.recorder_shards = 2;
        recorder_ = std::make_unique<MetricsRecorder>(config_, "worker-a");
    }

    MetricsConfig config_;
    std::unique_ptr<MetricsRecorder> recorder_;
    CapturingTransport transport_;
};

TEST_F(LocalAggregatorTest, SnapshotsAreNumberedFromOne) {
    LocalAggregator aggregator(config_, *recorder_, transport_);
    recorder_->Record(OperationType::kUpload, 10, 1ms, Outcome::kSuccess);
    aggregator.Flush(false);
    recorder_->Record(OperationType::kUpload, 10, 1ms, Outcome::kSuccess);
    aggregator.Flush(false);

    auto sent = transport_.sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].sequence, 1u);
    EXPECT_EQ(sent[1].sequence, 2u);
    EXPECT_EQ(sent[0].worker_id, "worker-a");
    // Cumulative, not deltas
    EXPECT_EQ(sent[0].operations[Index(OperationType::kUpload)].count, 1u);
    EXPECT_EQ(sent[1].operations[Index(OperationType::kUpload)].count, 2u);
    EXPECT_EQ(sent[1].bucket_bounds_us, config_.bucket_bounds_us);
    EXPECT_EQ(sent[1].worker_started_at, aggregator.started_at());
    EXPECT_FALSE(sent[1].is_final);
}

TEST_F(LocalAggregatorTest, TimerFlushesPeriodically) {
    LocalAggregator aggregator(config_, *recorder_, transport_);
    aggregator.Start();
    std::this_thread::sleep_for(200ms);
    aggregator.Stop();

    auto sent = transport_.sent();
    ASSERT_GE(sent.size(), 3u);
    for (size_t i = 1; i < sent.size(); ++i) {
        EXPECT_GT(sent[i].sequence, sent[i - 1].sequence);
    }
}

TEST_F(LocalAggregatorTest, StopSendsOneFinalSnapshot) {
    LocalAggregator aggregator(config_, *recorder_, transport_);
    aggregator.Start();
    recorder_->Record(OperationType::kDelete, 0, 1ms, Outcome::kSuccess);
    aggregator.Stop();
    aggregator.Stop();

    auto sent = transport_.sent();
    ASSERT_FALSE(sent.empty());
    EXPECT_TRUE(sent.back().is_final);
    EXPECT_EQ(sent.back().operations[Index(OperationType::kDelete)].count, 1u);
    int finals = 0;
    for (const auto& s : sent) {
        finals += s.is_final ? 1 : 0;
    }
    EXPECT_EQ(finals, 1);
}

TEST_F(LocalAggregatorTest, SnapshotCarriesTransportDrops) {
    transport_.dropped_ = 3;
    LocalAggregator aggregator(config_, *recorder_, transport_);
    recorder_->Record(OperationType::kHead, 0, std::chrono::hours(5), Outcome::kSuccess);
    WorkerSnapshot snapshot = aggregator.TakeSnapshot(false);
    EXPECT_EQ(snapshot.dropped_snapshots, 3u);
    EXPECT_EQ(snapshot.invalid_records, 1u);
}

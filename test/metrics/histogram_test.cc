#include <gtest/gtest.h>
#include "../../src/metrics/histogram.h"

#include <cmath>
#include <string>
#include <vector>

using namespace Chopsticks;

class HistogramTest : public ::testing::Test {
protected:
    void SetUp() override {
        layout_ = BucketLayout({100, 1000, 10000, 100000});
    }

    BucketLayout layout_;
};

TEST_F(HistogramTest, DefaultLogScaleBounds) {
    auto bounds = MakeLogScaleBounds(1, 60000000, 4);
    std::string error;
    ASSERT_TRUE(ValidateBounds(bounds, &error)) << error;
    EXPECT_EQ(bounds.front(), 1u);
    EXPECT_EQ(bounds.back(), 60000000u);
    // Rounding collapses the first few sub-microsecond steps
    EXPECT_LT(bounds.size(), 4u * 26u + 1u);
    EXPECT_GT(bounds.size(), 80u);
}

TEST_F(HistogramTest, ValidateBoundsRejectsBadInput) {
    std::string error;
    EXPECT_FALSE(ValidateBounds({}, &error));
    EXPECT_FALSE(ValidateBounds({0, 10}, &error));
    EXPECT_FALSE(ValidateBounds({10, 10, 20}, &error));
    EXPECT_FALSE(ValidateBounds({10, 5}, &error));
    EXPECT_TRUE(ValidateBounds({1, 2, 3}, &error));
}

TEST_F(HistogramTest, BucketEdgesAreUpperInclusive) {
    EXPECT_EQ(layout_.NumBuckets(), 5u);
    EXPECT_EQ(layout_.BucketFor(0), 0u);
    EXPECT_EQ(layout_.BucketFor(100), 0u);
    EXPECT_EQ(layout_.BucketFor(100.5), 1u);
    EXPECT_EQ(layout_.BucketFor(1000), 1u);
    EXPECT_EQ(layout_.BucketFor(100000), 3u);
    EXPECT_EQ(layout_.BucketFor(100001), 4u);
    EXPECT_TRUE(std::isinf(layout_.UpperEdge(4)));
}

TEST_F(HistogramTest, ObserveTracksStatistics) {
    Histogram h(layout_);
    h.Observe(layout_, 50);
    h.Observe(layout_, 500);
    h.Observe(layout_, 5000);

    EXPECT_EQ(h.count(), 3u);
    EXPECT_DOUBLE_EQ(h.min(), 50);
    EXPECT_DOUBLE_EQ(h.max(), 5000);
    EXPECT_DOUBLE_EQ(h.sum(), 5550);
    EXPECT_DOUBLE_EQ(h.Mean(), 1850);
    EXPECT_EQ(h.counts()[0], 1u);
    EXPECT_EQ(h.counts()[1], 1u);
    EXPECT_EQ(h.counts()[2], 1u);
    EXPECT_GT(h.StdDev(), 0.0);
}

TEST_F(HistogramTest, EmptyHistogramReportsZero) {
    Histogram h(layout_);
    EXPECT_EQ(h.Percentile(layout_, 0.5), 0.0);
    EXPECT_EQ(h.Mean(), 0.0);
    EXPECT_EQ(h.StdDev(), 0.0);
}

TEST_F(HistogramTest, PercentilesAreMonotonic) {
    Histogram h(layout_);
    for (int i = 1; i <= 1000; ++i) {
        h.Observe(layout_, i * 37 % 150000);
    }
    double p50 = h.Percentile(layout_, 0.50);
    double p95 = h.Percentile(layout_, 0.95);
    double p99 = h.Percentile(layout_, 0.99);
    EXPECT_LE(h.min(), p50);
    EXPECT_LE(p50, p95);
    EXPECT_LE(p95, p99);
    EXPECT_LE(p99, h.max());
}

TEST_F(HistogramTest, SinglePopulatedBucketStaysWithinObservedRange) {
    Histogram h(layout_);
    h.Observe(layout_, 2000);
    h.Observe(layout_, 3000);
    h.Observe(layout_, 4000);

    double p50 = h.Percentile(layout_, 0.50);
    double p95 = h.Percentile(layout_, 0.95);
    double p99 = h.Percentile(layout_, 0.99);
    EXPECT_GE(p50, 2000);
    EXPECT_LE(p50, p95);
    EXPECT_LE(p95, p99);
    EXPECT_LE(p99, 4000);
}

TEST_F(HistogramTest, SingleValueHasAllPercentilesEqual) {
    Histogram h(layout_);
    h.Observe(layout_, 777);
    EXPECT_DOUBLE_EQ(h.Percentile(layout_, 0.50), 777);
    EXPECT_DOUBLE_EQ(h.Percentile(layout_, 0.99), 777);
}

TEST_F(HistogramTest, OverflowBucketUsesObservedMax) {
    Histogram h(layout_);
    h.Observe(layout_, 500000);
    h.Observe(layout_, 900000);
    EXPECT_LE(h.Percentile(layout_, 0.99), 900000);
    EXPECT_GE(h.Percentile(layout_, 0.50), 500000);
}

TEST_F(HistogramTest, MergeIsElementWise) {
    Histogram a(layout_);
    Histogram b(layout_);
    a.Observe(layout_, 10);
    a.Observe(layout_, 20000);
    b.Observe(layout_, 5);
    b.Observe(layout_, 200000);

    Histogram ab = a;
    ASSERT_TRUE(ab.Merge(b));
    Histogram ba = b;
    ASSERT_TRUE(ba.Merge(a));

    EXPECT_EQ(ab.count(), 4u);
    EXPECT_DOUBLE_EQ(ab.min(), 5);
    EXPECT_DOUBLE_EQ(ab.max(), 200000);
    EXPECT_EQ(ab.counts(), ba.counts());
    EXPECT_DOUBLE_EQ(ab.sum(), ba.sum());
}

TEST_F(HistogramTest, MergeWithEmptyKeepsStatistics) {
    Histogram a(layout_);
    a.Observe(layout_, 300);
    Histogram empty(layout_);
    ASSERT_TRUE(a.Merge(empty));
    EXPECT_EQ(a.count(), 1u);
    EXPECT_DOUBLE_EQ(a.min(), 300);

    Histogram b(layout_);
    ASSERT_TRUE(b.Merge(a));
    EXPECT_DOUBLE_EQ(b.min(), 300);
    EXPECT_DOUBLE_EQ(b.max(), 300);
}

TEST_F(HistogramTest, MergeRejectsDifferentLayouts) {
    BucketLayout other({1, 2});
    Histogram a(layout_);
    Histogram b(other);
    a.Observe(layout_, 50);
    b.Observe(other, 1);
    EXPECT_FALSE(a.Merge(b));
    EXPECT_EQ(a.count(), 1u);
}

TEST_F(HistogramTest, ObserveWithForeignLayoutKeepsData) {
    Histogram h(layout_);
    h.Observe(layout_, 50);
    h.Observe(layout_, 5000);

    BucketLayout other({1, 2});
    EXPECT_DEBUG_DEATH(h.Observe(other, 1), "another bucket layout");
    EXPECT_EQ(h.count(), 2u);
    EXPECT_EQ(h.counts().size(), layout_.NumBuckets());
    EXPECT_DOUBLE_EQ(h.max(), 5000);
}

TEST_F(HistogramTest, RebuildFromPartsDerivesCount) {
    Histogram h({1, 2, 0, 0, 0}, 10, 900, 1500, 900000);
    EXPECT_EQ(h.count(), 3u);
    EXPECT_DOUBLE_EQ(h.min(), 10);

    Histogram empty({0, 0, 0, 0, 0}, 10, 900, 1500, 900000);
    EXPECT_EQ(empty.count(), 0u);
    EXPECT_DOUBLE_EQ(empty.min(), 0);
}

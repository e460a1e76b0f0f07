#include "summary.h"

namespace Chopsticks {

LatencyStats ComputeLatencyStats(const Histogram& histogram, const BucketLayout& layout) {
	LatencyStats stats;
	if (histogram.count() == 0) {
		return stats;
	}
	stats.p50_us = histogram.Percentile(layout, 0.50);
	stats.p95_us = histogram.Percentile(layout, 0.95);
	stats.p99_us = histogram.Percentile(layout, 0.99);
	stats.mean_us = histogram.Mean();
	stats.min_us = histogram.min();
	stats.max_us = histogram.max();
	stats.stddev_us = histogram.StdDev();
	return stats;
}

OperationSummary SummarizeOperation(const std::string& name, const OperationTotals& totals,
		const BucketLayout& layout, double elapsed_seconds) {
	OperationSummary summary;
	summary.name = name;
	summary.totals = totals;
	if (totals.count > 0) {
		summary.success_rate = 100.0 * static_cast<double>(totals.success) / static_cast<double>(totals.count);
	}
	summary.latency = ComputeLatencyStats(totals.CombinedLatency(), layout);
	if (elapsed_seconds > 0.0) {
		summary.bytes_per_second = static_cast<double>(totals.bytes) / elapsed_seconds;
		summary.ops_per_second = static_cast<double>(totals.success) / elapsed_seconds;
	}
	return summary;
}

} // End of namespace Chopsticks

#ifndef CHOPSTICKS_METRICS_SUMMARY_H_
#define CHOPSTICKS_METRICS_SUMMARY_H_

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "histogram.h"
#include "liveness_monitor.h"
#include "operation.h"
#include "worker_snapshot.h"

namespace Chopsticks {

// Bytes per megabyte in throughput figures
constexpr double kBytesPerMegabyte = 1000.0 * 1000.0;

/// Latency statistics in microseconds
struct LatencyStats {
	double p50_us = 0.0;
	double p95_us = 0.0;
	double p99_us = 0.0;
	double mean_us = 0.0;
	double min_us = 0.0;
	double max_us = 0.0;
	double stddev_us = 0.0;
};

struct OperationSummary {
	// Operation type name, or "total" for the combined row
	std::string name;
	OperationTotals totals;
	// Percentage in [0, 100]; zero when nothing ran
	double success_rate = 0.0;
	// Over both outcomes
	LatencyStats latency;
	double bytes_per_second = 0.0;
	// Successful operations per second
	double ops_per_second = 0.0;

	double MegabytesPerSecond() const { return bytes_per_second / kBytesPerMegabyte; }
};

struct WorkerStatusRecord {
	std::string worker_id;
	LivenessStatus status = LivenessStatus::kActive;
	uint64_t last_sequence = 0;
	Clock::time_point last_seen;
	double seconds_since_last_seen = 0.0;
	uint64_t operations = 0;
	uint64_t invalid_records = 0;
	uint64_t dropped_snapshots = 0;
};

/**
 * Global view derived from the latest snapshot of every worker. Never
 * stored by the aggregator; rebuilt on each request.
 */
struct Summary {
	Clock::time_point start_time;
	Clock::time_point generated_at;
	double elapsed_seconds = 0.0;
	std::vector<uint64_t> bucket_bounds_us;

	std::array<OperationSummary, kNumOperationTypes> operations;
	OperationSummary total;

	uint64_t invalid_records = 0;
	uint64_t dropped_snapshots = 0;
	uint64_t duplicate_snapshots = 0;
	uint64_t rejected_snapshots = 0;

	std::vector<WorkerStatusRecord> workers;
	bool has_stale_contributions = false;
	bool partial_coverage = false;
	bool finalized = false;
	int known_workers = 0;
	int expected_workers = 0;

	const OperationSummary& operation(OperationType type) const { return operations[Index(type)]; }
};

LatencyStats ComputeLatencyStats(const Histogram& histogram, const BucketLayout& layout);

/// Derives rates and percentiles for one set of totals. elapsed_seconds <= 0
/// yields zero throughput.
OperationSummary SummarizeOperation(const std::string& name, const OperationTotals& totals,
		const BucketLayout& layout, double elapsed_seconds);

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_SUMMARY_H_

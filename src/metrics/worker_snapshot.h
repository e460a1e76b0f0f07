#ifndef CHOPSTICKS_METRICS_WORKER_SNAPSHOT_H_
#define CHOPSTICKS_METRICS_WORKER_SNAPSHOT_H_

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "histogram.h"
#include "operation.h"

namespace Chopsticks {

/// Cumulative counters of one operation type
struct OperationTotals {
	uint64_t count = 0;
	uint64_t success = 0;
	uint64_t failure = 0;
	// Bytes moved by successful operations
	uint64_t bytes = 0;
	std::array<uint64_t, kNumFailureKinds> failures_by_kind{};
	std::array<Histogram, kNumOutcomes> latency;

	/// Element-wise sum. False when histogram sizes disagree.
	bool Merge(const OperationTotals& other);

	/// Latency over both outcomes
	Histogram CombinedLatency() const;

	/// Counters and histograms describe the same operations: success and
	/// failure add up to count, failure kinds add up to failure, and each
	/// outcome histogram holds one sample per operation.
	bool IsConsistent(std::string* error) const;

	bool operator==(const OperationTotals& other) const;
};

using OperationTotalsArray = std::array<OperationTotals, kNumOperationTypes>;

/**
 * Point-in-time report of a worker's totals since it started. Never a delta:
 * a lost snapshot only costs freshness, the next one carries everything.
 */
struct WorkerSnapshot {
	std::string worker_id;
	uint64_t sequence = 0;
	Clock::time_point created_at;
	Clock::time_point worker_started_at;
	OperationTotalsArray operations;
	uint64_t invalid_records = 0;
	// Snapshots this worker's transport had dropped when this one was taken
	uint64_t dropped_snapshots = 0;
	std::vector<uint64_t> bucket_bounds_us;
	// Set on the last flush before the worker exits
	bool is_final = false;

	uint64_t TotalOperations() const;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_WORKER_SNAPSHOT_H_

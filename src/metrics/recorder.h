#ifndef CHOPSTICKS_METRICS_RECORDER_H_
#define CHOPSTICKS_METRICS_RECORDER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "common/configuration.h"
#include "histogram.h"
#include "operation.h"
#include "worker_snapshot.h"

namespace Chopsticks {

/**
 * Producer-side boundary. The load driver holds a Recorder& and calls it once
 * per completed operation.
 */
class Recorder {
	public:
		virtual ~Recorder() = default;

		/// Safe from any number of threads. Never performs I/O or waits on
		/// the transport.
		virtual void Record(OperationType type, uint64_t size_bytes,
				std::chrono::nanoseconds duration, Outcome outcome,
				FailureKind failure_kind = FailureKind::kNone) = 0;
};

/// Everything a worker has recorded since it started
struct CumulativeTotals {
	OperationTotalsArray operations;
	uint64_t invalid_records = 0;
};

/**
 * Sharded recorder. Each calling thread sticks to one shard, so two threads
 * only contend when they hash to the same shard.
 */
class MetricsRecorder : public Recorder {
	public:
		MetricsRecorder(const MetricsConfig& config, std::string worker_id);

		void Record(OperationType type, uint64_t size_bytes,
				std::chrono::nanoseconds duration, Outcome outcome,
				FailureKind failure_kind = FailureKind::kNone) override;

		/// Malformed records are counted and discarded
		void Record(const OperationRecord& record);

		/// Consistent cumulative read. Each shard is read under its own lock.
		CumulativeTotals Collect() const;

		uint64_t InvalidRecords() const { return invalid_records_.load(std::memory_order_relaxed); }
		const BucketLayout& layout() const { return layout_; }
		const std::string& worker_id() const { return worker_id_; }
		size_t NumShards() const { return shards_.size(); }

	private:
		struct alignas(64) Shard {
			mutable absl::Mutex mu;
			OperationTotalsArray operations ABSL_GUARDED_BY(mu);
		};

		Shard& LocalShard();
		bool IsValid(const OperationRecord& record) const;

		const BucketLayout layout_;
		const std::string worker_id_;
		const std::chrono::nanoseconds max_latency_;
		std::vector<std::unique_ptr<Shard>> shards_;
		std::atomic<uint64_t> invalid_records_{0};
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_RECORDER_H_

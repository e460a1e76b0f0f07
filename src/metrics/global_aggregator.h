#ifndef CHOPSTICKS_METRICS_GLOBAL_AGGREGATOR_H_
#define CHOPSTICKS_METRICS_GLOBAL_AGGREGATOR_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"

#include "common/configuration.h"
#include "histogram.h"
#include "liveness_monitor.h"
#include "snapshot_sink.h"
#include "summary.h"
#include "worker_snapshot.h"

namespace Chopsticks {

/**
 * Coordinator-side view of the run. Keeps only the latest accepted snapshot
 * per worker; global totals are always the sum of those, so re-delivered or
 * reordered snapshots can never double count.
 */
class GlobalAggregator : public SnapshotSink {
	public:
		explicit GlobalAggregator(const MetricsConfig& config);
		GlobalAggregator(const MetricsConfig& config, Clock::time_point start_time);

		ApplyResult Apply(const WorkerSnapshot& snapshot) override;
		ApplyResult ApplyAt(const WorkerSnapshot& snapshot, Clock::time_point now);

		/// Counts a snapshot that was refused before it could be applied,
		/// e.g. one that did not decode
		void CountRejected(const std::string& worker_id, const std::string& reason);

		/// Highest applied sequence for the worker, 0 when unknown
		uint64_t StoredSequence(const std::string& worker_id) const;

		/// Merges the latest snapshots in worker-id order. Read only.
		Summary Summarize(Clock::time_point now) const;
		Summary Summarize() const { return Summarize(Clock::now()); }

		/// Updates liveness states and logs every change
		std::vector<LivenessTransition> SweepLiveness(Clock::time_point now);

		/// Blocks until every known worker sent its final snapshot and the
		/// expected worker count (when set) reported, or grace runs out.
		bool AwaitFinalSnapshots(std::chrono::milliseconds grace);

		/// Freezes the run end time. Workers that never finished are stale in
		/// every later summary. Later snapshots are refused.
		Summary Finalize(Clock::time_point now);

		const BucketLayout& layout() const { return layout_; }
		Clock::time_point start_time() const { return start_time_; }
		uint64_t DuplicateSnapshots() const;
		uint64_t RejectedSnapshots() const;
		size_t NumWorkers() const;

	private:
		bool HasLayoutOf(const WorkerSnapshot& snapshot) const;
		bool AllReportedLocked() const ABSL_SHARED_LOCKS_REQUIRED(mu_);

		const BucketLayout layout_;
		const int expected_workers_;
		const Clock::time_point start_time_;

		mutable absl::Mutex mu_;
		absl::btree_map<std::string, WorkerSnapshot> latest_ ABSL_GUARDED_BY(mu_);
		LivenessMonitor liveness_ ABSL_GUARDED_BY(mu_);
		uint64_t duplicate_snapshots_ ABSL_GUARDED_BY(mu_) = 0;
		uint64_t rejected_snapshots_ ABSL_GUARDED_BY(mu_) = 0;
		bool finalized_ ABSL_GUARDED_BY(mu_) = false;
		Clock::time_point end_time_ ABSL_GUARDED_BY(mu_);
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_GLOBAL_AGGREGATOR_H_

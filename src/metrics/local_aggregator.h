#ifndef CHOPSTICKS_METRICS_LOCAL_AGGREGATOR_H_
#define CHOPSTICKS_METRICS_LOCAL_AGGREGATOR_H_

#include <chrono>
#include <cstdint>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "common/configuration.h"
#include "recorder.h"
#include "snapshot_transport.h"
#include "worker_snapshot.h"

namespace Chopsticks {

/**
 * Per-worker flush timer. Every flush_interval it turns the recorder's
 * cumulative totals into the next numbered snapshot and hands it to the
 * transport. Recording threads are never blocked by a flush beyond the
 * per-shard lock held while Collect() reads that shard.
 */
class LocalAggregator {
	public:
		LocalAggregator(const MetricsConfig& config, MetricsRecorder& recorder,
				SnapshotTransport& transport);
		~LocalAggregator();

		void Start();

		/// Cancels the timer and performs the final flush. Idempotent.
		void Stop();

		/// Takes and sends one snapshot immediately
		void Flush(bool is_final);

		/// Builds the next snapshot without sending it
		WorkerSnapshot TakeSnapshot(bool is_final);

		uint64_t LastSequence() const;
		Clock::time_point started_at() const { return started_at_; }

	private:
		void TimerThread();

		MetricsRecorder& recorder_;
		SnapshotTransport& transport_;
		const std::chrono::milliseconds flush_interval_;
		const Clock::time_point started_at_;

		mutable absl::Mutex mu_;
		absl::CondVar cv_;
		uint64_t sequence_ ABSL_GUARDED_BY(mu_) = 0;
		bool running_ ABSL_GUARDED_BY(mu_) = false;
		bool stopped_ ABSL_GUARDED_BY(mu_) = false;

		// Serializes flushes so sequence order matches send order
		absl::Mutex flush_mu_;
		std::thread timer_thread_;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_LOCAL_AGGREGATOR_H_

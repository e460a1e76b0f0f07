#ifndef CHOPSTICKS_WORKER_WORKER_H_
#define CHOPSTICKS_WORKER_WORKER_H_

#include <string>

#include "common/configuration.h"
#include "metrics/local_aggregator.h"
#include "metrics/recorder.h"
#include "metrics/snapshot_transport.h"

namespace Chopsticks {

/**
 * Metrics side of one load-generating process: recorder plus flush timer,
 * bound to a transport owned by the caller.
 */
class Worker {
	public:
		Worker(const MetricsConfig& config, std::string worker_id, SnapshotTransport& transport);
		~Worker();

		void Start();

		/// Final flush, then waits up to the shutdown grace for the transport
		/// to hand everything off. False when snapshots were still pending.
		bool Stop();

		Recorder& recorder() { return recorder_; }
		MetricsRecorder& metrics_recorder() { return recorder_; }
		LocalAggregator& local_aggregator() { return aggregator_; }
		const std::string& worker_id() const { return recorder_.worker_id(); }

	private:
		const std::chrono::milliseconds shutdown_grace_;
		SnapshotTransport& transport_;
		MetricsRecorder recorder_;
		LocalAggregator aggregator_;
		bool stopped_ = false;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_WORKER_WORKER_H_

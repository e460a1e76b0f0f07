#ifndef CHOPSTICKS_METRICS_LIVENESS_MONITOR_H_
#define CHOPSTICKS_METRICS_LIVENESS_MONITOR_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

#include "operation.h"

namespace Chopsticks {

enum class LivenessStatus {
	kActive,
	kStale,
	kFinished,
};

const char* LivenessStatusName(LivenessStatus status);

struct WorkerState {
	std::string worker_id;
	uint64_t last_sequence = 0;
	Clock::time_point last_seen;
	LivenessStatus status = LivenessStatus::kActive;
};

struct LivenessTransition {
	std::string worker_id;
	LivenessStatus from;
	LivenessStatus to;
};

/**
 * Last-seen bookkeeping for every worker that ever reported.
 * Not synchronized; the GlobalAggregator calls it under its own mutex.
 */
class LivenessMonitor {
	public:
		explicit LivenessMonitor(std::chrono::milliseconds silence_timeout);

		/// Records an accepted snapshot. A stale worker turns active again;
		/// a final snapshot makes it finished for good.
		void Observe(const std::string& worker_id, uint64_t sequence, bool is_final,
				Clock::time_point now);

		/// Demotes active workers silent for longer than the timeout
		std::vector<LivenessTransition> Sweep(Clock::time_point now);

		/// Marks every worker that did not finish as stale. Used once the run
		/// is over and no more snapshots are expected.
		std::vector<LivenessTransition> ExpireUnfinished();

		/// Status evaluated at now, without mutating anything
		LivenessStatus StatusAt(const WorkerState& state, Clock::time_point now) const;

		/// All workers in id order, statuses evaluated at now
		std::vector<WorkerState> States(Clock::time_point now) const;

		size_t NumWorkers() const { return workers_.size(); }
		bool AllFinished() const;
		std::chrono::milliseconds silence_timeout() const { return silence_timeout_; }

	private:
		const std::chrono::milliseconds silence_timeout_;
		absl::btree_map<std::string, WorkerState> workers_;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_LIVENESS_MONITOR_H_

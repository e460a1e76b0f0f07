#include "liveness_monitor.h"

#include <glog/logging.h>

namespace Chopsticks {

const char* LivenessStatusName(LivenessStatus status) {
	switch (status) {
		case LivenessStatus::kActive: return "active";
		case LivenessStatus::kStale: return "stale";
		case LivenessStatus::kFinished: return "finished";
	}
	return "unknown";
}

LivenessMonitor::LivenessMonitor(std::chrono::milliseconds silence_timeout)
	: silence_timeout_(silence_timeout) {}

void LivenessMonitor::Observe(const std::string& worker_id, uint64_t sequence, bool is_final,
		Clock::time_point now) {
	auto it = workers_.find(worker_id);
	if (it == workers_.end()) {
		WorkerState state;
		state.worker_id = worker_id;
		it = workers_.emplace(worker_id, std::move(state)).first;
		LOG(INFO) << "[LivenessMonitor] new worker " << worker_id;
	}

	WorkerState& state = it->second;
	state.last_sequence = sequence;
	state.last_seen = now;
	if (state.status == LivenessStatus::kFinished) {
		return;
	}
	if (is_final) {
		state.status = LivenessStatus::kFinished;
		LOG(INFO) << "[LivenessMonitor] worker " << worker_id << " finished at #" << sequence;
	} else if (state.status == LivenessStatus::kStale) {
		state.status = LivenessStatus::kActive;
		LOG(INFO) << "[LivenessMonitor] worker " << worker_id << " is reporting again";
	}
}

LivenessStatus LivenessMonitor::StatusAt(const WorkerState& state, Clock::time_point now) const {
	if (state.status != LivenessStatus::kActive) {
		return state.status;
	}
	if (now - state.last_seen > silence_timeout_) {
		return LivenessStatus::kStale;
	}
	return LivenessStatus::kActive;
}

std::vector<LivenessTransition> LivenessMonitor::Sweep(Clock::time_point now) {
	std::vector<LivenessTransition> transitions;
	for (auto& [id, state] : workers_) {
		LivenessStatus next = StatusAt(state, now);
		if (next != state.status) {
			transitions.push_back({id, state.status, next});
			state.status = next;
		}
	}
	return transitions;
}

std::vector<LivenessTransition> LivenessMonitor::ExpireUnfinished() {
	std::vector<LivenessTransition> transitions;
	for (auto& [id, state] : workers_) {
		if (state.status == LivenessStatus::kActive) {
			transitions.push_back({id, state.status, LivenessStatus::kStale});
			state.status = LivenessStatus::kStale;
		}
	}
	return transitions;
}

std::vector<WorkerState> LivenessMonitor::States(Clock::time_point now) const {
	std::vector<WorkerState> states;
	states.reserve(workers_.size());
	for (const auto& [id, state] : workers_) {
		WorkerState copy = state;
		copy.status = StatusAt(state, now);
		states.push_back(std::move(copy));
	}
	return states;
}

bool LivenessMonitor::AllFinished() const {
	for (const auto& [id, state] : workers_) {
		if (state.status != LivenessStatus::kFinished) {
			return false;
		}
	}
	return true;
}

} // End of namespace Chopsticks

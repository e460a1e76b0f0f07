#include "global_aggregator.h"

#include <algorithm>

#include <glog/logging.h>

#include "absl/time/time.h"

namespace Chopsticks {

GlobalAggregator::GlobalAggregator(const MetricsConfig& config)
	: GlobalAggregator(config, Clock::now()) {}

GlobalAggregator::GlobalAggregator(const MetricsConfig& config, Clock::time_point start_time)
	: layout_(config.bucket_bounds_us),
	expected_workers_(config.expected_workers),
	start_time_(start_time),
	liveness_(config.silence_timeout) {}

ApplyResult GlobalAggregator::Apply(const WorkerSnapshot& snapshot) {
	return ApplyAt(snapshot, Clock::now());
}

bool GlobalAggregator::HasLayoutOf(const WorkerSnapshot& snapshot) const {
	if (snapshot.bucket_bounds_us != layout_.bounds_us()) {
		return false;
	}
	for (const auto& op : snapshot.operations) {
		for (const auto& h : op.latency) {
			if (!h.counts().empty() && h.counts().size() != layout_.NumBuckets()) {
				return false;
			}
		}
	}
	return true;
}

ApplyResult GlobalAggregator::ApplyAt(const WorkerSnapshot& snapshot, Clock::time_point now) {
	const char* reject_reason = nullptr;
	if (snapshot.worker_id.empty()) {
		reject_reason = "empty worker id";
	} else if (snapshot.sequence == 0) {
		reject_reason = "sequence numbers start at 1";
	} else if (!HasLayoutOf(snapshot)) {
		reject_reason = "bucket layout differs from the coordinator's";
	}

	absl::MutexLock lock(&mu_);
	if (reject_reason == nullptr && finalized_) {
		reject_reason = "run already finalized";
	}
	if (reject_reason != nullptr) {
		rejected_snapshots_++;
		LOG(WARNING) << "[GlobalAggregator] rejected snapshot " << snapshot.worker_id << "#"
			<< snapshot.sequence << ": " << reject_reason;
		return ApplyResult::kRejected;
	}

	auto it = latest_.find(snapshot.worker_id);
	if (it != latest_.end() && snapshot.sequence <= it->second.sequence &&
			snapshot.worker_started_at != it->second.worker_started_at) {
		// A new process reusing the id restarts at sequence 1; its snapshots
		// cannot be told apart from replays, so refuse them loudly
		rejected_snapshots_++;
		LOG(WARNING) << "[GlobalAggregator] rejected snapshot " << snapshot.worker_id << "#"
			<< snapshot.sequence << ": worker id reused by a process started at "
			<< absl::FormatTime(absl::FromChrono(snapshot.worker_started_at), absl::UTCTimeZone())
			<< " while #" << it->second.sequence << " is stored";
		return ApplyResult::kRejected;
	}
	if (it != latest_.end() && snapshot.sequence <= it->second.sequence) {
		duplicate_snapshots_++;
		VLOG(2) << "[GlobalAggregator] duplicate " << snapshot.worker_id << "#" << snapshot.sequence
			<< " (stored #" << it->second.sequence << ")";
		return ApplyResult::kDuplicate;
	}

	if (it == latest_.end()) {
		latest_.emplace(snapshot.worker_id, snapshot);
	} else {
		it->second = snapshot;
	}
	liveness_.Observe(snapshot.worker_id, snapshot.sequence, snapshot.is_final, now);
	VLOG(3) << "[GlobalAggregator] applied " << snapshot.worker_id << "#" << snapshot.sequence;
	return ApplyResult::kAccepted;
}

void GlobalAggregator::CountRejected(const std::string& worker_id, const std::string& reason) {
	{
		absl::MutexLock lock(&mu_);
		rejected_snapshots_++;
	}
	LOG(WARNING) << "[GlobalAggregator] rejected snapshot from " << worker_id << ": " << reason;
}

uint64_t GlobalAggregator::StoredSequence(const std::string& worker_id) const {
	absl::MutexLock lock(&mu_);
	auto it = latest_.find(worker_id);
	return it == latest_.end() ? 0 : it->second.sequence;
}

Summary GlobalAggregator::Summarize(Clock::time_point now) const {
	absl::MutexLock lock(&mu_);

	Summary summary;
	summary.start_time = start_time_;
	summary.finalized = finalized_;
	summary.generated_at = finalized_ ? end_time_ : now;
	summary.elapsed_seconds = std::max(0.0,
			std::chrono::duration<double>(summary.generated_at - start_time_).count());
	summary.bucket_bounds_us = layout_.bounds_us();
	summary.duplicate_snapshots = duplicate_snapshots_;
	summary.rejected_snapshots = rejected_snapshots_;
	summary.expected_workers = expected_workers_;

	// btree_map iterates by worker id, which keeps floating point sums
	// independent of arrival order
	OperationTotalsArray sums;
	for (auto& op : sums) {
		for (auto& h : op.latency) {
			h = Histogram(layout_);
		}
	}
	for (const auto& [id, snapshot] : latest_) {
		for (size_t i = 0; i < kNumOperationTypes; ++i) {
			sums[i].Merge(snapshot.operations[i]);
		}
		summary.invalid_records += snapshot.invalid_records;
		summary.dropped_snapshots += snapshot.dropped_snapshots;
	}

	OperationTotals combined;
	for (auto& h : combined.latency) {
		h = Histogram(layout_);
	}
	for (OperationType type : kAllOperationTypes) {
		const OperationTotals& totals = sums[Index(type)];
		summary.operations[Index(type)] =
			SummarizeOperation(OperationTypeName(type), totals, layout_, summary.elapsed_seconds);
		combined.Merge(totals);
	}
	summary.total = SummarizeOperation("total", combined, layout_, summary.elapsed_seconds);

	for (const WorkerState& state : liveness_.States(summary.generated_at)) {
		WorkerStatusRecord record;
		record.worker_id = state.worker_id;
		record.status = state.status;
		record.last_sequence = state.last_sequence;
		record.last_seen = state.last_seen;
		record.seconds_since_last_seen = std::max(0.0,
				std::chrono::duration<double>(summary.generated_at - state.last_seen).count());
		auto it = latest_.find(state.worker_id);
		if (it != latest_.end()) {
			record.operations = it->second.TotalOperations();
			record.invalid_records = it->second.invalid_records;
			record.dropped_snapshots = it->second.dropped_snapshots;
		}
		if (state.status == LivenessStatus::kStale) {
			summary.has_stale_contributions = true;
		}
		summary.workers.push_back(std::move(record));
	}
	summary.known_workers = static_cast<int>(summary.workers.size());
	summary.partial_coverage = expected_workers_ > 0 && summary.known_workers < expected_workers_;
	return summary;
}

std::vector<LivenessTransition> GlobalAggregator::SweepLiveness(Clock::time_point now) {
	std::vector<LivenessTransition> transitions;
	{
		absl::MutexLock lock(&mu_);
		if (finalized_) {
			return transitions;
		}
		transitions = liveness_.Sweep(now);
	}
	for (const auto& t : transitions) {
		LOG(WARNING) << "[GlobalAggregator] worker " << t.worker_id << " "
			<< LivenessStatusName(t.from) << " -> " << LivenessStatusName(t.to);
	}
	return transitions;
}

bool GlobalAggregator::AllReportedLocked() const {
	if (expected_workers_ > 0 && static_cast<int>(liveness_.NumWorkers()) < expected_workers_) {
		return false;
	}
	return liveness_.AllFinished();
}

bool GlobalAggregator::AwaitFinalSnapshots(std::chrono::milliseconds grace) {
	absl::MutexLock lock(&mu_);
	bool done = mu_.AwaitWithTimeout(absl::Condition(this, &GlobalAggregator::AllReportedLocked),
			absl::FromChrono(grace));
	if (!done) {
		LOG(WARNING) << "[GlobalAggregator] grace period of " << grace.count()
			<< "ms ended before every worker sent its final snapshot";
	}
	return done;
}

Summary GlobalAggregator::Finalize(Clock::time_point now) {
	std::vector<LivenessTransition> transitions;
	{
		absl::MutexLock lock(&mu_);
		if (!finalized_) {
			finalized_ = true;
			end_time_ = now;
			transitions = liveness_.ExpireUnfinished();
		}
	}
	for (const auto& t : transitions) {
		LOG(WARNING) << "[GlobalAggregator] worker " << t.worker_id
			<< " never sent a final snapshot, its last totals are stale";
	}
	LOG(INFO) << "[GlobalAggregator] run finalized";
	return Summarize(now);
}

uint64_t GlobalAggregator::DuplicateSnapshots() const {
	absl::MutexLock lock(&mu_);
	return duplicate_snapshots_;
}

uint64_t GlobalAggregator::RejectedSnapshots() const {
	absl::MutexLock lock(&mu_);
	return rejected_snapshots_;
}

size_t GlobalAggregator::NumWorkers() const {
	absl::MutexLock lock(&mu_);
	return latest_.size();
}

} // End of namespace Chopsticks

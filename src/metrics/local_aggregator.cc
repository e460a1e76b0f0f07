#include "local_aggregator.h"

#include <glog/logging.h>
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace Chopsticks {

LocalAggregator::LocalAggregator(const MetricsConfig& config, MetricsRecorder& recorder,
		SnapshotTransport& transport)
	: recorder_(recorder),
	transport_(transport),
	flush_interval_(config.flush_interval),
	started_at_(Clock::now()) {}

LocalAggregator::~LocalAggregator() {
	Stop();
}

void LocalAggregator::Start() {
	absl::MutexLock lock(&mu_);
	if (running_ || stopped_) {
		LOG(WARNING) << "[LocalAggregator] Start() called twice or after Stop()";
		return;
	}
	running_ = true;
	timer_thread_ = std::thread([this]() {
			this->TimerThread();
			});
	LOG(INFO) << "[LocalAggregator] " << recorder_.worker_id() << " flushing every "
		<< flush_interval_.count() << "ms";
}

void LocalAggregator::Stop() {
	{
		absl::MutexLock lock(&mu_);
		if (stopped_) {
			return;
		}
		stopped_ = true;
		cv_.SignalAll();
	}
	if (timer_thread_.joinable()) {
		timer_thread_.join();
	}
	Flush(true);
	LOG(INFO) << "[LocalAggregator] " << recorder_.worker_id() << " final flush #" << LastSequence();
}

void LocalAggregator::TimerThread() {
	absl::Time deadline = absl::Now() + absl::FromChrono(flush_interval_);
	while (true) {
		{
			absl::MutexLock lock(&mu_);
			while (!stopped_ && absl::Now() < deadline) {
				cv_.WaitWithDeadline(&mu_, deadline);
			}
			if (stopped_) {
				break;
			}
		}
		Flush(false);
		// Fixed cadence; a slow flush skips ticks instead of bunching them
		absl::Time now = absl::Now();
		do {
			deadline += absl::FromChrono(flush_interval_);
		} while (deadline <= now);
	}
}

WorkerSnapshot LocalAggregator::TakeSnapshot(bool is_final) {
	CumulativeTotals totals = recorder_.Collect();

	WorkerSnapshot snapshot;
	snapshot.worker_id = recorder_.worker_id();
	{
		absl::MutexLock lock(&mu_);
		snapshot.sequence = ++sequence_;
	}
	snapshot.created_at = Clock::now();
	snapshot.worker_started_at = started_at_;
	snapshot.operations = std::move(totals.operations);
	snapshot.invalid_records = totals.invalid_records;
	snapshot.dropped_snapshots = transport_.DroppedSnapshots();
	snapshot.bucket_bounds_us = recorder_.layout().bounds_us();
	snapshot.is_final = is_final;
	return snapshot;
}

void LocalAggregator::Flush(bool is_final) {
	absl::MutexLock lock(&flush_mu_);
	WorkerSnapshot snapshot = TakeSnapshot(is_final);
	VLOG(2) << "[LocalAggregator] " << snapshot.worker_id << "#" << snapshot.sequence
		<< " ops=" << snapshot.TotalOperations() << (is_final ? " (final)" : "");
	transport_.Send(snapshot);
}

uint64_t LocalAggregator::LastSequence() const {
	absl::MutexLock lock(&mu_);
	return sequence_;
}

} // End of namespace Chopsticks

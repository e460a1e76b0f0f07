#include "recorder.h"

#include <glog/logging.h>

namespace Chopsticks {

namespace {

// Process-wide slot handed to each recording thread on first use
std::atomic<size_t> g_next_thread_slot{0};

size_t ThreadSlot() {
	thread_local size_t slot = g_next_thread_slot.fetch_add(1, std::memory_order_relaxed);
	return slot;
}

} // namespace

MetricsRecorder::MetricsRecorder(const MetricsConfig& config, std::string worker_id)
	: layout_(config.bucket_bounds_us),
	worker_id_(std::move(worker_id)),
	max_latency_(config.max_latency) {
		size_t num_shards = config.recorder_shards > 0 ? config.recorder_shards : 1;
		shards_.reserve(num_shards);
		for (size_t i = 0; i < num_shards; ++i) {
			auto shard = std::make_unique<Shard>();
			absl::MutexLock lock(&shard->mu);
			for (auto& op : shard->operations) {
				for (auto& h : op.latency) {
					h = Histogram(layout_);
				}
			}
			shards_.push_back(std::move(shard));
		}
		VLOG(1) << "[MetricsRecorder] worker " << worker_id_ << " with " << num_shards
			<< " shards and " << layout_.NumBuckets() << " latency buckets";
	}

void MetricsRecorder::Record(OperationType type, uint64_t size_bytes,
		std::chrono::nanoseconds duration, Outcome outcome, FailureKind failure_kind) {
	OperationRecord record;
	record.type = type;
	record.size_bytes = size_bytes;
	record.duration = duration;
	record.outcome = outcome;
	record.failure_kind = failure_kind;
	record.worker_id = worker_id_;
	record.timestamp = Clock::now();
	Record(record);
}

void MetricsRecorder::Record(const OperationRecord& record) {
	if (!IsValid(record)) {
		invalid_records_.fetch_add(1, std::memory_order_relaxed);
		return;
	}

	FailureKind kind = record.failure_kind;
	if (record.outcome == Outcome::kFailure && kind == FailureKind::kNone) {
		kind = FailureKind::kUnknown;
	}
	const double latency_us =
		std::chrono::duration<double, std::micro>(record.duration).count();

	Shard& shard = LocalShard();
	absl::MutexLock lock(&shard.mu);
	OperationTotals& op = shard.operations[Index(record.type)];
	op.count++;
	if (record.outcome == Outcome::kSuccess) {
		op.success++;
		op.bytes += record.size_bytes;
	} else {
		op.failure++;
		op.failures_by_kind[Index(kind)]++;
	}
	op.latency[Index(record.outcome)].Observe(layout_, latency_us);
}

CumulativeTotals MetricsRecorder::Collect() const {
	CumulativeTotals totals;
	for (auto& op : totals.operations) {
		for (auto& h : op.latency) {
			h = Histogram(layout_);
		}
	}
	for (const auto& shard : shards_) {
		absl::MutexLock lock(&shard->mu);
		for (size_t i = 0; i < kNumOperationTypes; ++i) {
			totals.operations[i].Merge(shard->operations[i]);
		}
	}
	totals.invalid_records = invalid_records_.load(std::memory_order_relaxed);
	return totals;
}

MetricsRecorder::Shard& MetricsRecorder::LocalShard() {
	return *shards_[ThreadSlot() % shards_.size()];
}

bool MetricsRecorder::IsValid(const OperationRecord& record) const {
	if (Index(record.type) >= kNumOperationTypes ||
			Index(record.outcome) >= kNumOutcomes ||
			Index(record.failure_kind) >= kNumFailureKinds) {
		return false;
	}
	if (record.duration.count() < 0 || record.duration > max_latency_) {
		return false;
	}
	if (record.outcome == Outcome::kSuccess && record.failure_kind != FailureKind::kNone) {
		return false;
	}
	return true;
}

} // End of namespace Chopsticks

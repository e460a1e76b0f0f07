#include "snapshot_codec.h"

#include <vector>

namespace Chopsticks {

namespace {

void EncodeHistogram(const Histogram& h, chopsticks_metrics::HistogramProto* proto) {
	for (uint64_t c : h.counts()) {
		proto->add_counts(c);
	}
	proto->set_min_us(h.min());
	proto->set_max_us(h.max());
	proto->set_sum_us(h.sum());
	proto->set_sum_sq_us(h.sum_sq());
}

bool DecodeHistogram(const chopsticks_metrics::HistogramProto& proto, size_t num_buckets,
		Histogram* h) {
	// An empty histogram may be sent without bucket counts
	if (proto.counts_size() == 0) {
		*h = Histogram(std::vector<uint64_t>(num_buckets, 0), 0, 0, 0, 0);
		return true;
	}
	if (static_cast<size_t>(proto.counts_size()) != num_buckets) {
		return false;
	}
	std::vector<uint64_t> counts(proto.counts().begin(), proto.counts().end());
	*h = Histogram(std::move(counts), proto.min_us(), proto.max_us(), proto.sum_us(), proto.sum_sq_us());
	return true;
}

} // namespace

int64_t ToMicros(Clock::time_point t) {
	return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

Clock::time_point FromMicros(int64_t us) {
	return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(us)));
}

void EncodeSnapshot(const WorkerSnapshot& snapshot, chopsticks_metrics::WorkerSnapshotProto* proto) {
	proto->set_worker_id(snapshot.worker_id);
	proto->set_sequence(snapshot.sequence);
	proto->set_created_at_us(ToMicros(snapshot.created_at));
	proto->set_worker_started_at_us(ToMicros(snapshot.worker_started_at));
	proto->set_invalid_records(snapshot.invalid_records);
	proto->set_dropped_snapshots(snapshot.dropped_snapshots);
	proto->set_is_final(snapshot.is_final);
	for (uint64_t bound : snapshot.bucket_bounds_us) {
		proto->add_bucket_bounds_us(bound);
	}

	for (OperationType type : kAllOperationTypes) {
		const OperationTotals& op = snapshot.operations[Index(type)];
		// Untouched operation types are implied zero
		if (op.count == 0) {
			continue;
		}
		auto* op_proto = proto->add_operations();
		op_proto->set_operation(OperationTypeName(type));
		op_proto->set_count(op.count);
		op_proto->set_success(op.success);
		op_proto->set_failure(op.failure);
		op_proto->set_bytes(op.bytes);
		for (size_t k = 0; k < kNumFailureKinds; ++k) {
			if (op.failures_by_kind[k] > 0) {
				(*op_proto->mutable_failures_by_kind())[FailureKindName(static_cast<FailureKind>(k))] =
					op.failures_by_kind[k];
			}
		}
		EncodeHistogram(op.latency[Index(Outcome::kSuccess)], op_proto->mutable_success_latency());
		EncodeHistogram(op.latency[Index(Outcome::kFailure)], op_proto->mutable_failure_latency());
	}
}

bool DecodeSnapshot(const chopsticks_metrics::WorkerSnapshotProto& proto,
		WorkerSnapshot* snapshot, std::string* error) {
	WorkerSnapshot out;
	out.worker_id = proto.worker_id();
	out.sequence = proto.sequence();
	out.created_at = FromMicros(proto.created_at_us());
	out.worker_started_at = FromMicros(proto.worker_started_at_us());
	out.invalid_records = proto.invalid_records();
	out.dropped_snapshots = proto.dropped_snapshots();
	out.is_final = proto.is_final();
	out.bucket_bounds_us.assign(proto.bucket_bounds_us().begin(), proto.bucket_bounds_us().end());

	const size_t num_buckets = out.bucket_bounds_us.size() + 1;
	for (auto& op : out.operations) {
		for (auto& h : op.latency) {
			h = Histogram(std::vector<uint64_t>(num_buckets, 0), 0, 0, 0, 0);
		}
	}

	for (const auto& op_proto : proto.operations()) {
		auto type = ParseOperationType(op_proto.operation());
		if (!type.has_value()) {
			*error = "unknown operation type '" + op_proto.operation() + "'";
			return false;
		}
		OperationTotals& op = out.operations[Index(*type)];
		op.count = op_proto.count();
		op.success = op_proto.success();
		op.failure = op_proto.failure();
		op.bytes = op_proto.bytes();
		for (const auto& entry : op_proto.failures_by_kind()) {
			auto kind = ParseFailureKind(entry.first);
			if (!kind.has_value()) {
				*error = "unknown failure kind '" + entry.first + "'";
				return false;
			}
			op.failures_by_kind[Index(*kind)] = entry.second;
		}
		if (!DecodeHistogram(op_proto.success_latency(), num_buckets, &op.latency[Index(Outcome::kSuccess)]) ||
				!DecodeHistogram(op_proto.failure_latency(), num_buckets, &op.latency[Index(Outcome::kFailure)])) {
			*error = "histogram size does not match bucket bounds for " + op_proto.operation();
			return false;
		}
		std::string inconsistency;
		if (!op.IsConsistent(&inconsistency)) {
			*error = op_proto.operation() + ": " + inconsistency;
			return false;
		}
	}

	*snapshot = std::move(out);
	return true;
}

} // End of namespace Chopsticks

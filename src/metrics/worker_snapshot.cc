#include "worker_snapshot.h"

namespace Chopsticks {

bool OperationTotals::Merge(const OperationTotals& other) {
	// Check sizes first so a mismatch leaves this untouched
	for (size_t i = 0; i < kNumOutcomes; ++i) {
		const auto& mine = latency[i].counts();
		const auto& theirs = other.latency[i].counts();
		if (!mine.empty() && !theirs.empty() && mine.size() != theirs.size()) {
			return false;
		}
	}

	count += other.count;
	success += other.success;
	failure += other.failure;
	bytes += other.bytes;
	for (size_t k = 0; k < kNumFailureKinds; ++k) {
		failures_by_kind[k] += other.failures_by_kind[k];
	}
	for (size_t i = 0; i < kNumOutcomes; ++i) {
		latency[i].Merge(other.latency[i]);
	}
	return true;
}

Histogram OperationTotals::CombinedLatency() const {
	Histogram combined = latency[Index(Outcome::kSuccess)];
	combined.Merge(latency[Index(Outcome::kFailure)]);
	return combined;
}

bool OperationTotals::IsConsistent(std::string* error) const {
	if (success > count || failure != count - success) {
		*error = "success " + std::to_string(success) + " + failure " + std::to_string(failure) +
			" != count " + std::to_string(count);
		return false;
	}
	uint64_t by_kind = 0;
	for (uint64_t n : failures_by_kind) {
		by_kind += n;
	}
	if (by_kind != failure) {
		*error = "failure kinds sum to " + std::to_string(by_kind) + ", expected " + std::to_string(failure);
		return false;
	}
	if (latency[Index(Outcome::kSuccess)].count() != success ||
			latency[Index(Outcome::kFailure)].count() != failure) {
		*error = "latency histograms disagree with success/failure counters";
		return false;
	}
	return true;
}

bool OperationTotals::operator==(const OperationTotals& other) const {
	return count == other.count && success == other.success &&
		failure == other.failure && bytes == other.bytes &&
		failures_by_kind == other.failures_by_kind && latency == other.latency;
}

uint64_t WorkerSnapshot::TotalOperations() const {
	uint64_t total = 0;
	for (const auto& op : operations) {
		total += op.count;
	}
	return total;
}

} // End of namespace Chopsticks

#include "text_exposition.h"

#include <iomanip>
#include <sstream>

namespace Chopsticks {

const char kExpositionContentType[] = "text/plain; version=0.0.4";

namespace {

void Header(std::ostringstream& out, const char* name, const char* type, const char* help) {
	out << "# HELP " << name << " " << help << "\n";
	out << "# TYPE " << name << " " << type << "\n";
}

std::string Seconds(double us) {
	std::ostringstream s;
	s << std::setprecision(12) << us / 1e6;
	return s.str();
}

std::string Number(double v) {
	std::ostringstream s;
	s << std::setprecision(12) << v;
	return s.str();
}

// Label values are worker ids and fixed names; only quotes, backslashes and
// newlines need escaping
std::string Escape(const std::string& value) {
	std::string escaped;
	escaped.reserve(value.size());
	for (char c : value) {
		switch (c) {
			case '\\': escaped += "\\\\"; break;
			case '"': escaped += "\\\""; break;
			case '\n': escaped += "\\n"; break;
			default: escaped += c;
		}
	}
	return escaped;
}

void LatencyHistogram(std::ostringstream& out, const std::string& labels,
		const Histogram& h, const std::vector<uint64_t>& bounds) {
	const auto& counts = h.counts();
	uint64_t cumulative = 0;
	for (size_t i = 0; i < bounds.size(); ++i) {
		if (i < counts.size()) {
			cumulative += counts[i];
		}
		out << "chopsticks_operation_latency_seconds_bucket{" << labels << ",le=\""
			<< Seconds(static_cast<double>(bounds[i])) << "\"} " << cumulative << "\n";
	}
	out << "chopsticks_operation_latency_seconds_bucket{" << labels << ",le=\"+Inf\"} "
		<< h.count() << "\n";
	out << "chopsticks_operation_latency_seconds_sum{" << labels << "} " << Seconds(h.sum()) << "\n";
	out << "chopsticks_operation_latency_seconds_count{" << labels << "} " << h.count() << "\n";
}

} // namespace

std::string RenderTextExposition(const Summary& summary) {
	std::ostringstream out;

	Header(out, "chopsticks_operations_total", "counter", "Completed storage operations.");
	for (const auto& op : summary.operations) {
		out << "chopsticks_operations_total{operation=\"" << op.name << "\",outcome=\"success\"} "
			<< op.totals.success << "\n";
		out << "chopsticks_operations_total{operation=\"" << op.name << "\",outcome=\"failure\"} "
			<< op.totals.failure << "\n";
	}

	Header(out, "chopsticks_operation_failures_total", "counter", "Failed operations by failure kind.");
	for (const auto& op : summary.operations) {
		for (size_t k = 0; k < kNumFailureKinds; ++k) {
			FailureKind kind = static_cast<FailureKind>(k);
			if (kind == FailureKind::kNone || op.totals.failures_by_kind[k] == 0) {
				continue;
			}
			out << "chopsticks_operation_failures_total{operation=\"" << op.name << "\",kind=\""
				<< FailureKindName(kind) << "\"} " << op.totals.failures_by_kind[k] << "\n";
		}
	}

	Header(out, "chopsticks_bytes_total", "counter", "Bytes moved by successful operations.");
	for (const auto& op : summary.operations) {
		out << "chopsticks_bytes_total{operation=\"" << op.name << "\"} " << op.totals.bytes << "\n";
	}

	Header(out, "chopsticks_operation_latency_seconds", "histogram", "Operation latency.");
	for (const auto& op : summary.operations) {
		if (op.totals.count == 0) {
			continue;
		}
		for (size_t o = 0; o < kNumOutcomes; ++o) {
			std::string labels = "operation=\"" + op.name + "\",outcome=\"" +
				OutcomeName(static_cast<Outcome>(o)) + "\"";
			LatencyHistogram(out, labels, op.totals.latency[o], summary.bucket_bounds_us);
		}
	}

	Header(out, "chopsticks_throughput_bytes_per_second", "gauge", "Bytes per second over the run so far.");
	for (const auto& op : summary.operations) {
		out << "chopsticks_throughput_bytes_per_second{operation=\"" << op.name << "\"} "
			<< Number(op.bytes_per_second) << "\n";
	}

	Header(out, "chopsticks_invalid_records_total", "counter", "Malformed operation records discarded by workers.");
	out << "chopsticks_invalid_records_total " << summary.invalid_records << "\n";
	Header(out, "chopsticks_dropped_snapshots_total", "counter", "Snapshots dropped by worker transports.");
	out << "chopsticks_dropped_snapshots_total " << summary.dropped_snapshots << "\n";
	Header(out, "chopsticks_duplicate_snapshots_total", "counter", "Snapshots discarded as not newer than the stored one.");
	out << "chopsticks_duplicate_snapshots_total " << summary.duplicate_snapshots << "\n";
	Header(out, "chopsticks_rejected_snapshots_total", "counter", "Snapshots refused by the coordinator.");
	out << "chopsticks_rejected_snapshots_total " << summary.rejected_snapshots << "\n";

	Header(out, "chopsticks_run_elapsed_seconds", "gauge", "Seconds since the coordinator started.");
	out << "chopsticks_run_elapsed_seconds " << Number(summary.elapsed_seconds) << "\n";

	Header(out, "chopsticks_worker_status", "gauge", "One per worker, labeled with its liveness status.");
	for (const auto& w : summary.workers) {
		out << "chopsticks_worker_status{worker=\"" << Escape(w.worker_id) << "\",status=\""
			<< LivenessStatusName(w.status) << "\"} 1\n";
	}
	Header(out, "chopsticks_worker_last_seen_seconds", "gauge", "Seconds since the worker's last accepted snapshot.");
	for (const auto& w : summary.workers) {
		out << "chopsticks_worker_last_seen_seconds{worker=\"" << Escape(w.worker_id) << "\"} "
			<< Number(w.seconds_since_last_seen) << "\n";
	}
	Header(out, "chopsticks_worker_last_sequence", "gauge", "Sequence number of the worker's last accepted snapshot.");
	for (const auto& w : summary.workers) {
		out << "chopsticks_worker_last_sequence{worker=\"" << Escape(w.worker_id) << "\"} "
			<< w.last_sequence << "\n";
	}

	Header(out, "chopsticks_stale_contributions", "gauge", "1 when totals include workers that went silent.");
	out << "chopsticks_stale_contributions " << (summary.has_stale_contributions ? 1 : 0) << "\n";
	Header(out, "chopsticks_partial_coverage", "gauge", "1 when fewer workers reported than expected.");
	out << "chopsticks_partial_coverage " << (summary.partial_coverage ? 1 : 0) << "\n";

	return out.str();
}

} // End of namespace Chopsticks

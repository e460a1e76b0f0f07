#include "console_summary.h"

#include <iomanip>
#include <sstream>

namespace Chopsticks {

namespace {

void Row(std::ostringstream& out, const OperationSummary& op) {
	out << std::left << std::setw(10) << op.name << std::right
		<< " | " << std::setw(10) << op.totals.count
		<< " | " << std::setw(8) << std::fixed << std::setprecision(2) << op.success_rate
		<< " | " << std::setw(9) << std::setprecision(2) << op.latency.p50_us / 1000.0
		<< " | " << std::setw(9) << op.latency.p95_us / 1000.0
		<< " | " << std::setw(9) << op.latency.p99_us / 1000.0
		<< " | " << std::setw(9) << op.MegabytesPerSecond()
		<< " | " << std::setw(9) << op.ops_per_second << "\n";
}

} // namespace

std::string RenderConsoleSummary(const Summary& summary) {
	std::ostringstream out;
	out << "\n=== Chopsticks run summary (" << std::fixed << std::setprecision(1)
		<< summary.elapsed_seconds << "s, " << summary.known_workers << " workers) ===\n";
	out << std::left << std::setw(10) << "operation" << std::right
		<< " | " << std::setw(10) << "count"
		<< " | " << std::setw(8) << "success%"
		<< " | " << std::setw(9) << "p50 ms"
		<< " | " << std::setw(9) << "p95 ms"
		<< " | " << std::setw(9) << "p99 ms"
		<< " | " << std::setw(9) << "MB/s"
		<< " | " << std::setw(9) << "ops/s" << "\n";
	out << std::string(100, '-') << "\n";
	for (const auto& op : summary.operations) {
		if (op.totals.count == 0) {
			continue;
		}
		Row(out, op);
	}
	out << std::string(100, '-') << "\n";
	Row(out, summary.total);

	if (summary.invalid_records > 0) {
		out << "WARNING: " << summary.invalid_records << " invalid operation records were discarded\n";
	}
	if (summary.dropped_snapshots > 0) {
		out << "WARNING: " << summary.dropped_snapshots << " snapshots were dropped in transit\n";
	}
	if (summary.rejected_snapshots > 0) {
		out << "WARNING: " << summary.rejected_snapshots << " snapshots were rejected by the coordinator\n";
	}
	if (summary.has_stale_contributions) {
		out << "WARNING: totals include stale workers:";
		for (const auto& w : summary.workers) {
			if (w.status == LivenessStatus::kStale) {
				out << " " << w.worker_id;
			}
		}
		out << "\n";
	}
	if (summary.partial_coverage) {
		out << "WARNING: only " << summary.known_workers << " of " << summary.expected_workers
			<< " expected workers reported\n";
	}
	return out.str();
}

void PrintConsoleSummary(const Summary& summary, std::ostream& out) {
	out << RenderConsoleSummary(summary) << std::flush;
}

} // End of namespace Chopsticks

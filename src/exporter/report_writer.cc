#include "report_writer.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>
#include <google/protobuf/util/json_util.h>
#include "absl/time/time.h"

namespace Chopsticks {

namespace {

double Ms(double us) { return us / 1000.0; }

void FillOperation(const OperationSummary& op, chopsticks_report::OperationReportProto* proto) {
	proto->set_operation(op.name);
	proto->set_count(op.totals.count);
	proto->set_success(op.totals.success);
	proto->set_failure(op.totals.failure);
	proto->set_bytes(op.totals.bytes);
	proto->set_success_rate(op.success_rate);
	proto->set_throughput_mbps(op.MegabytesPerSecond());
	proto->set_ops_per_second(op.ops_per_second);

	auto* latency = proto->mutable_latency();
	latency->set_p50_ms(Ms(op.latency.p50_us));
	latency->set_p95_ms(Ms(op.latency.p95_us));
	latency->set_p99_ms(Ms(op.latency.p99_us));
	latency->set_mean_ms(Ms(op.latency.mean_us));
	latency->set_min_ms(Ms(op.latency.min_us));
	latency->set_max_ms(Ms(op.latency.max_us));
	latency->set_stddev_ms(Ms(op.latency.stddev_us));

	for (size_t k = 0; k < kNumFailureKinds; ++k) {
		if (op.totals.failures_by_kind[k] > 0) {
			(*proto->mutable_failures_by_kind())[FailureKindName(static_cast<FailureKind>(k))] =
				op.totals.failures_by_kind[k];
		}
	}
}

void CsvRow(std::ostringstream& out, const OperationSummary& op) {
	out << op.name << "," << op.totals.count << "," << op.totals.success << ","
		<< op.totals.failure << "," << op.success_rate << "," << op.totals.bytes << ","
		<< op.MegabytesPerSecond() << "," << op.ops_per_second << ","
		<< Ms(op.latency.p50_us) << "," << Ms(op.latency.p95_us) << "," << Ms(op.latency.p99_us) << ","
		<< Ms(op.latency.mean_us) << "," << Ms(op.latency.min_us) << "," << Ms(op.latency.max_us) << ","
		<< Ms(op.latency.stddev_us) << "\n";
}

} // namespace

std::string FormatTimestamp(Clock::time_point t) {
	return absl::FormatTime(absl::RFC3339_full, absl::FromChrono(t), absl::UTCTimeZone());
}

bool WriteFileAtomically(const std::string& path, const std::string& contents) {
	const std::string tmp_path = path + ".tmp";
	{
		std::ofstream file(tmp_path, std::ios::out | std::ios::trunc);
		if (!file.is_open()) {
			LOG(ERROR) << "Failed to open " << tmp_path << ": " << strerror(errno);
			return false;
		}
		file << contents;
		file.flush();
		if (!file.good()) {
			LOG(ERROR) << "Failed to write " << tmp_path << ": " << strerror(errno);
			std::remove(tmp_path.c_str());
			return false;
		}
	}
	if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
		LOG(ERROR) << "Failed to rename " << tmp_path << " to " << path << ": " << strerror(errno);
		std::remove(tmp_path.c_str());
		return false;
	}
	return true;
}

ReportWriter::ReportWriter(const MetricsConfig& config, RunMetadata metadata)
	: config_(config),
	metadata_(std::move(metadata)) {}

chopsticks_report::RunReportProto ReportWriter::BuildReport(const Summary& summary) const {
	chopsticks_report::RunReportProto report;

	auto* meta = report.mutable_metadata();
	meta->set_run_id(metadata_.run_id);
	meta->set_scenario(metadata_.scenario);
	meta->set_endpoint(metadata_.endpoint);
	meta->set_driver(metadata_.driver);
	meta->set_start_time(FormatTimestamp(summary.start_time));
	meta->set_generated_at(FormatTimestamp(summary.generated_at));
	meta->set_duration_seconds(summary.elapsed_seconds);
	meta->set_clients(metadata_.clients);
	for (const auto& [key, value] : metadata_.parameters) {
		(*meta->mutable_parameters())[key] = value;
	}

	auto* conf = report.mutable_configuration();
	conf->set_flush_interval_ms(config_.flush_interval.count());
	conf->set_silence_timeout_ms(config_.silence_timeout.count());
	conf->set_shutdown_grace_ms(config_.shutdown_grace.count());
	conf->set_outbound_queue_capacity(config_.outbound_queue_capacity);
	conf->set_expected_workers(config_.expected_workers);
	for (uint64_t bound : summary.bucket_bounds_us) {
		conf->add_bucket_bounds_us(bound);
	}

	for (const auto& op : summary.operations) {
		FillOperation(op, report.add_operations());
	}
	FillOperation(summary.total, report.mutable_total());

	for (const auto& w : summary.workers) {
		auto* worker = report.add_workers();
		worker->set_worker_id(w.worker_id);
		worker->set_status(LivenessStatusName(w.status));
		worker->set_last_sequence(w.last_sequence);
		worker->set_last_seen(FormatTimestamp(w.last_seen));
		worker->set_seconds_since_last_seen(w.seconds_since_last_seen);
		worker->set_operations(w.operations);
		worker->set_dropped_snapshots(w.dropped_snapshots);
	}

	auto* transport = report.mutable_transport();
	transport->set_dropped_snapshots(summary.dropped_snapshots);
	transport->set_duplicate_snapshots(summary.duplicate_snapshots);
	transport->set_rejected_snapshots(summary.rejected_snapshots);
	transport->set_invalid_records(summary.invalid_records);

	auto* completeness = report.mutable_completeness();
	completeness->set_has_stale_contributions(summary.has_stale_contributions);
	completeness->set_partial_coverage(summary.partial_coverage);
	completeness->set_finalized(summary.finalized);
	completeness->set_known_workers(summary.known_workers);
	completeness->set_expected_workers(summary.expected_workers);
	return report;
}

bool ReportWriter::RenderJson(const Summary& summary, std::string* json) const {
	google::protobuf::util::JsonPrintOptions options;
	options.add_whitespace = true;
	// Zero counters are data, not absent fields
	options.always_print_primitive_fields = true;
	options.preserve_proto_field_names = true;

	json->clear();
	auto status = google::protobuf::util::MessageToJsonString(BuildReport(summary), json, options);
	if (!status.ok()) {
		LOG(ERROR) << "[ReportWriter] JSON rendering failed: " << status.ToString();
		return false;
	}
	return true;
}

std::string ReportWriter::RenderCsv(const Summary& summary) const {
	std::ostringstream out;
	out << std::fixed << std::setprecision(3);
	out << "operation,count,success,failure,success_rate,bytes,throughput_mbps,ops_per_second,"
		<< "p50_ms,p95_ms,p99_ms,mean_ms,min_ms,max_ms,stddev_ms\n";
	for (const auto& op : summary.operations) {
		CsvRow(out, op);
	}
	CsvRow(out, summary.total);
	return out.str();
}

bool ReportWriter::Write(const Summary& summary) const {
	bool ok = true;
	if (!config_.report_path.empty()) {
		std::string json;
		if (RenderJson(summary, &json) && WriteFileAtomically(config_.report_path, json)) {
			VLOG(1) << "[ReportWriter] wrote " << config_.report_path;
		} else {
			LOG(ERROR) << "[ReportWriter] could not write report to " << config_.report_path;
			ok = false;
		}
	}
	if (!config_.csv_path.empty()) {
		if (WriteFileAtomically(config_.csv_path, RenderCsv(summary))) {
			VLOG(1) << "[ReportWriter] wrote " << config_.csv_path;
		} else {
			LOG(ERROR) << "[ReportWriter] could not write CSV to " << config_.csv_path;
			ok = false;
		}
	}
	return ok;
}

} // End of namespace Chopsticks

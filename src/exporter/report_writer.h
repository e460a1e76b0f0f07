#ifndef CHOPSTICKS_EXPORTER_REPORT_WRITER_H_
#define CHOPSTICKS_EXPORTER_REPORT_WRITER_H_

#include <string>

#include <report.pb.h>

#include "common/configuration.h"
#include "metrics/summary.h"

namespace Chopsticks {

/**
 * Writes the end-of-run report: a JSON document and, when a CSV path is
 * configured, one CSV row per operation type. Both files are replaced
 * atomically so a reader never sees a half-written report.
 */
class ReportWriter {
	public:
		ReportWriter(const MetricsConfig& config, RunMetadata metadata);

		chopsticks_report::RunReportProto BuildReport(const Summary& summary) const;
		bool RenderJson(const Summary& summary, std::string* json) const;
		std::string RenderCsv(const Summary& summary) const;

		/// Writes every configured output. A failure is logged and reported
		/// through the return value; the caller retries on its next interval.
		bool Write(const Summary& summary) const;

		const std::string& report_path() const { return config_.report_path; }
		const std::string& csv_path() const { return config_.csv_path; }

	private:
		const MetricsConfig config_;
		const RunMetadata metadata_;
};

/// Writes contents to path.tmp and renames it over path
bool WriteFileAtomically(const std::string& path, const std::string& contents);

/// RFC 3339 UTC timestamp
std::string FormatTimestamp(Clock::time_point t);

} // End of namespace Chopsticks
#endif // CHOPSTICKS_EXPORTER_REPORT_WRITER_H_

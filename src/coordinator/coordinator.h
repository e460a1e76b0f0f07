#ifndef CHOPSTICKS_COORDINATOR_COORDINATOR_H_
#define CHOPSTICKS_COORDINATOR_COORDINATOR_H_

#include <memory>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "collector_service.h"
#include "common/configuration.h"
#include "exporter/metrics_http_server.h"
#include "exporter/report_writer.h"
#include "metrics/global_aggregator.h"

namespace Chopsticks {

/**
 * Owns everything on the aggregating side of a run: the GlobalAggregator,
 * the gRPC collector (multi-process runs only), the metrics endpoint, the
 * liveness sweeper and the periodic report export.
 */
class Coordinator {
	public:
		Coordinator(const MetricsConfig& config, RunMetadata metadata);
		~Coordinator();

		/// Brings up every configured surface. False when a listener could not
		/// be bound; nothing is left running in that case.
		bool Start(bool serve_grpc);

		/// Waits up to the shutdown grace for final snapshots when asked, then
		/// finalizes, stops the background threads and writes the report.
		Summary Shutdown(bool await_final_snapshots);

		GlobalAggregator& aggregator() { return aggregator_; }
		const ReportWriter& report_writer() const { return report_writer_; }

		/// Bound gRPC port, 0 when not serving
		int grpc_port() const { return grpc_port_; }
		/// Bound metrics endpoint port, 0 when disabled
		int exposition_port() const;

	private:
		void LivenessThread();
		void ReportThread();
		void StopThreads();
		bool WaitForStop(std::chrono::milliseconds interval);

		const MetricsConfig config_;
		GlobalAggregator aggregator_;
		ReportWriter report_writer_;

		std::unique_ptr<CollectorServiceImpl> service_;
		std::unique_ptr<grpc::Server> server_;
		int grpc_port_ = 0;
		std::unique_ptr<MetricsHttpServer> http_server_;

		absl::Mutex mu_;
		bool shutdown_ ABSL_GUARDED_BY(mu_) = false;
		std::thread liveness_thread_;
		std::thread report_thread_;
		bool finished_ = false;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_COORDINATOR_COORDINATOR_H_

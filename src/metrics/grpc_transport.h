#ifndef CHOPSTICKS_METRICS_GRPC_TRANSPORT_H_
#define CHOPSTICKS_METRICS_GRPC_TRANSPORT_H_

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <metrics.grpc.pb.h>

#include "snapshot_transport.h"

namespace Chopsticks {

/**
 * Ships snapshots to a remote coordinator through the SnapshotCollector
 * service. One unary call per snapshot, bounded by rpc_timeout.
 */
class GrpcSnapshotTransport : public QueuedSnapshotTransport {
	public:
		GrpcSnapshotTransport(const std::shared_ptr<grpc::Channel>& channel,
				size_t capacity, std::chrono::milliseconds rpc_timeout);
		~GrpcSnapshotTransport() override;

		/// Convenience: insecure channel to host:port
		static std::unique_ptr<GrpcSnapshotTransport> Connect(const std::string& address,
				size_t capacity, std::chrono::milliseconds rpc_timeout);

	protected:
		bool Deliver(const WorkerSnapshot& snapshot) override;

	private:
		std::unique_ptr<chopsticks_metrics::SnapshotCollector::Stub> stub_;
		const std::chrono::milliseconds rpc_timeout_;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_GRPC_TRANSPORT_H_

#ifndef CHOPSTICKS_COORDINATOR_COLLECTOR_SERVICE_H_
#define CHOPSTICKS_COORDINATOR_COLLECTOR_SERVICE_H_

#include <grpcpp/grpcpp.h>
#include <metrics.grpc.pb.h>

#include "metrics/global_aggregator.h"

namespace Chopsticks {

using grpc::ServerContext;
using grpc::Status;
using chopsticks_metrics::PushSnapshotReply;
using chopsticks_metrics::SnapshotCollector;
using chopsticks_metrics::WorkerSnapshotProto;

/// Receives worker snapshots and hands them to the GlobalAggregator
class CollectorServiceImpl final : public SnapshotCollector::Service {
	public:
		explicit CollectorServiceImpl(GlobalAggregator& aggregator)
			: aggregator_(aggregator) {}

		Status PushSnapshot(ServerContext* context, const WorkerSnapshotProto* request,
				PushSnapshotReply* reply) override;

	private:
		GlobalAggregator& aggregator_;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_COORDINATOR_COLLECTOR_SERVICE_H_

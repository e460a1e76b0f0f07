#include "collector_service.h"

#include <string>

#include <glog/logging.h>

#include "metrics/snapshot_codec.h"

namespace Chopsticks {

Status CollectorServiceImpl::PushSnapshot(ServerContext* context,
		const WorkerSnapshotProto* request, PushSnapshotReply* reply) {
	WorkerSnapshot snapshot;
	std::string error;
	if (!DecodeSnapshot(*request, &snapshot, &error)) {
		// Malformed payloads are answered, not failed, so the worker does not
		// mistake them for transport trouble
		VLOG(1) << "[CollectorServiceImpl] undecodable snapshot from " << context->peer();
		aggregator_.CountRejected(request->worker_id(), error);
		reply->set_status(chopsticks_metrics::REJECTED);
		reply->set_stored_sequence(aggregator_.StoredSequence(request->worker_id()));
		reply->set_message(error);
		return Status::OK;
	}

	ApplyResult result = aggregator_.Apply(snapshot);
	switch (result) {
		case ApplyResult::kAccepted:
			reply->set_status(chopsticks_metrics::ACCEPTED);
			break;
		case ApplyResult::kDuplicate:
			reply->set_status(chopsticks_metrics::DUPLICATE);
			break;
		case ApplyResult::kRejected:
			reply->set_status(chopsticks_metrics::REJECTED);
			reply->set_message("snapshot rejected, check worker id and bucket layout");
			break;
	}
	reply->set_stored_sequence(aggregator_.StoredSequence(snapshot.worker_id));
	return Status::OK;
}

} // End of namespace Chopsticks

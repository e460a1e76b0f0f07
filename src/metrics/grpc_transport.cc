#include "grpc_transport.h"

#include <glog/logging.h>

#include "snapshot_codec.h"

namespace Chopsticks {

using chopsticks_metrics::PushSnapshotReply;
using chopsticks_metrics::SnapshotCollector;
using chopsticks_metrics::WorkerSnapshotProto;

GrpcSnapshotTransport::GrpcSnapshotTransport(const std::shared_ptr<grpc::Channel>& channel,
		size_t capacity, std::chrono::milliseconds rpc_timeout)
	: QueuedSnapshotTransport(capacity),
	stub_(SnapshotCollector::NewStub(channel)),
	rpc_timeout_(rpc_timeout) {
		StartDelivery();
	}

GrpcSnapshotTransport::~GrpcSnapshotTransport() {
	Stop();
}

std::unique_ptr<GrpcSnapshotTransport> GrpcSnapshotTransport::Connect(const std::string& address,
		size_t capacity, std::chrono::milliseconds rpc_timeout) {
	LOG(INFO) << "[GrpcSnapshotTransport] coordinator at " << address;
	return std::make_unique<GrpcSnapshotTransport>(
			grpc::CreateChannel(address, grpc::InsecureChannelCredentials()),
			capacity, rpc_timeout);
}

bool GrpcSnapshotTransport::Deliver(const WorkerSnapshot& snapshot) {
	WorkerSnapshotProto request;
	EncodeSnapshot(snapshot, &request);

	PushSnapshotReply reply;
	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);

	grpc::Status status = stub_->PushSnapshot(&context, request, &reply);
	if (!status.ok()) {
		LOG_EVERY_N(WARNING, 10) << "[GrpcSnapshotTransport] PushSnapshot "
			<< snapshot.worker_id << "#" << snapshot.sequence << " failed: "
			<< status.error_code() << " " << status.error_message();
		return false;
	}

	switch (reply.status()) {
		case chopsticks_metrics::ACCEPTED:
			VLOG(3) << "[GrpcSnapshotTransport] " << snapshot.worker_id << "#" << snapshot.sequence << " accepted";
			break;
		case chopsticks_metrics::DUPLICATE:
			VLOG(2) << "[GrpcSnapshotTransport] " << snapshot.worker_id << "#" << snapshot.sequence
				<< " duplicate, coordinator holds #" << reply.stored_sequence();
			break;
		case chopsticks_metrics::REJECTED:
			// Layout mismatches do not heal by resending
			LOG(ERROR) << "[GrpcSnapshotTransport] coordinator rejected " << snapshot.worker_id
				<< "#" << snapshot.sequence << ": " << reply.message();
			break;
		default:
			LOG(ERROR) << "[GrpcSnapshotTransport] unexpected reply status " << reply.status();
			break;
	}
	return true;
}

} // End of namespace Chopsticks

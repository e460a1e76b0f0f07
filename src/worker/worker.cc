#include "worker.h"

#include <glog/logging.h>

namespace Chopsticks {

Worker::Worker(const MetricsConfig& config, std::string worker_id, SnapshotTransport& transport)
	: shutdown_grace_(config.shutdown_grace),
	transport_(transport),
	recorder_(config, std::move(worker_id)),
	aggregator_(config, recorder_, transport_) {}

Worker::~Worker() {
	Stop();
}

void Worker::Start() {
	LOG(INFO) << "[Worker] " << worker_id() << " started";
	aggregator_.Start();
}

bool Worker::Stop() {
	if (stopped_) {
		return true;
	}
	stopped_ = true;
	aggregator_.Stop();
	bool drained = transport_.Drain(shutdown_grace_);
	if (!drained) {
		LOG(WARNING) << "[Worker] " << worker_id() << " could not deliver every snapshot within "
			<< shutdown_grace_.count() << "ms";
	}
	LOG(INFO) << "[Worker] " << worker_id() << " stopped after "
		<< aggregator_.LastSequence() << " snapshots, " << transport_.DroppedSnapshots() << " dropped";
	return drained;
}

} // End of namespace Chopsticks

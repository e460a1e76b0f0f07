#include "snapshot_transport.h"

#include <glog/logging.h>

namespace Chopsticks {

const char* ApplyResultName(ApplyResult result) {
	switch (result) {
		case ApplyResult::kAccepted: return "accepted";
		case ApplyResult::kDuplicate: return "duplicate";
		case ApplyResult::kRejected: return "rejected";
	}
	return "invalid";
}

//----------------------------------------------------------------------------
// QueuedSnapshotTransport
//----------------------------------------------------------------------------

QueuedSnapshotTransport::QueuedSnapshotTransport(size_t capacity)
	: capacity_(capacity > 0 ? capacity : 1),
	queue_(capacity_) {}

QueuedSnapshotTransport::~QueuedSnapshotTransport() {
	// Subclasses stop delivery before their Deliver() goes away
	if (delivery_thread_.joinable()) {
		LOG(ERROR) << "[QueuedSnapshotTransport] destroyed without Stop()";
		Stop();
	}
}

void QueuedSnapshotTransport::StartDelivery() {
	delivery_thread_ = std::thread(&QueuedSnapshotTransport::DeliveryThread, this);
}

void QueuedSnapshotTransport::Send(const WorkerSnapshot& snapshot) {
	if (stopped_.load(std::memory_order_acquire)) {
		CountDrop("transport stopped");
		return;
	}

	pending_.fetch_add(1, std::memory_order_acq_rel);
	std::optional<WorkerSnapshot> item(snapshot);
	while (!queue_.write(item)) {
		// Full: make room by discarding the oldest pending snapshot. The next
		// cumulative snapshot supersedes it anyway.
		std::optional<WorkerSnapshot> oldest;
		if (queue_.read(oldest)) {
			if (oldest.has_value()) {
				pending_.fetch_sub(1, std::memory_order_acq_rel);
				CountDrop("outbound queue full");
			} else {
				// Raced with Stop(); put the sentinel back and give up
				queue_.blockingWrite(std::nullopt);
				pending_.fetch_sub(1, std::memory_order_acq_rel);
				CountDrop("transport stopped");
				return;
			}
		}
	}
	VLOG(3) << "[QueuedSnapshotTransport] queued " << snapshot.worker_id << "#" << snapshot.sequence;
}

bool QueuedSnapshotTransport::Drain(std::chrono::milliseconds grace) {
	auto deadline = std::chrono::steady_clock::now() + grace;
	while (pending_.load(std::memory_order_acquire) > 0) {
		if (std::chrono::steady_clock::now() >= deadline) {
			LOG(WARNING) << "[QueuedSnapshotTransport] drain timed out with "
				<< pending_.load() << " snapshots pending";
			return false;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	return true;
}

void QueuedSnapshotTransport::Stop() {
	if (stopped_.exchange(true, std::memory_order_acq_rel)) {
		return;
	}
	if (delivery_thread_.joinable()) {
		queue_.blockingWrite(std::nullopt);
		delivery_thread_.join();
	}
	VLOG(1) << "[QueuedSnapshotTransport] stopped, delivered=" << DeliveredSnapshots()
		<< " dropped=" << DroppedSnapshots();
}

void QueuedSnapshotTransport::DeliveryThread() {
	std::optional<WorkerSnapshot> item;
	while (true) {
		queue_.blockingRead(item);
		if (!item.has_value()) {
			break;
		}
		if (stopped_.load(std::memory_order_acquire)) {
			CountDrop("transport stopped");
		} else if (Deliver(*item)) {
			delivered_.fetch_add(1, std::memory_order_relaxed);
		} else {
			CountDrop("delivery failed");
		}
		pending_.fetch_sub(1, std::memory_order_acq_rel);
	}
}

void QueuedSnapshotTransport::CountDrop(const char* reason) {
	uint64_t dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
	LOG_EVERY_N(WARNING, 10) << "[QueuedSnapshotTransport] dropped snapshot (" << reason
		<< "), total dropped=" << dropped;
}

//----------------------------------------------------------------------------
// InProcessTransport
//----------------------------------------------------------------------------

InProcessTransport::InProcessTransport(SnapshotSink& sink, size_t capacity)
	: QueuedSnapshotTransport(capacity),
	sink_(sink) {
		StartDelivery();
	}

InProcessTransport::~InProcessTransport() {
	Stop();
}

bool InProcessTransport::Deliver(const WorkerSnapshot& snapshot) {
	ApplyResult result = sink_.Apply(snapshot);
	VLOG(3) << "[InProcessTransport] " << snapshot.worker_id << "#" << snapshot.sequence
		<< " " << ApplyResultName(result);
	return true;
}

} // End of namespace Chopsticks

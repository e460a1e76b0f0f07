#ifndef CHOPSTICKS_METRICS_SNAPSHOT_TRANSPORT_H_
#define CHOPSTICKS_METRICS_SNAPSHOT_TRANSPORT_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>

#include "folly/MPMCQueue.h"

#include "snapshot_sink.h"
#include "worker_snapshot.h"

namespace Chopsticks {

/**
 * Carries snapshots from a worker to the coordinator. Delivery is
 * at-least-once and may reorder; the receiving aggregator sorts that out.
 */
class SnapshotTransport {
	public:
		virtual ~SnapshotTransport() = default;

		/// Never blocks. When the outbound queue is full the oldest pending
		/// snapshot is dropped and counted.
		virtual void Send(const WorkerSnapshot& snapshot) = 0;

		/// Waits until everything queued so far was handed off, at most grace.
		/// Returns false when the grace period ran out first.
		virtual bool Drain(std::chrono::milliseconds grace) = 0;

		/// Stops delivery. Snapshots still queued are dropped and counted.
		virtual void Stop() = 0;

		virtual uint64_t DroppedSnapshots() const = 0;
};

/**
 * Bounded drop-oldest queue drained by one delivery thread. Subclasses
 * implement Deliver(), call StartDelivery() at the end of their constructor
 * and Stop() in their destructor.
 */
class QueuedSnapshotTransport : public SnapshotTransport {
	public:
		explicit QueuedSnapshotTransport(size_t capacity);
		~QueuedSnapshotTransport() override;

		void Send(const WorkerSnapshot& snapshot) override;
		bool Drain(std::chrono::milliseconds grace) override;
		void Stop() override;

		uint64_t DroppedSnapshots() const override { return dropped_.load(std::memory_order_relaxed); }
		uint64_t DeliveredSnapshots() const { return delivered_.load(std::memory_order_relaxed); }
		size_t capacity() const { return capacity_; }

	protected:
		void StartDelivery();

		/// False when the snapshot could not be handed off. It is then counted
		/// as dropped and never retried.
		virtual bool Deliver(const WorkerSnapshot& snapshot) = 0;

	private:
		void DeliveryThread();
		void CountDrop(const char* reason);

		const size_t capacity_;
		// nullopt is the shutdown sentinel
		folly::MPMCQueue<std::optional<WorkerSnapshot>> queue_;
		std::thread delivery_thread_;

		std::atomic<uint64_t> dropped_{0};
		std::atomic<uint64_t> delivered_{0};
		// Queued plus in-flight snapshots
		std::atomic<int64_t> pending_{0};
		std::atomic<bool> stopped_{false};
};

/// Single-process handoff straight into a local aggregator
class InProcessTransport : public QueuedSnapshotTransport {
	public:
		InProcessTransport(SnapshotSink& sink, size_t capacity);
		~InProcessTransport() override;

	protected:
		bool Deliver(const WorkerSnapshot& snapshot) override;

	private:
		SnapshotSink& sink_;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_SNAPSHOT_TRANSPORT_H_

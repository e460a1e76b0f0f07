#ifndef CHOPSTICKS_METRICS_SNAPSHOT_SINK_H_
#define CHOPSTICKS_METRICS_SNAPSHOT_SINK_H_

#include "worker_snapshot.h"

namespace Chopsticks {

enum class ApplyResult {
	kAccepted,
	// Sequence not newer than the stored one; expected under at-least-once delivery
	kDuplicate,
	// Foreign bucket layout or missing worker id
	kRejected,
};

const char* ApplyResultName(ApplyResult result);

/// Receiving end of the snapshot transport
class SnapshotSink {
	public:
		virtual ~SnapshotSink() = default;
		virtual ApplyResult Apply(const WorkerSnapshot& snapshot) = 0;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_SNAPSHOT_SINK_H_

#ifndef CHOPSTICKS_METRICS_SNAPSHOT_CODEC_H_
#define CHOPSTICKS_METRICS_SNAPSHOT_CODEC_H_

#include <string>

#include <metrics.pb.h>

#include "worker_snapshot.h"

namespace Chopsticks {

void EncodeSnapshot(const WorkerSnapshot& snapshot, chopsticks_metrics::WorkerSnapshotProto* proto);

/// Returns false and fills error on unknown operation or failure-kind names,
/// on histograms whose size does not match the bucket bounds, and on
/// operations whose counters contradict each other.
bool DecodeSnapshot(const chopsticks_metrics::WorkerSnapshotProto& proto,
		WorkerSnapshot* snapshot, std::string* error);

int64_t ToMicros(Clock::time_point t);
Clock::time_point FromMicros(int64_t us);

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_SNAPSHOT_CODEC_H_

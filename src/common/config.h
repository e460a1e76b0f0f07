#ifndef CHOPSTICKS_COMMON_CONFIG_H_
#define CHOPSTICKS_COMMON_CONFIG_H_

#include <cstddef>
#include <cstdint>

/// Snapshot cadence
/// The interval between two local snapshots taken by a worker
const int kDefaultFlushIntervalMs = 1000;
/// A worker with no accepted snapshot for this long is stale
const int kDefaultSilenceTimeoutMs = 10000;
/// How often the coordinator sweeps worker liveness
const int kDefaultLivenessCheckIntervalMs = 1000;
/// Bounded wait for final snapshots at shutdown
const int kDefaultShutdownGraceMs = 5000;

/// Transport configs
/// Pending snapshots a worker keeps before dropping the oldest one
const size_t kDefaultOutboundQueueCapacity = 8;
/// Deadline for a single PushSnapshot RPC
const int kDefaultRpcTimeoutMs = 2000;
const char kDefaultCoordinatorAddress[] = "127.0.0.1:9645";

/// Exposition configs
const char kDefaultExpositionHost[] = "0.0.0.0";
const int kDefaultExpositionPort = 9646;
const char kDefaultReportPath[] = "chopsticks_report.json";

/// Recorder configs
const size_t kDefaultRecorderShards = 64;
/// Records with a longer duration are treated as malformed
const int kDefaultMaxLatencyMs = 3600 * 1000;

/// Default latency bucket scheme: log-scale from 1us to 60s,
/// four buckets per doubling, rounded to whole microseconds.
const size_t kDefaultHistogramMinUs = 1;
const size_t kDefaultHistogramMaxUs = 60ULL * 1000 * 1000;
const int kDefaultBucketsPerDoubling = 4;

#endif // CHOPSTICKS_COMMON_CONFIG_H_

#ifndef CHOPSTICKS_TEST_EXPORTER_TEST_UTIL_H_
#define CHOPSTICKS_TEST_EXPORTER_TEST_UTIL_H_

#include <chrono>

#include "../../src/metrics/global_aggregator.h"

namespace Chopsticks {

// Two workers: one finished with uploads, one silent with downloads
inline Summary MakeSampleSummary(const MetricsConfig& config, bool finalize) {
    using namespace std::chrono_literals;
    BucketLayout layout(config.bucket_bounds_us);
    Clock::time_point start = Clock::now();
    GlobalAggregator aggregator(config, start);

    WorkerSnapshot a;
    a.worker_id = "worker-a";
    a.sequence = 5;
    a.bucket_bounds_us = config.bucket_bounds_us;
    a.is_final = true;
    OperationTotals& upload = a.operations[Index(OperationType::kUpload)];
    upload.latency[0] = Histogram(layout);
    upload.latency[1] = Histogram(layout);
    upload.count = 4;
    upload.success = 3;
    upload.failure = 1;
    upload.bytes = 3000000;
    upload.failures_by_kind[Index(FailureKind::kTimeout)] = 1;
    upload.latency[0].Observe(layout, 500);
    upload.latency[0].Observe(layout, 1500);
    upload.latency[0].Observe(layout, 2500);
    upload.latency[1].Observe(layout, 90000);
    a.invalid_records = 2;

    WorkerSnapshot b;
    b.worker_id = "worker-b";
    b.sequence = 2;
    b.bucket_bounds_us = config.bucket_bounds_us;
    b.dropped_snapshots = 1;
    OperationTotals& download = b.operations[Index(OperationType::kDownload)];
    download.latency[0] = Histogram(layout);
    download.latency[1] = Histogram(layout);
    download.count = 2;
    download.success = 2;
    download.bytes = 1000000;
    download.latency[0].Observe(layout, 800);
    download.latency[0].Observe(layout, 1200);

    aggregator.ApplyAt(a, start + 1s);
    aggregator.ApplyAt(b, start + 1s);
    aggregator.ApplyAt(b, start + 1s);
    if (finalize) {
        return aggregator.Finalize(start + 2s);
    }
    return aggregator.Summarize(start + 2s);
}

} // End of namespace Chopsticks
#endif // CHOPSTICKS_TEST_EXPORTER_TEST_UTIL_H_

#ifndef CHOPSTICKS_CONFIGURATION_H_
#define CHOPSTICKS_CONFIGURATION_H_

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/config.h"

namespace Chopsticks {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Raw configuration as loaded from YAML and the environment
 */
struct ChopsticksConfig {
    struct Metrics {
        ConfigValue<int> flush_interval_ms{kDefaultFlushIntervalMs, "CHOPSTICKS_FLUSH_INTERVAL_MS"};
        ConfigValue<int> silence_timeout_ms{kDefaultSilenceTimeoutMs, "CHOPSTICKS_SILENCE_TIMEOUT_MS"};
        ConfigValue<int> liveness_check_interval_ms{kDefaultLivenessCheckIntervalMs, "CHOPSTICKS_LIVENESS_CHECK_MS"};
        ConfigValue<int> shutdown_grace_ms{kDefaultShutdownGraceMs, "CHOPSTICKS_SHUTDOWN_GRACE_MS"};
        ConfigValue<size_t> recorder_shards{kDefaultRecorderShards, "CHOPSTICKS_RECORDER_SHARDS"};
        ConfigValue<int> max_latency_ms{kDefaultMaxLatencyMs, "CHOPSTICKS_MAX_LATENCY_MS"};
    } metrics;

    // Latency buckets. An explicit bounds_us list wins over the log-scale scheme.
    struct Histogram {
        ConfigValue<size_t> min_us{kDefaultHistogramMinUs, "CHOPSTICKS_HISTOGRAM_MIN_US"};
        ConfigValue<size_t> max_us{kDefaultHistogramMaxUs, "CHOPSTICKS_HISTOGRAM_MAX_US"};
        ConfigValue<int> buckets_per_doubling{kDefaultBucketsPerDoubling, "CHOPSTICKS_BUCKETS_PER_DOUBLING"};
        std::vector<uint64_t> bounds_us;
    } histogram;

    struct Transport {
        ConfigValue<std::string> coordinator_address{kDefaultCoordinatorAddress, "CHOPSTICKS_COORDINATOR_ADDRESS"};
        ConfigValue<size_t> queue_capacity{kDefaultOutboundQueueCapacity, "CHOPSTICKS_QUEUE_CAPACITY"};
        ConfigValue<int> rpc_timeout_ms{kDefaultRpcTimeoutMs, "CHOPSTICKS_RPC_TIMEOUT_MS"};
        // 0 means unknown; the summary is only flagged partial when this is set
        ConfigValue<int> expected_workers{0, "CHOPSTICKS_EXPECTED_WORKERS"};
    } transport;

    struct Exposition {
        ConfigValue<bool> enabled{true, "CHOPSTICKS_EXPOSITION_ENABLED"};
        ConfigValue<std::string> host{kDefaultExpositionHost, "CHOPSTICKS_EXPOSITION_HOST"};
        ConfigValue<int> port{kDefaultExpositionPort, "CHOPSTICKS_EXPOSITION_PORT"};
    } exposition;

    struct Report {
        ConfigValue<std::string> path{kDefaultReportPath, "CHOPSTICKS_REPORT_PATH"};
        ConfigValue<std::string> csv_path{"", "CHOPSTICKS_CSV_PATH"};
        // 0 disables periodic export; the report is still written at the end
        ConfigValue<int> interval_s{0, "CHOPSTICKS_REPORT_INTERVAL_S"};
    } report;

    // Run metadata, copied into the report verbatim
    struct Run {
        ConfigValue<std::string> scenario{"synthetic", "CHOPSTICKS_SCENARIO"};
        ConfigValue<std::string> endpoint{"http://localhost:9000", "CHOPSTICKS_S3_ENDPOINT"};
        ConfigValue<std::string> driver{"synthetic", "CHOPSTICKS_DRIVER"};
        ConfigValue<int> duration_s{60, "CHOPSTICKS_DURATION_S"};
        ConfigValue<int> clients{8, "CHOPSTICKS_CLIENTS"};
        ConfigValue<double> failure_ratio{0.01, "CHOPSTICKS_FAILURE_RATIO"};
        std::map<std::string, std::string> parameters;
    } run;
};

/**
 * Frozen options consumed by the metrics core. Built once after validation.
 */
struct MetricsConfig {
    std::chrono::milliseconds flush_interval{kDefaultFlushIntervalMs};
    std::chrono::milliseconds silence_timeout{kDefaultSilenceTimeoutMs};
    std::chrono::milliseconds liveness_check_interval{kDefaultLivenessCheckIntervalMs};
    std::chrono::milliseconds shutdown_grace{kDefaultShutdownGraceMs};
    std::chrono::milliseconds rpc_timeout{kDefaultRpcTimeoutMs};
    std::chrono::milliseconds max_latency{kDefaultMaxLatencyMs};

    std::vector<uint64_t> bucket_bounds_us;

    std::string coordinator_address = kDefaultCoordinatorAddress;
    size_t outbound_queue_capacity = kDefaultOutboundQueueCapacity;
    int expected_workers = 0;

    bool exposition_enabled = true;
    std::string exposition_host = kDefaultExpositionHost;
    int exposition_port = kDefaultExpositionPort;

    std::string report_path = kDefaultReportPath;
    std::string csv_path;
    std::chrono::seconds report_interval{0};

    size_t recorder_shards = kDefaultRecorderShards;
};

struct RunMetadata {
    std::string run_id;
    std::string scenario;
    std::string endpoint;
    std::string driver;
    int duration_s = 0;
    int clients = 0;
    double failure_ratio = 0.0;
    std::map<std::string, std::string> parameters;
};

/**
 * Loads, validates and freezes the configuration. One instance per process,
 * owned by main() and discarded once the frozen structures are built.
 */
class Configuration {
public:
    Configuration() = default;

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    const ChopsticksConfig& config() const { return config_; }
    ChopsticksConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Effective latency bucket bounds (explicit list or generated scheme)
    std::vector<uint64_t> bucketBounds() const;

    MetricsConfig buildMetricsConfig() const;
    RunMetadata buildRunMetadata(const std::string& run_id) const;

private:
    ChopsticksConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Chopsticks

#endif // CHOPSTICKS_CONFIGURATION_H_

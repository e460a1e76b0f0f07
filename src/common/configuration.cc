#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "metrics/histogram.h"

namespace Chopsticks {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

namespace {

void applyYamlRoot(const YAML::Node& root, ChopsticksConfig& config) {
    // Metrics
    if (root["metrics"]) {
        auto metrics = root["metrics"];
        if (metrics["flush_interval_ms"]) config.metrics.flush_interval_ms.set(metrics["flush_interval_ms"].as<int>());
        if (metrics["silence_timeout_ms"]) config.metrics.silence_timeout_ms.set(metrics["silence_timeout_ms"].as<int>());
        if (metrics["liveness_check_interval_ms"]) config.metrics.liveness_check_interval_ms.set(metrics["liveness_check_interval_ms"].as<int>());
        if (metrics["shutdown_grace_ms"]) config.metrics.shutdown_grace_ms.set(metrics["shutdown_grace_ms"].as<int>());
        if (metrics["recorder_shards"]) config.metrics.recorder_shards.set(metrics["recorder_shards"].as<size_t>());
        if (metrics["max_latency_ms"]) config.metrics.max_latency_ms.set(metrics["max_latency_ms"].as<int>());
    }

    // Histogram
    if (root["histogram"]) {
        auto histogram = root["histogram"];
        if (histogram["min_us"]) config.histogram.min_us.set(histogram["min_us"].as<size_t>());
        if (histogram["max_us"]) config.histogram.max_us.set(histogram["max_us"].as<size_t>());
        if (histogram["buckets_per_doubling"]) config.histogram.buckets_per_doubling.set(histogram["buckets_per_doubling"].as<int>());
        if (histogram["bounds_us"]) {
            config.histogram.bounds_us.clear();
            for (const auto& bound : histogram["bounds_us"]) {
                config.histogram.bounds_us.push_back(bound.as<uint64_t>());
            }
        }
    }

    // Transport
    if (root["transport"]) {
        auto transport = root["transport"];
        if (transport["coordinator_address"]) config.transport.coordinator_address.set(transport["coordinator_address"].as<std::string>());
        if (transport["queue_capacity"]) config.transport.queue_capacity.set(transport["queue_capacity"].as<size_t>());
        if (transport["rpc_timeout_ms"]) config.transport.rpc_timeout_ms.set(transport["rpc_timeout_ms"].as<int>());
        if (transport["expected_workers"]) config.transport.expected_workers.set(transport["expected_workers"].as<int>());
    }

    // Exposition
    if (root["exposition"]) {
        auto exposition = root["exposition"];
        if (exposition["enabled"]) config.exposition.enabled.set(exposition["enabled"].as<bool>());
        if (exposition["host"]) config.exposition.host.set(exposition["host"].as<std::string>());
        if (exposition["port"]) config.exposition.port.set(exposition["port"].as<int>());
    }

    // Report
    if (root["report"]) {
        auto report = root["report"];
        if (report["path"]) config.report.path.set(report["path"].as<std::string>());
        if (report["csv_path"]) config.report.csv_path.set(report["csv_path"].as<std::string>());
        if (report["interval_s"]) config.report.interval_s.set(report["interval_s"].as<int>());
    }

    // Run
    if (root["run"]) {
        auto run = root["run"];
        if (run["scenario"]) config.run.scenario.set(run["scenario"].as<std::string>());
        if (run["endpoint"]) config.run.endpoint.set(run["endpoint"].as<std::string>());
        if (run["driver"]) config.run.driver.set(run["driver"].as<std::string>());
        if (run["duration_s"]) config.run.duration_s.set(run["duration_s"].as<int>());
        if (run["clients"]) config.run.clients.set(run["clients"].as<int>());
        if (run["failure_ratio"]) config.run.failure_ratio.set(run["failure_ratio"].as<double>());
        if (run["parameters"]) {
            for (const auto& entry : run["parameters"]) {
                config.run.parameters[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }
    }
}

bool applyYaml(const YAML::Node& yaml, ChopsticksConfig& config) {
    if (!yaml["chopsticks"]) {
        LOG(ERROR) << "Configuration has no 'chopsticks' section";
        return false;
    }
    applyYamlRoot(yaml["chopsticks"], config);
    return true;
}

} // namespace

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (!applyYaml(yaml, config_)) {
            LOG(ERROR) << "Failed to load configuration file " << filename;
            return false;
        }
        LOG(INFO) << "Loaded configuration from " << filename;
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return applyYaml(yaml, config_);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Intervals
    const int flush_ms = config_.metrics.flush_interval_ms.get();
    if (flush_ms < 1) {
        validation_errors_.push_back("Flush interval must be at least 1ms");
    }
    if (config_.metrics.silence_timeout_ms.get() <= flush_ms) {
        validation_errors_.push_back("Silence timeout must be longer than the flush interval");
    }
    if (config_.metrics.liveness_check_interval_ms.get() < 1) {
        validation_errors_.push_back("Liveness check interval must be at least 1ms");
    }
    if (config_.metrics.shutdown_grace_ms.get() < 0) {
        validation_errors_.push_back("Shutdown grace must not be negative");
    }
    if (config_.metrics.recorder_shards.get() < 1) {
        validation_errors_.push_back("Recorder shards must be at least 1");
    }
    if (config_.metrics.max_latency_ms.get() < 1) {
        validation_errors_.push_back("Maximum accepted latency must be at least 1ms");
    }

    // Buckets
    std::string bounds_error;
    if (config_.histogram.bounds_us.empty()) {
        if (config_.histogram.min_us.get() < 1 || config_.histogram.max_us.get() <= config_.histogram.min_us.get()) {
            validation_errors_.push_back("Histogram range must satisfy 1 <= min_us < max_us");
        }
        if (config_.histogram.buckets_per_doubling.get() < 1 || config_.histogram.buckets_per_doubling.get() > 64) {
            validation_errors_.push_back("Buckets per doubling must be between 1 and 64");
        }
    } else if (!ValidateBounds(config_.histogram.bounds_us, &bounds_error)) {
        validation_errors_.push_back(bounds_error);
    }

    // Transport
    const std::string address = config_.transport.coordinator_address.get();
    if (address.empty() || address.find(':') == std::string::npos) {
        validation_errors_.push_back("Coordinator address must be host:port");
    }
    if (config_.transport.queue_capacity.get() < 1) {
        validation_errors_.push_back("Outbound queue capacity must be at least 1");
    }
    if (config_.transport.rpc_timeout_ms.get() < 1) {
        validation_errors_.push_back("RPC timeout must be at least 1ms");
    }
    if (config_.transport.expected_workers.get() < 0) {
        validation_errors_.push_back("Expected workers must not be negative");
    }

    // Exposition; port 0 binds an ephemeral port
    if (config_.exposition.port.get() < 0 || config_.exposition.port.get() > 65535) {
        validation_errors_.push_back("Exposition port must be between 0 and 65535");
    }
    if (config_.exposition.host.get().empty()) {
        validation_errors_.push_back("Exposition host must not be empty");
    }

    // Report
    if (config_.report.interval_s.get() < 0) {
        validation_errors_.push_back("Report interval must not be negative");
    }

    // Run
    if (config_.run.duration_s.get() < 0) {
        validation_errors_.push_back("Run duration must not be negative");
    }
    if (config_.run.clients.get() < 1) {
        validation_errors_.push_back("Clients must be at least 1");
    }
    const double ratio = config_.run.failure_ratio.get();
    if (ratio < 0.0 || ratio > 1.0) {
        validation_errors_.push_back("Failure ratio must be between 0 and 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

std::vector<uint64_t> Configuration::bucketBounds() const {
    if (!config_.histogram.bounds_us.empty()) {
        return config_.histogram.bounds_us;
    }
    return MakeLogScaleBounds(config_.histogram.min_us.get(), config_.histogram.max_us.get(),
            config_.histogram.buckets_per_doubling.get());
}

MetricsConfig Configuration::buildMetricsConfig() const {
    MetricsConfig mc;
    mc.flush_interval = std::chrono::milliseconds(config_.metrics.flush_interval_ms.get());
    mc.silence_timeout = std::chrono::milliseconds(config_.metrics.silence_timeout_ms.get());
    mc.liveness_check_interval = std::chrono::milliseconds(config_.metrics.liveness_check_interval_ms.get());
    mc.shutdown_grace = std::chrono::milliseconds(config_.metrics.shutdown_grace_ms.get());
    mc.rpc_timeout = std::chrono::milliseconds(config_.transport.rpc_timeout_ms.get());
    mc.max_latency = std::chrono::milliseconds(config_.metrics.max_latency_ms.get());
    mc.bucket_bounds_us = bucketBounds();
    mc.coordinator_address = config_.transport.coordinator_address.get();
    mc.outbound_queue_capacity = config_.transport.queue_capacity.get();
    mc.expected_workers = config_.transport.expected_workers.get();
    mc.exposition_enabled = config_.exposition.enabled.get();
    mc.exposition_host = config_.exposition.host.get();
    mc.exposition_port = config_.exposition.port.get();
    mc.report_path = config_.report.path.get();
    mc.csv_path = config_.report.csv_path.get();
    mc.report_interval = std::chrono::seconds(config_.report.interval_s.get());
    mc.recorder_shards = config_.metrics.recorder_shards.get();
    return mc;
}

RunMetadata Configuration::buildRunMetadata(const std::string& run_id) const {
    RunMetadata md;
    md.run_id = run_id;
    md.scenario = config_.run.scenario.get();
    md.endpoint = config_.run.endpoint.get();
    md.driver = config_.run.driver.get();
    md.duration_s = config_.run.duration_s.get();
    md.clients = config_.run.clients.get();
    md.failure_ratio = config_.run.failure_ratio.get();
    md.parameters = config_.run.parameters;
    return md;
}

} // namespace Chopsticks

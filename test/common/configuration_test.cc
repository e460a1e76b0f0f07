#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace Chopsticks;

class ConfigurationTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("CHOPSTICKS_FLUSH_INTERVAL_MS");
        unsetenv("CHOPSTICKS_EXPOSITION_ENABLED");
        unsetenv("CHOPSTICKS_QUEUE_CAPACITY");
    }

    static bool HasError(const Configuration& config, const std::string& fragment) {
        auto errors = config.getValidationErrors();
        return std::any_of(errors.begin(), errors.end(), [&](const std::string& e) {
            return e.find(fragment) != std::string::npos;
        });
    }
};

TEST_F(ConfigurationTest, DefaultsAreValid) {
    Configuration config;
    EXPECT_TRUE(config.validate());

    MetricsConfig mc = config.buildMetricsConfig();
    EXPECT_EQ(mc.flush_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(mc.silence_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(mc.outbound_queue_capacity, 8u);
    EXPECT_EQ(mc.coordinator_address, "127.0.0.1:9645");
    EXPECT_EQ(mc.report_interval, std::chrono::seconds(0));
    ASSERT_FALSE(mc.bucket_bounds_us.empty());
    EXPECT_EQ(mc.bucket_bounds_us.front(), 1u);
    EXPECT_EQ(mc.bucket_bounds_us.back(), 60000000u);
}

TEST_F(ConfigurationTest, LoadsYaml) {
    Configuration config;
    ASSERT_TRUE(config.loadFromString(R"(
chopsticks:
  metrics:
    flush_interval_ms: 250
    silence_timeout_ms: 3000
  histogram:
    bounds_us: [100, 1000, 10000]
  transport:
    coordinator_address: "10.0.0.5:7000"
    queue_capacity: 16
    expected_workers: 4
  exposition:
    enabled: false
    port: 0
  report:
    path: /tmp/out.json
    csv_path: /tmp/out.csv
    interval_s: 30
  run:
    scenario: mixed_workload
    clients: 32
    parameters:
      bucket: stress
      object_size: 4MiB
)"));
    ASSERT_TRUE(config.validate());

    MetricsConfig mc = config.buildMetricsConfig();
    EXPECT_EQ(mc.flush_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(mc.silence_timeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(mc.bucket_bounds_us, (std::vector<uint64_t>{100, 1000, 10000}));
    EXPECT_EQ(mc.coordinator_address, "10.0.0.5:7000");
    EXPECT_EQ(mc.outbound_queue_capacity, 16u);
    EXPECT_EQ(mc.expected_workers, 4);
    EXPECT_FALSE(mc.exposition_enabled);
    EXPECT_EQ(mc.exposition_port, 0);
    EXPECT_EQ(mc.csv_path, "/tmp/out.csv");
    EXPECT_EQ(mc.report_interval, std::chrono::seconds(30));

    RunMetadata md = config.buildRunMetadata("run-1");
    EXPECT_EQ(md.run_id, "run-1");
    EXPECT_EQ(md.scenario, "mixed_workload");
    EXPECT_EQ(md.clients, 32);
    EXPECT_EQ(md.parameters.at("object_size"), "4MiB");
}

TEST_F(ConfigurationTest, RejectsMissingRootAndBadYaml) {
    Configuration config;
    EXPECT_FALSE(config.loadFromString("metrics:\n  flush_interval_ms: 5\n"));
    EXPECT_FALSE(config.loadFromString("chopsticks: [unclosed"));
    EXPECT_FALSE(config.loadFromFile("/nonexistent/chopsticks.yaml"));
}

TEST_F(ConfigurationTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "chopsticks_config_" + std::to_string(getpid()) + ".yaml";
    {
        std::ofstream out(path);
        out << "chopsticks:\n  transport:\n    rpc_timeout_ms: 750\n";
    }
    Configuration config;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.buildMetricsConfig().rpc_timeout, std::chrono::milliseconds(750));
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, CollectsValidationErrors) {
    Configuration config;
    config.config().metrics.flush_interval_ms.set(5000);
    config.config().metrics.silence_timeout_ms.set(1000);
    config.config().histogram.bounds_us = {10, 10, 20};
    config.config().transport.coordinator_address.set("no-port");
    config.config().exposition.port.set(70000);
    config.config().run.failure_ratio.set(1.5);

    EXPECT_FALSE(config.validate());
    EXPECT_TRUE(HasError(config, "Silence timeout"));
    EXPECT_TRUE(HasError(config, "strictly increasing"));
    EXPECT_TRUE(HasError(config, "host:port"));
    EXPECT_TRUE(HasError(config, "Exposition port"));
    EXPECT_TRUE(HasError(config, "Failure ratio"));
    EXPECT_EQ(config.getValidationErrors().size(), 5u);
}

TEST_F(ConfigurationTest, BadLogScaleRange) {
    Configuration config;
    config.config().histogram.min_us.set(100);
    config.config().histogram.max_us.set(100);
    EXPECT_FALSE(config.validate());
    EXPECT_TRUE(HasError(config, "Histogram range"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    Configuration config;
    ASSERT_TRUE(config.loadFromString("chopsticks:\n  metrics:\n    flush_interval_ms: 250\n"));
    setenv("CHOPSTICKS_FLUSH_INTERVAL_MS", "125", 1);
    setenv("CHOPSTICKS_EXPOSITION_ENABLED", "off", 1);
    setenv("CHOPSTICKS_QUEUE_CAPACITY", "not-a-number", 1);

    MetricsConfig mc = config.buildMetricsConfig();
    EXPECT_EQ(mc.flush_interval, std::chrono::milliseconds(125));
    EXPECT_FALSE(mc.exposition_enabled);
    // Unparsable values fall back to the configured one
    EXPECT_EQ(mc.outbound_queue_capacity, 8u);
}

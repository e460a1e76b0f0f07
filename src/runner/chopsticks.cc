#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "client/synthetic_load.h"
#include "common/configuration.h"
#include "coordinator/coordinator.h"
#include "metrics/grpc_transport.h"
#include "metrics/snapshot_transport.h"
#include "worker/worker.h"

namespace {

std::atomic<bool> g_stop{false};

void HandleStopSignal(int) {
	g_stop.store(true);
}

std::string MakeRunId() {
	auto now = std::chrono::system_clock::now();
	auto time_t_now = std::chrono::system_clock::to_time_t(now);
	std::stringstream id;
	id << "run-" << std::put_time(std::gmtime(&time_t_now), "%Y%m%d-%H%M%S") << "-" << getpid();
	return id.str();
}

std::string DefaultWorkerId() {
	char hostname[256] = {0};
	if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
		return "worker-" + std::to_string(getpid());
	}
	return std::string(hostname) + "-" + std::to_string(getpid());
}

Chopsticks::SyntheticLoadOptions LoadOptions(const Chopsticks::RunMetadata& run) {
	Chopsticks::SyntheticLoadOptions options;
	options.clients = run.clients;
	options.duration = std::chrono::seconds(run.duration_s);
	options.failure_ratio = run.failure_ratio;
	options.seed = static_cast<uint64_t>(getpid());
	return options;
}

int RunStandalone(const Chopsticks::MetricsConfig& config, const Chopsticks::RunMetadata& run,
		const std::string& worker_id) {
	Chopsticks::Coordinator coordinator(config, run);
	if (!coordinator.Start(false)) {
		LOG(ERROR) << "Failed to start the coordinator";
		return EXIT_FAILURE;
	}

	{
		Chopsticks::InProcessTransport transport(coordinator.aggregator(), config.outbound_queue_capacity);
		Chopsticks::Worker worker(config, worker_id, transport);
		worker.Start();
		Chopsticks::SyntheticLoad load(LoadOptions(run), worker.recorder());
		load.Run(g_stop);
		if (!worker.Stop()) {
			LOG(WARNING) << "Worker " << worker_id << " shut down with snapshots still pending";
		}
	}

	coordinator.Shutdown(true);
	return EXIT_SUCCESS;
}

int RunCoordinator(const Chopsticks::MetricsConfig& config, const Chopsticks::RunMetadata& run) {
	Chopsticks::Coordinator coordinator(config, run);
	if (!coordinator.Start(true)) {
		LOG(ERROR) << "Failed to start the coordinator";
		return EXIT_FAILURE;
	}
	LOG(INFO) << "Coordinator running, send SIGINT or SIGTERM to finish the run";
	while (!g_stop.load()) {
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}
	LOG(INFO) << "Received shutdown signal";
	coordinator.Shutdown(true);
	return EXIT_SUCCESS;
}

int RunWorker(const Chopsticks::MetricsConfig& config, const Chopsticks::RunMetadata& run,
		const std::string& worker_id) {
	auto transport = Chopsticks::GrpcSnapshotTransport::Connect(
			config.coordinator_address, config.outbound_queue_capacity, config.rpc_timeout);
	Chopsticks::Worker worker(config, worker_id, *transport);
	worker.Start();
	Chopsticks::SyntheticLoad load(LoadOptions(run), worker.recorder());
	load.Run(g_stop);
	bool drained = worker.Stop();
	return drained ? EXIT_SUCCESS : EXIT_FAILURE;
}

int Run(cxxopts::Options& options, const cxxopts::ParseResult& arguments) {
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Chopsticks::Configuration configuration;
	if (arguments.count("config") && !configuration.loadFromFile(arguments["config"].as<std::string>())) {
		return EXIT_FAILURE;
	}
	auto& cfg = configuration.config();
	if (arguments.count("duration")) cfg.run.duration_s.set(arguments["duration"].as<int>());
	if (arguments.count("clients")) cfg.run.clients.set(arguments["clients"].as<int>());
	if (arguments.count("coordinator")) cfg.transport.coordinator_address.set(arguments["coordinator"].as<std::string>());
	if (arguments.count("port")) cfg.exposition.port.set(arguments["port"].as<int>());

	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return EXIT_FAILURE;
	}
	const Chopsticks::MetricsConfig config = configuration.buildMetricsConfig();
	const Chopsticks::RunMetadata run = configuration.buildRunMetadata(MakeRunId());
	const std::string worker_id = arguments.count("worker_id") ?
		arguments["worker_id"].as<std::string>() : DefaultWorkerId();

	std::signal(SIGINT, HandleStopSignal);
	std::signal(SIGTERM, HandleStopSignal);

	// *************** Run **********************
	const std::string role = arguments["role"].as<std::string>();
	LOG(INFO) << "Starting " << role << " for " << run.run_id;
	if (role == "standalone") {
		return RunStandalone(config, run, worker_id);
	} else if (role == "coordinator") {
		return RunCoordinator(config, run);
	} else if (role == "worker") {
		return RunWorker(config, run, worker_id);
	}
	LOG(ERROR) << "Unknown role '" << role << "', expected standalone, coordinator or worker";
	return EXIT_FAILURE;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("chopsticks", "Metrics collection and aggregation for object-storage stress runs");
	options.add_options()
		("role", "standalone, coordinator or worker", cxxopts::value<std::string>()->default_value("standalone"))
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("worker_id", "Worker identity (default: hostname-pid)", cxxopts::value<std::string>())
		("duration", "Load duration in seconds", cxxopts::value<int>())
		("clients", "Concurrent simulated clients", cxxopts::value<int>())
		("coordinator", "Coordinator host:port", cxxopts::value<std::string>())
		("port", "Metrics endpoint port", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	// Parser and as<T>() errors arrive as exceptions
	try {
		auto arguments = options.parse(argc, argv);
		return Run(options, arguments);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Invalid arguments: " << e.what();
		return EXIT_FAILURE;
	}
}

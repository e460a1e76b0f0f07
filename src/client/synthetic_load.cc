#include "synthetic_load.h"

#include <random>
#include <thread>
#include <vector>

#include <glog/logging.h>

namespace Chopsticks {

namespace {

// Weights of upload, download, delete, list, head, other
const std::vector<double> kOperationWeights = {30, 45, 5, 10, 10, 0};

const FailureKind kSimulatedFailures[] = {
	FailureKind::kNetwork, FailureKind::kTimeout, FailureKind::kNotFound, FailureKind::kServerError};

} // namespace

SyntheticLoad::SyntheticLoad(const SyntheticLoadOptions& options, Recorder& recorder)
	: options_(options),
	recorder_(recorder) {}

uint64_t SyntheticLoad::Run(const std::atomic<bool>& stop) {
	auto deadline = std::chrono::steady_clock::now() + options_.duration;
	int clients = options_.clients > 0 ? options_.clients : 1;
	LOG(INFO) << "[SyntheticLoad] " << clients << " clients for " << options_.duration.count() << "s";

	std::vector<std::thread> threads;
	threads.reserve(clients);
	for (int i = 0; i < clients; ++i) {
		threads.emplace_back([this, i, deadline, &stop]() {
				this->ClientThread(i, deadline, stop);
				});
	}
	for (auto& t : threads) {
		t.join();
	}
	LOG(INFO) << "[SyntheticLoad] issued " << issued_.load() << " operations";
	return issued_.load();
}

void SyntheticLoad::ClientThread(int client_id, std::chrono::steady_clock::time_point deadline,
		const std::atomic<bool>& stop) {
	std::mt19937_64 rng(options_.seed + static_cast<uint64_t>(client_id) * 7919 + 1);
	std::discrete_distribution<int> pick_op(kOperationWeights.begin(), kOperationWeights.end());
	std::uniform_int_distribution<uint64_t> pick_size(1024, 4 * 1024 * 1024);
	std::uniform_real_distribution<double> unit(0.0, 1.0);
	std::uniform_int_distribution<size_t> pick_failure(0, sizeof(kSimulatedFailures) / sizeof(kSimulatedFailures[0]) - 1);
	const double max_latency_us =
		static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(options_.max_latency).count());

	while (!stop.load(std::memory_order_relaxed) && std::chrono::steady_clock::now() < deadline) {
		OperationType type = static_cast<OperationType>(pick_op(rng));
		uint64_t size = 0;
		if (type == OperationType::kUpload || type == OperationType::kDownload) {
			size = pick_size(rng);
		}
		// Larger objects take longer; metadata calls stay in the low range
		double size_factor = static_cast<double>(size) / (4.0 * 1024 * 1024);
		double latency_us = max_latency_us * (0.05 + 0.45 * size_factor + 0.5 * unit(rng) * unit(rng));

		auto start = std::chrono::steady_clock::now();
		std::this_thread::sleep_for(std::chrono::microseconds(static_cast<int64_t>(latency_us)));
		auto duration = std::chrono::steady_clock::now() - start;

		if (unit(rng) < options_.failure_ratio) {
			recorder_.Record(type, size, duration, Outcome::kFailure, kSimulatedFailures[pick_failure(rng)]);
		} else {
			recorder_.Record(type, size, duration, Outcome::kSuccess);
		}
		issued_.fetch_add(1, std::memory_order_relaxed);
	}
	VLOG(2) << "[SyntheticLoad] client " << client_id << " done";
}

} // End of namespace Chopsticks

#include "coordinator.h"

#include <iostream>

#include <glog/logging.h>

#include "absl/time/time.h"
#include "exporter/console_summary.h"

namespace Chopsticks {

Coordinator::Coordinator(const MetricsConfig& config, RunMetadata metadata)
	: config_(config),
	aggregator_(config),
	report_writer_(config, std::move(metadata)) {}

Coordinator::~Coordinator() {
	StopThreads();
	if (server_) {
		server_->Shutdown();
	}
}

bool Coordinator::Start(bool serve_grpc) {
	if (config_.exposition_enabled) {
		http_server_ = std::make_unique<MetricsHttpServer>(
				config_.exposition_host, config_.exposition_port,
				[this]() { return aggregator_.Summarize(); });
		if (!http_server_->Start()) {
			http_server_.reset();
			return false;
		}
	}

	if (serve_grpc) {
		service_ = std::make_unique<CollectorServiceImpl>(aggregator_);
		grpc::ServerBuilder builder;
		builder.AddListeningPort(config_.coordinator_address, grpc::InsecureServerCredentials(), &grpc_port_);
		builder.RegisterService(service_.get());
		server_ = builder.BuildAndStart();
		if (!server_ || grpc_port_ == 0) {
			LOG(ERROR) << "[Coordinator] could not listen on " << config_.coordinator_address;
			server_.reset();
			if (http_server_) {
				http_server_->Stop();
				http_server_.reset();
			}
			return false;
		}
		LOG(INFO) << "[Coordinator] collecting snapshots on " << config_.coordinator_address;
	}

	liveness_thread_ = std::thread([this]() {
			this->LivenessThread();
			});
	if (config_.report_interval.count() > 0) {
		report_thread_ = std::thread([this]() {
				this->ReportThread();
				});
	}
	return true;
}

bool Coordinator::WaitForStop(std::chrono::milliseconds interval) {
	absl::MutexLock lock(&mu_);
	mu_.AwaitWithTimeout(absl::Condition(&shutdown_), absl::FromChrono(interval));
	return shutdown_;
}

void Coordinator::LivenessThread() {
	while (!WaitForStop(config_.liveness_check_interval)) {
		aggregator_.SweepLiveness(Clock::now());
	}
}

void Coordinator::ReportThread() {
	while (!WaitForStop(config_.report_interval)) {
		// A failed write is retried on the next tick
		if (!report_writer_.Write(aggregator_.Summarize())) {
			LOG(WARNING) << "[Coordinator] periodic report export failed, retrying in "
				<< config_.report_interval.count() << "s";
		}
	}
}

void Coordinator::StopThreads() {
	{
		absl::MutexLock lock(&mu_);
		shutdown_ = true;
	}
	if (liveness_thread_.joinable()) {
		liveness_thread_.join();
	}
	if (report_thread_.joinable()) {
		report_thread_.join();
	}
}

Summary Coordinator::Shutdown(bool await_final_snapshots) {
	if (finished_) {
		return aggregator_.Summarize();
	}
	finished_ = true;

	if (await_final_snapshots) {
		LOG(INFO) << "[Coordinator] waiting up to " << config_.shutdown_grace.count()
			<< "ms for final snapshots";
		aggregator_.AwaitFinalSnapshots(config_.shutdown_grace);
	}
	StopThreads();
	if (server_) {
		server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
	}

	Summary summary = aggregator_.Finalize(Clock::now());
	if (!report_writer_.Write(summary)) {
		LOG(ERROR) << "[Coordinator] final report could not be written";
	} else {
		LOG(INFO) << "[Coordinator] report written to " << report_writer_.report_path();
	}
	PrintConsoleSummary(summary, std::cout);

	if (http_server_) {
		http_server_->Stop();
	}
	return summary;
}

int Coordinator::exposition_port() const {
	return http_server_ ? http_server_->port() : 0;
}

} // End of namespace Chopsticks

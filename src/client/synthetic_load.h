#ifndef CHOPSTICKS_CLIENT_SYNTHETIC_LOAD_H_
#define CHOPSTICKS_CLIENT_SYNTHETIC_LOAD_H_

#include <atomic>
#include <chrono>
#include <cstdint>

#include "metrics/operation.h"
#include "metrics/recorder.h"

namespace Chopsticks {

struct SyntheticLoadOptions {
	int clients = 8;
	std::chrono::seconds duration{60};
	// Fraction of operations reported as failed
	double failure_ratio = 0.01;
	// Upper bound of a simulated operation's latency
	std::chrono::milliseconds max_latency{20};
	uint64_t seed = 0;
};

/**
 * Stand-in for a storage driver. Client threads pick an operation type by
 * fixed weights, sleep for a size-dependent latency and report the result
 * to the recorder.
 */
class SyntheticLoad {
	public:
		SyntheticLoad(const SyntheticLoadOptions& options, Recorder& recorder);

		/// Blocks until the duration elapsed or stop became true. Returns the
		/// number of operations issued.
		uint64_t Run(const std::atomic<bool>& stop);

	private:
		void ClientThread(int client_id, std::chrono::steady_clock::time_point deadline,
				const std::atomic<bool>& stop);

		const SyntheticLoadOptions options_;
		Recorder& recorder_;
		std::atomic<uint64_t> issued_{0};
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_CLIENT_SYNTHETIC_LOAD_H_

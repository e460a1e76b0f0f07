#ifndef CHOPSTICKS_METRICS_OPERATION_H_
#define CHOPSTICKS_METRICS_OPERATION_H_

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Chopsticks {

enum class OperationType : int {
	kUpload = 0,
	kDownload = 1,
	kDelete = 2,
	kList = 3,
	kHead = 4,
	kOther = 5,
};
constexpr size_t kNumOperationTypes = 6;

constexpr std::array<OperationType, kNumOperationTypes> kAllOperationTypes = {
	OperationType::kUpload, OperationType::kDownload, OperationType::kDelete,
	OperationType::kList, OperationType::kHead, OperationType::kOther};

enum class Outcome : int {
	kSuccess = 0,
	kFailure = 1,
};
constexpr size_t kNumOutcomes = 2;

// Classification of a failed operation as reported by the storage driver
enum class FailureKind : int {
	kNone = 0,
	kNetwork = 1,
	kTimeout = 2,
	kAuth = 3,
	kNotFound = 4,
	kServerError = 5,
	kClientError = 6,
	kUnknown = 7,
};
constexpr size_t kNumFailureKinds = 8;

using Clock = std::chrono::system_clock;

/// One completed storage operation. Lives only for the duration of a
/// Record() call.
struct OperationRecord {
	OperationType type = OperationType::kOther;
	uint64_t size_bytes = 0;
	std::chrono::nanoseconds duration{0};
	Outcome outcome = Outcome::kSuccess;
	FailureKind failure_kind = FailureKind::kNone;
	std::string_view worker_id;
	Clock::time_point timestamp;
};

const char* OperationTypeName(OperationType type);
const char* OutcomeName(Outcome outcome);
const char* FailureKindName(FailureKind kind);

std::optional<OperationType> ParseOperationType(const std::string& name);
std::optional<FailureKind> ParseFailureKind(const std::string& name);

inline size_t Index(OperationType type) { return static_cast<size_t>(type); }
inline size_t Index(Outcome outcome) { return static_cast<size_t>(outcome); }
inline size_t Index(FailureKind kind) { return static_cast<size_t>(kind); }

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_OPERATION_H_

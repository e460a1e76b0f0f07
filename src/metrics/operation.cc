#include "operation.h"

namespace Chopsticks {

const char* OperationTypeName(OperationType type) {
	switch (type) {
		case OperationType::kUpload: return "upload";
		case OperationType::kDownload: return "download";
		case OperationType::kDelete: return "delete";
		case OperationType::kList: return "list";
		case OperationType::kHead: return "head";
		case OperationType::kOther: return "other";
	}
	return "invalid";
}

const char* OutcomeName(Outcome outcome) {
	switch (outcome) {
		case Outcome::kSuccess: return "success";
		case Outcome::kFailure: return "failure";
	}
	return "invalid";
}

const char* FailureKindName(FailureKind kind) {
	switch (kind) {
		case FailureKind::kNone: return "none";
		case FailureKind::kNetwork: return "network";
		case FailureKind::kTimeout: return "timeout";
		case FailureKind::kAuth: return "auth";
		case FailureKind::kNotFound: return "not_found";
		case FailureKind::kServerError: return "server_error";
		case FailureKind::kClientError: return "client_error";
		case FailureKind::kUnknown: return "unknown";
	}
	return "invalid";
}

std::optional<OperationType> ParseOperationType(const std::string& name) {
	for (OperationType type : kAllOperationTypes) {
		if (name == OperationTypeName(type)) {
			return type;
		}
	}
	return std::nullopt;
}

std::optional<FailureKind> ParseFailureKind(const std::string& name) {
	for (size_t i = 0; i < kNumFailureKinds; ++i) {
		FailureKind kind = static_cast<FailureKind>(i);
		if (name == FailureKindName(kind)) {
			return kind;
		}
	}
	return std::nullopt;
}

} // End of namespace Chopsticks

#include "error.h"

namespace ipishield {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
        case ErrorCode::kSanitizerFailure:
        case ErrorCode::kSignalFailure:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
        case ErrorCode::kModelLoadError:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kTimeout:
            return absl::StatusCode::kDeadlineExceeded;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kUnknown: return "unknown";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kFailedPrecondition: return "failed_precondition";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kUnavailable: return "unavailable";
        case ErrorCode::kValidationError: return "validation_error";
        case ErrorCode::kConfigurationError: return "configuration_error";
        case ErrorCode::kModelLoadError: return "model_load_error";
        case ErrorCode::kSignalFailure: return "signal_failure";
        case ErrorCode::kTimeout: return "timeout";
        case ErrorCode::kSanitizerFailure: return "sanitizer_failure";
    }
    return "unknown";
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::StrCat(std::string(ErrorCodeName(code)), ": ", std::string(message)));
}

}  // namespace ipishield

#pragma once

/// @file error.h
/// @brief IPI-Shield error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace ipishield {

/// @brief Error taxonomy of the inspection pipeline
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,
    kUnavailable,

    // Pipeline-specific error codes
    kValidationError,      ///< Request rejected before entering the pipeline
    kConfigurationError,   ///< Malformed rule table, weights or thresholds
    kModelLoadError,       ///< Optional model artifact missing or unusable
    kSignalFailure,        ///< A single signal failed for one call
    kTimeout,              ///< A single signal exceeded its call budget
    kSanitizerFailure,     ///< Merge/replace failed; fatal for the request
};

/// @brief Convert an IPI-Shield error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Short stable name for an error code, used in logs and reports
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Create an error status with the given code and message.
/// The message is prefixed with the code name.
absl::Status MakeError(ErrorCode code, std::string_view message);

inline absl::Status ValidationError(std::string_view message) {
    return MakeError(ErrorCode::kValidationError, message);
}

inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

inline absl::Status SanitizerFailure(std::string_view message) {
    return MakeError(ErrorCode::kSanitizerFailure, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define IPISHIELD_RETURN_IF_ERROR(expr)                                        \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define IPISHIELD_ASSIGN_OR_RETURN(lhs, rhs)                                   \
    IPISHIELD_ASSIGN_OR_RETURN_IMPL(                                           \
        IPISHIELD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define IPISHIELD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                    \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define IPISHIELD_CONCAT(a, b) IPISHIELD_CONCAT_IMPL(a, b)
#define IPISHIELD_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define IPISHIELD_CHECK_OR_RETURN(condition, error_status)                     \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace ipishield

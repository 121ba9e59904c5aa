#pragma once

#include <string>

namespace harbor::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kConflict,
    /// Another request holds the staging row; worth retrying shortly.
    kBusy,
    kOutOfRange,
    kNotYetFilled,
    kIoError,
    kDbError,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name of an error code, used in JSON error envelopes.
const char* ErrorCodeName(ErrorCode code);

}  // namespace harbor::core

/**
 * @file OperationResult.hpp
 * @brief Tagged result type returned by every transport and twin operation
 *
 * Expected failures (network loss, throttling, rejected credentials, timeouts)
 * travel as values rather than exceptions so that retry decisions branch on
 * an explicit status. Exceptions remain reserved for programming errors and
 * invalid construction arguments.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include <ostream>
#include <string>

namespace hublink {

/// Coarse outcome of an operation, drives retry-or-give-up decisions
enum class OperationStatus {
    Success = 0,        ///< Completed
    TransientFailure,   ///< Service or transport reported a recoverable condition
    FatalFailure,       ///< Not recoverable by retrying the same call
    Canceled            ///< Aborted by a cancellation token (normal shutdown path)
};

/// Finer-grained cause, used by retry allow-lists and by log output
enum class ErrorCode {
    None = 0,
    NetworkError,       ///< Socket/TLS level failure
    Timeout,            ///< No response within the operation timeout
    ServerBusy,         ///< Hub reported a transient server error
    Throttled,          ///< Hub throttled the request
    Unauthorized,       ///< Credential rejected
    DeviceNotFound,     ///< Device deleted or disabled on the hub
    QuotaExceeded,      ///< Daily message quota exhausted
    MessageLockLost,    ///< Completing a cloud-to-device message after its lock expired
    NotConnected,       ///< Handle is not currently usable
    InvalidResponse,    ///< Response could not be parsed
    InvalidArgument,    ///< Caller supplied invalid input
    Unknown
};

const char* toString(OperationStatus status);
const char* toString(ErrorCode code);

/**
 * @brief Result of one transport or twin operation
 */
struct OperationResult {
    OperationStatus status = OperationStatus::Success;
    ErrorCode code = ErrorCode::None;
    std::string message;

    static OperationResult success() { return {}; }

    static OperationResult transient(ErrorCode code, std::string message) {
        return {OperationStatus::TransientFailure, code, std::move(message)};
    }

    static OperationResult fatal(ErrorCode code, std::string message) {
        return {OperationStatus::FatalFailure, code, std::move(message)};
    }

    static OperationResult canceled(std::string message = "Operation canceled") {
        return {OperationStatus::Canceled, ErrorCode::None, std::move(message)};
    }

    bool ok() const { return status == OperationStatus::Success; }
    bool isCanceled() const { return status == OperationStatus::Canceled; }

    /// @return "status/code: message" for log lines
    std::string describe() const;
};

std::ostream& operator<<(std::ostream& os, const OperationResult& result);

} // namespace hublink

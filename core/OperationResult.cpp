#include "OperationResult.hpp"

namespace hublink {

const char* toString(OperationStatus status) {
    switch (status) {
        case OperationStatus::Success:          return "Success";
        case OperationStatus::TransientFailure: return "TransientFailure";
        case OperationStatus::FatalFailure:     return "FatalFailure";
        case OperationStatus::Canceled:         return "Canceled";
    }
    return "Unknown";
}

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:            return "None";
        case ErrorCode::NetworkError:    return "NetworkError";
        case ErrorCode::Timeout:         return "Timeout";
        case ErrorCode::ServerBusy:      return "ServerBusy";
        case ErrorCode::Throttled:       return "Throttled";
        case ErrorCode::Unauthorized:    return "Unauthorized";
        case ErrorCode::DeviceNotFound:  return "DeviceNotFound";
        case ErrorCode::QuotaExceeded:   return "QuotaExceeded";
        case ErrorCode::MessageLockLost: return "MessageLockLost";
        case ErrorCode::NotConnected:    return "NotConnected";
        case ErrorCode::InvalidResponse: return "InvalidResponse";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::Unknown:         return "Unknown";
    }
    return "Unknown";
}

std::string OperationResult::describe() const {
    std::string text = toString(status);
    if (code != ErrorCode::None) {
        text += "/";
        text += toString(code);
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

std::ostream& operator<<(std::ostream& os, const OperationResult& result) {
    return os << result.describe();
}

} // namespace hublink

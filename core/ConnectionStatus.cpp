#include "ConnectionStatus.hpp"

namespace hublink {

ConnectionStatusInfo ConnectionStatusInfo::make(ConnectionStatus status, ConnectionStatusReason reason) {
    return {status, reason, recommendedActionFor(status, reason)};
}

RecommendedAction recommendedActionFor(ConnectionStatus status, ConnectionStatusReason reason) {
    switch (status) {
        case ConnectionStatus::Connected:
            return RecommendedAction::PerformNormally;
        case ConnectionStatus::DisconnectedRetrying:
            return RecommendedAction::WaitForRetryPolicy;
        case ConnectionStatus::Disconnected:
            if (reason == ConnectionStatusReason::BadCredential ||
                reason == ConnectionStatusReason::DeviceDisabled) {
                return RecommendedAction::Quit;
            }
            return RecommendedAction::OpenConnection;
        case ConnectionStatus::Disabled:
            return RecommendedAction::OpenConnection;
    }
    return RecommendedAction::OpenConnection;
}

const char* toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Connected:            return "Connected";
        case ConnectionStatus::DisconnectedRetrying: return "DisconnectedRetrying";
        case ConnectionStatus::Disconnected:         return "Disconnected";
        case ConnectionStatus::Disabled:             return "Disabled";
    }
    return "Unknown";
}

const char* toString(ConnectionStatusReason reason) {
    switch (reason) {
        case ConnectionStatusReason::Ok:                 return "Ok";
        case ConnectionStatusReason::BadCredential:      return "BadCredential";
        case ConnectionStatusReason::DeviceDisabled:     return "DeviceDisabled";
        case ConnectionStatusReason::RetryExpired:       return "RetryExpired";
        case ConnectionStatusReason::CommunicationError: return "CommunicationError";
        case ConnectionStatusReason::ClientClosed:       return "ClientClosed";
        case ConnectionStatusReason::Unknown:            return "Unknown";
    }
    return "Unknown";
}

const char* toString(RecommendedAction action) {
    switch (action) {
        case RecommendedAction::PerformNormally:    return "PerformNormally";
        case RecommendedAction::OpenConnection:     return "OpenConnection";
        case RecommendedAction::WaitForRetryPolicy: return "WaitForRetryPolicy";
        case RecommendedAction::Quit:               return "Quit";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, const ConnectionStatusInfo& info) {
    return os << "status=" << toString(info.status)
              << " reason=" << toString(info.reason)
              << " action=" << toString(info.recommendedAction);
}

} // namespace hublink

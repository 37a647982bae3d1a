/**
 * @file ConnectionStatus.hpp
 * @brief Connectivity observations produced by the transport layer
 *
 * Every connectivity change is reported as a status/reason pair plus the
 * action the transport recommends. The lifecycle manager consumes each
 * notification exactly once; the latest observation always wins.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include <ostream>

namespace hublink {

enum class ConnectionStatus {
    Connected,              ///< Handle usable
    DisconnectedRetrying,   ///< Transport is reconnecting on its own
    Disconnected,           ///< Terminal for the current handle, see reason
    Disabled                ///< Handle closed on request
};

enum class ConnectionStatusReason {
    Ok,
    BadCredential,
    DeviceDisabled,
    RetryExpired,
    CommunicationError,
    ClientClosed,
    Unknown
};

enum class RecommendedAction {
    PerformNormally,
    OpenConnection,
    WaitForRetryPolicy,
    Quit
};

/**
 * @brief One connectivity observation
 */
struct ConnectionStatusInfo {
    ConnectionStatus status = ConnectionStatus::Disabled;
    ConnectionStatusReason reason = ConnectionStatusReason::ClientClosed;
    RecommendedAction recommendedAction = RecommendedAction::OpenConnection;

    /// Builds an observation with the recommended action derived from status and reason
    static ConnectionStatusInfo make(ConnectionStatus status, ConnectionStatusReason reason);
};

/**
 * @brief Action a client should take for a status/reason pair
 *
 * Connected maps to PerformNormally, DisconnectedRetrying to
 * WaitForRetryPolicy, Disconnected with BadCredential or DeviceDisabled to
 * Quit, everything else to OpenConnection.
 */
RecommendedAction recommendedActionFor(ConnectionStatus status, ConnectionStatusReason reason);

const char* toString(ConnectionStatus status);
const char* toString(ConnectionStatusReason reason);
const char* toString(RecommendedAction action);

std::ostream& operator<<(std::ostream& os, const ConnectionStatusInfo& info);

} // namespace hublink

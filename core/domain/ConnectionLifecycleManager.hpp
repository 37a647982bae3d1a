/**
 * @file ConnectionLifecycleManager.hpp
 * @brief Owns the transport handle and keeps it usable across connectivity changes
 *
 * Replaces the handle under a single initialization gate, reacts to
 * connection-status notifications with a per-status/per-reason action table
 * and re-subscribes the message and desired-property callbacks after every
 * replacement.
 *
 * Action table for notifications of the current handle:
 * - Connected: run the connected handler (twin reconciliation)
 * - DisconnectedRetrying, Disabled: nothing, the handle is left untouched
 * - Disconnected/BadCredential: discard the head credential, then re-initialize
 *   or cancel the application once no credential is left
 * - Disconnected/DeviceDisabled: cancel the application
 * - Disconnected/RetryExpired, Disconnected/CommunicationError: re-initialize
 *   (each controlled by LifecycleOptions)
 * - anything else: logged as an error, no action
 *
 * @date 2025
 * @version 1.0
 *
 * @note Notifications are handled on a BackgroundTaskSet so the transport's
 *       callback thread is never blocked and failures are never lost
 * @note Notifications from a superseded handle are ignored
 */

#pragma once

#include "../CancellationToken.hpp"
#include "../ConnectionStatus.hpp"
#include "../ports/IDeviceClient.hpp"
#include "BackgroundTaskSet.hpp"
#include "CredentialSet.hpp"
#include "RetryExecutor.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace hublink::domain {

struct LifecycleOptions {
    bool reinitializeOnCommunicationError = true;
    bool reinitializeOnRetryExpired = true;
};

class ConnectionLifecycleManager {
public:
    /// Invoked on a background task every time the current handle reports Connected
    using ConnectedHandler = std::function<void(const CancellationToken&)>;

    /**
     * @param factory Creates one handle per initialization
     * @param credentials Candidate connection strings, shared with nobody else
     * @param executor Retry executor used for open and re-subscription
     * @param appCancellation Application-wide source; cancelled on fatal conditions
     * @param options Re-initialization policy for soft disconnect reasons
     * @throws std::invalid_argument on null collaborators
     */
    ConnectionLifecycleManager(std::shared_ptr<ports::IDeviceClientFactory> factory,
                               std::shared_ptr<CredentialSet> credentials,
                               std::shared_ptr<const RetryExecutor> executor,
                               CancellationSource appCancellation,
                               LifecycleOptions options = {});

    ~ConnectionLifecycleManager();

    ConnectionLifecycleManager(const ConnectionLifecycleManager&) = delete;
    ConnectionLifecycleManager& operator=(const ConnectionLifecycleManager&) = delete;

    /// Callbacks registered on every new handle; set before initialize()
    void setMessageHandler(ports::IDeviceClient::MessageHandler handler);
    void setDesiredPropertyHandler(ports::IDeviceClient::DesiredPropertyHandler handler);
    void setConnectedHandler(ConnectedHandler handler);

    /**
     * @brief Create and open a handle if one is needed
     *
     * Checks whether a replacement is needed before and after taking the
     * initialization gate; a call with a healthy handle is a no-op.
     * Transient open failures are retried through the executor after the
     * gate is released, followed by re-subscription of the callbacks.
     *
     * @return Success, Canceled on shutdown, or the failure that stopped it
     */
    OperationResult initialize(const CancellationToken& token);

    /**
     * @brief Close the current handle exactly once
     *
     * Uses a fresh cancellation source because the application token is
     * already cancelled at this point. Waits for pending background tasks.
     */
    OperationResult shutdown();

    /// Current handle; may be replaced concurrently, never half-constructed
    std::shared_ptr<ports::IDeviceClient> currentClient() const;

    bool isConnected() const;
    ConnectionStatusInfo lastStatus() const;
    std::uint64_t generation() const { return generation_.load(); }
    std::size_t initializationCount() const { return initializations_.load(); }

    void waitForBackgroundTasks() { tasks_.drain(); }
    std::size_t backgroundFailureCount() const { return tasks_.failureCount(); }

private:
    bool shouldInitialize() const;
    OperationResult replaceClient(const CancellationToken& token);
    OperationResult retryOpen(OperationResult firstFailure, const CancellationToken& token);
    OperationResult subscribeCallbacks(const CancellationToken& token);

    void onConnectionStatusChanged(std::uint64_t generation, const ConnectionStatusInfo& info);
    void handleBadCredential(std::uint64_t generation);
    void reinitializeInBackground(const char* trigger);

    std::shared_ptr<ports::IDeviceClientFactory> factory_;
    std::shared_ptr<CredentialSet> credentials_;
    std::shared_ptr<const RetryExecutor> executor_;
    CancellationSource appCancellation_;
    LifecycleOptions options_;

    std::mutex initMutex_;
    std::shared_ptr<ports::IDeviceClient> client_;
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<std::size_t> initializations_{0};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex statusMutex_;
    ConnectionStatusInfo lastStatus_;
    std::string activeCredential_;
    std::uint64_t badCredentialHandled_ = 0;

    mutable std::mutex handlersMutex_;
    ports::IDeviceClient::MessageHandler messageHandler_;
    ports::IDeviceClient::DesiredPropertyHandler desiredHandler_;
    ConnectedHandler connectedHandler_;

    BackgroundTaskSet tasks_;
};

} // namespace hublink::domain

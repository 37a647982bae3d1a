/**
 * @file DeviceApp.hpp
 * @brief Device application: connect, send telemetry, receive messages
 *
 * Composition root of the orchestration core. Builds the retry executors,
 * the connection lifecycle manager and the twin reconciler from one
 * configuration, then runs the telemetry send loop and, in poll mode, the
 * cloud-to-device receive loop until the application token is cancelled.
 *
 * @date 2025
 * @version 1.0
 *
 * @note Shutdown closes the handle with a fresh token, never the cancelled one
 */

#pragma once

#include "../CancellationToken.hpp"
#include "../IRng.hpp"
#include "../Telemetry.hpp"
#include "../adapters/JitteredExponentialBackoffPolicy.hpp"
#include "../ports/IDeviceClient.hpp"
#include "BackgroundTaskSet.hpp"
#include "ConnectionLifecycleManager.hpp"
#include "RetryExecutor.hpp"
#include "TwinReconciler.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hublink::domain {

enum class ReceiveMode {
    Callback,   ///< Message handler registered on every handle
    Poll        ///< Dedicated loop calling receive() with a timeout
};

struct DeviceAppConfig {
    std::vector<std::string> connectionStrings;           ///< Primary first
    adapters::BackoffOptions backoff;                     ///< Shared by all retry loops
    LifecycleOptions lifecycle;
    std::chrono::milliseconds sendInterval{std::chrono::seconds(15)};
    std::chrono::milliseconds receiveTimeout{std::chrono::seconds(10)};
    ReceiveMode receiveMode = ReceiveMode::Callback;
};

class DeviceApp {
public:
    /**
     * @param factory Transport handle factory (MQTT or simulated hub)
     * @param rng Random source for jitter and telemetry values
     * @param config Application settings
     * @throws std::invalid_argument if no connection string is configured
     */
    DeviceApp(std::shared_ptr<ports::IDeviceClientFactory> factory,
              std::shared_ptr<IRng> rng,
              DeviceAppConfig config,
              CancellationSource appCancellation);

    ~DeviceApp();

    DeviceApp(const DeviceApp&) = delete;
    DeviceApp& operator=(const DeviceApp&) = delete;

    /**
     * @brief Run until the application token is cancelled
     * @return Success on a normal shutdown, otherwise the initialization failure
     */
    OperationResult run();

    /// Build telemetry message @p number with random temperature and humidity
    static TelemetryMessage createTelemetryMessage(int number, IRng& rng);

    ConnectionLifecycleManager& lifecycle() { return *lifecycle_; }
    TwinReconciler& twin() { return *twin_; }

    std::size_t messagesSent() const { return sent_.load(); }
    std::size_t messagesReceived() const { return received_.load(); }

private:
    void sendLoop(const CancellationToken& token);
    void receiveLoop(const CancellationToken& token);
    void onCloudMessage(const CloudMessage& message);
    void logCloudMessage(const CloudMessage& message) const;

    std::shared_ptr<IRng> rng_;
    DeviceAppConfig config_;
    CancellationSource appCancellation_;

    std::shared_ptr<const RetryExecutor> executor_;
    std::shared_ptr<const RetryExecutor> receiveExecutor_;
    std::shared_ptr<ConnectionLifecycleManager> lifecycle_;
    std::shared_ptr<TwinReconciler> twin_;

    std::atomic<std::size_t> sent_{0};
    std::atomic<std::size_t> received_{0};

    BackgroundTaskSet twinUpdates_;
};

} // namespace hublink::domain

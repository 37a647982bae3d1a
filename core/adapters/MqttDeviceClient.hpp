#pragma once

#include "../IClock.hpp"
#include "../IMqttClient.hpp"
#include "../TwinHandler.hpp"
#include "../ports/IDeviceClient.hpp"
#include "SasToken.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace hublink::adapters {

struct MqttDeviceClientOptions {
    std::chrono::milliseconds operationTimeout{std::chrono::seconds(30)};
    int reconnectAttempts = 5;
    std::chrono::milliseconds reconnectInterval{std::chrono::seconds(5)};
    int keepAliveSeconds = 240;
    std::string caPath;
    std::uint64_t sasTtlSeconds = SasToken::kDefaultTtlSeconds;
};

// IoT hub device handle over MQTT. After an established connection drops it
// reports DisconnectedRetrying and reconnects on its own a bounded number of
// times, then reports Disconnected/RetryExpired.
class MqttDeviceClient : public ports::IDeviceClient {
public:
    static constexpr const char* kApiVersion = "2021-04-12";

    MqttDeviceClient(std::shared_ptr<IMqttClient> mqtt,
                     ConnectionString connection,
                     std::shared_ptr<const IClock> clock,
                     MqttDeviceClientOptions options = {});
    ~MqttDeviceClient() override;

    MqttDeviceClient(const MqttDeviceClient&) = delete;
    MqttDeviceClient& operator=(const MqttDeviceClient&) = delete;

    OperationResult open(const CancellationToken& token) override;
    OperationResult close(const CancellationToken& token) override;
    OperationResult sendEvent(const TelemetryMessage& message, const CancellationToken& token) override;
    OperationResult receive(std::optional<CloudMessage>& message,
                            std::chrono::milliseconds timeout,
                            const CancellationToken& token) override;
    OperationResult complete(const CloudMessage& message, const CancellationToken& token) override;

    void setConnectionStatusHandler(ConnectionStatusHandler handler) override;
    OperationResult setMessageHandler(MessageHandler handler, const CancellationToken& token) override;
    OperationResult setDesiredPropertyUpdateHandler(DesiredPropertyHandler handler,
                                                    const CancellationToken& token) override;

    OperationResult getTwin(ports::TwinDocument& twin, const CancellationToken& token) override;
    OperationResult updateReportedProperties(const nlohmann::json& patch, const CancellationToken& token) override;

    ConnectionStatusInfo connectionStatusInfo() const override;

    std::string username() const;
    std::string telemetryTopic(const TelemetryMessage& message) const;
    std::string cloudToDeviceTopicPrefix() const;

    // Parses "devices/{id}/messages/devicebound/{property bag}"
    static CloudMessage parseCloudMessage(const std::string& topic, const std::string& payload);

private:
    enum class Phase { Idle, Connecting, Connected, Reconnecting, Closed };

    static constexpr std::size_t kMaxPendingMessages = 100;

    OperationResult connectOnce(const CancellationToken& token);
    OperationResult failureFor(const MqttConnectionEvent& event);
    bool subscribeAll();
    void reconnectLoop();
    void stopReconnect();

    void onMqttConnection(const MqttConnectionEvent& event);
    void onMqttMessage(const MqttMessage& message);
    void setStatus(ConnectionStatus status, ConnectionStatusReason reason, bool notify);
    bool isConnected() const;

    std::shared_ptr<IMqttClient> mqtt_;
    const ConnectionString connection_;
    std::shared_ptr<const IClock> clock_;
    const MqttDeviceClientOptions options_;
    TwinHandler twin_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    Phase phase_ = Phase::Idle;
    ConnectionStatusInfo status_;
    bool attemptPending_ = false;
    std::optional<MqttConnectionEvent> attemptOutcome_;

    std::deque<CloudMessage> inbox_;
    MessageHandler messageHandler_;
    ConnectionStatusHandler statusHandler_;

    CancellationSource stopReconnect_;
    std::mutex workerMutex_;
    std::thread reconnectWorker_;
};

// Creates one MqttDeviceClient, over a fresh MQTT connection, per credential.
class MqttDeviceClientFactory : public ports::IDeviceClientFactory {
public:
    using MqttClientMaker = std::function<std::shared_ptr<IMqttClient>()>;

    MqttDeviceClientFactory(MqttClientMaker makeMqtt,
                            std::shared_ptr<const IClock> clock,
                            MqttDeviceClientOptions options = {});

    /// @throws std::runtime_error if the connection string cannot be parsed
    std::shared_ptr<ports::IDeviceClient> create(const std::string& connectionString) override;

private:
    MqttClientMaker makeMqtt_;
    std::shared_ptr<const IClock> clock_;
    MqttDeviceClientOptions options_;
};

} // namespace hublink::adapters

#pragma once

#include "../ports/IDeviceClient.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hublink::sim {

// In-process stand-in for a hub connection. Opens succeed unless results are
// scripted, status notifications are emitted on open/close or on demand, and
// every call is recorded for inspection.
class MockDeviceClient : public ports::IDeviceClient {
public:
    explicit MockDeviceClient(std::string connectionString);
    ~MockDeviceClient() override = default;

    // IDeviceClient interface
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

    // Scripting
    void scriptOpenResults(std::deque<OperationResult> results);
    void scriptSendResults(std::deque<OperationResult> results);
    void scriptCompleteResults(std::deque<OperationResult> results);
    void setTwin(nlohmann::json desired, std::int64_t version);

    // Updates the handle status and notifies the registered handler
    void emitStatus(ConnectionStatus status, ConnectionStatusReason reason);

    // Delivers to the message handler if registered, otherwise queues for receive()
    void deliverMessage(const CloudMessage& message);
    void pushDesiredProperties(const nlohmann::json& desired, std::int64_t version);

    // Inspection
    const std::string& connectionString() const { return connectionString_; }
    int openCalls() const;
    int closeCalls() const;
    int getTwinCalls() const;
    std::vector<TelemetryMessage> sentMessages() const;
    std::vector<nlohmann::json> reportedPatches() const;
    std::vector<std::string> completedLockTokens() const;
    bool hasMessageHandler() const;
    bool hasDesiredPropertyHandler() const;

private:
    static OperationResult popOr(std::deque<OperationResult>& results, OperationResult fallback);
    bool connectedLocked() const { return status_.status == ConnectionStatus::Connected; }
    void notify(const ConnectionStatusInfo& info);

    const std::string connectionString_;

    mutable std::mutex mutex_;
    std::condition_variable inbox_;
    ConnectionStatusInfo status_;
    ConnectionStatusHandler statusHandler_;
    MessageHandler messageHandler_;
    DesiredPropertyHandler desiredHandler_;

    std::deque<OperationResult> openResults_;
    std::deque<OperationResult> sendResults_;
    std::deque<OperationResult> completeResults_;
    std::deque<CloudMessage> pending_;

    ports::TwinDocument twin_;
    std::vector<TelemetryMessage> sent_;
    std::vector<nlohmann::json> reported_;
    std::vector<std::string> completed_;
    int openCalls_ = 0;
    int closeCalls_ = 0;
    int getTwinCalls_ = 0;
};

class MockDeviceClientFactory : public ports::IDeviceClientFactory {
public:
    using Configurator = std::function<void(MockDeviceClient&)>;

    std::shared_ptr<ports::IDeviceClient> create(const std::string& connectionString) override;

    // Applied to every client before it is handed out
    void setConfigurator(Configurator configurator);

    // Twin served by every client created from now on
    void setTwin(nlohmann::json desired, std::int64_t version);

    // While held, create() blocks until releaseCreation()
    void holdCreation();
    void releaseCreation();

    std::vector<std::shared_ptr<MockDeviceClient>> clients() const;
    std::shared_ptr<MockDeviceClient> latest() const;
    std::size_t createdCount() const;
    std::size_t creationRequests() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable released_;
    bool held_ = false;
    std::size_t requests_ = 0;
    Configurator configurator_;
    bool hasTwin_ = false;
    nlohmann::json twinDesired_ = nlohmann::json::object();
    std::int64_t twinVersion_ = 0;
    std::vector<std::shared_ptr<MockDeviceClient>> clients_;
};

} // namespace hublink::sim

#include "MockDeviceClient.hpp"

namespace hublink::sim {

MockDeviceClient::MockDeviceClient(std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

OperationResult MockDeviceClient::popOr(std::deque<OperationResult>& results, OperationResult fallback) {
    if (results.empty()) {
        return fallback;
    }
    OperationResult next = results.front();
    results.pop_front();
    return next;
}

void MockDeviceClient::notify(const ConnectionStatusInfo& info) {
    ConnectionStatusHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = statusHandler_;
    }
    if (handler) {
        handler(info);
    }
}

OperationResult MockDeviceClient::open(const CancellationToken& token) {
    if (token.isCancellationRequested()) {
        return OperationResult::canceled("open canceled");
    }

    ConnectionStatusInfo info;
    OperationResult result;
    bool emit = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++openCalls_;
        if (connectedLocked()) {
            return OperationResult::success();
        }

        result = popOr(openResults_, OperationResult::success());
        if (result.ok()) {
            status_ = ConnectionStatusInfo::make(ConnectionStatus::Connected, ConnectionStatusReason::Ok);
            emit = true;
        } else if (result.code == ErrorCode::Unauthorized) {
            status_ = ConnectionStatusInfo::make(ConnectionStatus::Disconnected, ConnectionStatusReason::BadCredential);
            emit = true;
        } else if (result.code == ErrorCode::DeviceNotFound) {
            status_ = ConnectionStatusInfo::make(ConnectionStatus::Disconnected, ConnectionStatusReason::DeviceDisabled);
            emit = true;
        } else {
            status_ = ConnectionStatusInfo::make(ConnectionStatus::Disconnected,
                                                 ConnectionStatusReason::CommunicationError);
        }
        info = status_;
    }

    if (emit) {
        notify(info);
    }
    return result;
}

OperationResult MockDeviceClient::close(const CancellationToken&) {
    ConnectionStatusInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++closeCalls_;
        if (status_.status == ConnectionStatus::Disabled) {
            return OperationResult::success();
        }
        status_ = ConnectionStatusInfo::make(ConnectionStatus::Disabled, ConnectionStatusReason::ClientClosed);
        info = status_;
    }
    inbox_.notify_all();
    notify(info);
    return OperationResult::success();
}

OperationResult MockDeviceClient::sendEvent(const TelemetryMessage& message, const CancellationToken& token) {
    if (token.isCancellationRequested()) {
        return OperationResult::canceled("send canceled");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connectedLocked()) {
        return OperationResult::transient(ErrorCode::NotConnected, "client is not connected");
    }
    OperationResult result = popOr(sendResults_, OperationResult::success());
    if (result.ok()) {
        sent_.push_back(message);
    }
    return result;
}

OperationResult MockDeviceClient::receive(std::optional<CloudMessage>& message,
                                          std::chrono::milliseconds timeout,
                                          const CancellationToken& token) {
    message.reset();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    while (pending_.empty()) {
        if (!connectedLocked()) {
            return OperationResult::transient(ErrorCode::NotConnected, "client is not connected");
        }
        if (token.isCancellationRequested()) {
            return OperationResult::canceled("receive canceled");
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return OperationResult::success();
        }
        // Short slices so cancellation is observed without a shared condition.
        inbox_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                            std::chrono::milliseconds(20)));
    }

    message = pending_.front();
    pending_.pop_front();
    return OperationResult::success();
}

OperationResult MockDeviceClient::complete(const CloudMessage& message, const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    OperationResult result = popOr(completeResults_, OperationResult::success());
    if (result.ok()) {
        completed_.push_back(message.lockToken);
    }
    return result;
}

void MockDeviceClient::setConnectionStatusHandler(ConnectionStatusHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusHandler_ = std::move(handler);
}

OperationResult MockDeviceClient::setMessageHandler(MessageHandler handler, const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connectedLocked()) {
        return OperationResult::transient(ErrorCode::NotConnected, "client is not connected");
    }
    messageHandler_ = std::move(handler);
    return OperationResult::success();
}

OperationResult MockDeviceClient::setDesiredPropertyUpdateHandler(DesiredPropertyHandler handler,
                                                                  const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connectedLocked()) {
        return OperationResult::transient(ErrorCode::NotConnected, "client is not connected");
    }
    desiredHandler_ = std::move(handler);
    return OperationResult::success();
}

OperationResult MockDeviceClient::getTwin(ports::TwinDocument& twin, const CancellationToken& token) {
    if (token.isCancellationRequested()) {
        return OperationResult::canceled("get twin canceled");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connectedLocked()) {
        return OperationResult::transient(ErrorCode::NotConnected, "client is not connected");
    }
    ++getTwinCalls_;
    twin = twin_;
    return OperationResult::success();
}

OperationResult MockDeviceClient::updateReportedProperties(const nlohmann::json& patch,
                                                           const CancellationToken& token) {
    if (token.isCancellationRequested()) {
        return OperationResult::canceled("update reported properties canceled");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connectedLocked()) {
        return OperationResult::transient(ErrorCode::NotConnected, "client is not connected");
    }
    reported_.push_back(patch);
    twin_.reported.merge_patch(patch);
    return OperationResult::success();
}

ConnectionStatusInfo MockDeviceClient::connectionStatusInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void MockDeviceClient::scriptOpenResults(std::deque<OperationResult> results) {
    std::lock_guard<std::mutex> lock(mutex_);
    openResults_ = std::move(results);
}

void MockDeviceClient::scriptSendResults(std::deque<OperationResult> results) {
    std::lock_guard<std::mutex> lock(mutex_);
    sendResults_ = std::move(results);
}

void MockDeviceClient::scriptCompleteResults(std::deque<OperationResult> results) {
    std::lock_guard<std::mutex> lock(mutex_);
    completeResults_ = std::move(results);
}

void MockDeviceClient::setTwin(nlohmann::json desired, std::int64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    desired["$version"] = version;
    twin_.desired = std::move(desired);
    twin_.desiredVersion = version;
}

void MockDeviceClient::emitStatus(ConnectionStatus status, ConnectionStatusReason reason) {
    const ConnectionStatusInfo info = ConnectionStatusInfo::make(status, reason);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = info;
    }
    inbox_.notify_all();
    notify(info);
}

void MockDeviceClient::deliverMessage(const CloudMessage& message) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = messageHandler_;
        if (!handler) {
            pending_.push_back(message);
        }
    }
    if (handler) {
        handler(message);
    } else {
        inbox_.notify_all();
    }
}

void MockDeviceClient::pushDesiredProperties(const nlohmann::json& desired, std::int64_t version) {
    DesiredPropertyHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        twin_.desired = desired;
        twin_.desired["$version"] = version;
        twin_.desiredVersion = version;
        handler = desiredHandler_;
    }
    if (handler) {
        handler(desired, version);
    }
}

int MockDeviceClient::openCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return openCalls_;
}

int MockDeviceClient::closeCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeCalls_;
}

int MockDeviceClient::getTwinCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getTwinCalls_;
}

std::vector<TelemetryMessage> MockDeviceClient::sentMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

std::vector<nlohmann::json> MockDeviceClient::reportedPatches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reported_;
}

std::vector<std::string> MockDeviceClient::completedLockTokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

bool MockDeviceClient::hasMessageHandler() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(messageHandler_);
}

bool MockDeviceClient::hasDesiredPropertyHandler() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(desiredHandler_);
}

std::shared_ptr<ports::IDeviceClient> MockDeviceClientFactory::create(const std::string& connectionString) {
    std::unique_lock<std::mutex> lock(mutex_);
    ++requests_;
    released_.wait(lock, [this] { return !held_; });

    auto client = std::make_shared<MockDeviceClient>(connectionString);
    if (hasTwin_) {
        client->setTwin(twinDesired_, twinVersion_);
    }
    if (configurator_) {
        configurator_(*client);
    }
    clients_.push_back(client);
    return client;
}

void MockDeviceClientFactory::setConfigurator(Configurator configurator) {
    std::lock_guard<std::mutex> lock(mutex_);
    configurator_ = std::move(configurator);
}

void MockDeviceClientFactory::setTwin(nlohmann::json desired, std::int64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    hasTwin_ = true;
    twinDesired_ = std::move(desired);
    twinVersion_ = version;
}

void MockDeviceClientFactory::holdCreation() {
    std::lock_guard<std::mutex> lock(mutex_);
    held_ = true;
}

void MockDeviceClientFactory::releaseCreation() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
    }
    released_.notify_all();
}

std::vector<std::shared_ptr<MockDeviceClient>> MockDeviceClientFactory::clients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_;
}

std::shared_ptr<MockDeviceClient> MockDeviceClientFactory::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.empty() ? nullptr : clients_.back();
}

std::size_t MockDeviceClientFactory::createdCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

std::size_t MockDeviceClientFactory::creationRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

} // namespace hublink::sim

#include "MqttDeviceClient.hpp"
#include "../Logger.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace hublink::adapters {

namespace {

constexpr const char* kComponent = "HubClient";
constexpr std::chrono::milliseconds kWaitSlice{50};
constexpr int kTelemetryQos = 1;
constexpr int kTwinQos = 0;

OperationResult notConnected() {
    return OperationResult::transient(ErrorCode::NotConnected, "client is not connected");
}

} // namespace

MqttDeviceClient::MqttDeviceClient(std::shared_ptr<IMqttClient> mqtt,
                                   ConnectionString connection,
                                   std::shared_ptr<const IClock> clock,
                                   MqttDeviceClientOptions options)
    : mqtt_(std::move(mqtt))
    , connection_(std::move(connection))
    , clock_(std::move(clock))
    , options_(std::move(options)) {
    if (!mqtt_) {
        throw std::invalid_argument("MqttDeviceClient: MQTT client cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("MqttDeviceClient: clock cannot be null");
    }

    mqtt_->setConnectionCallback([this](const MqttConnectionEvent& event) { onMqttConnection(event); });
    mqtt_->setMessageCallback([this](const MqttMessage& message) { onMqttMessage(message); });
}

MqttDeviceClient::~MqttDeviceClient() {
    stopReconnect();
    mqtt_->setConnectionCallback(nullptr);
    mqtt_->setMessageCallback(nullptr);
    mqtt_->disconnect();
    twin_.failPending();
}

std::string MqttDeviceClient::username() const {
    std::string user = connection_.hostName + "/" + connection_.clientId() + "/?api-version=" + kApiVersion;
    return user;
}

std::string MqttDeviceClient::telemetryTopic(const TelemetryMessage& message) const {
    std::ostringstream topic;
    topic << "devices/" << connection_.deviceId;
    if (!connection_.moduleId.empty()) {
        topic << "/modules/" << connection_.moduleId;
    }
    topic << "/messages/events/";

    std::string separator;
    auto append = [&topic, &separator](const std::string& key, const std::string& value) {
        topic << separator << key << "=" << SasToken::urlEncode(value);
        separator = "&";
    };

    if (!message.messageId.empty()) append("$.mid", message.messageId);
    if (!message.contentType.empty()) append("$.ct", message.contentType);
    if (!message.contentEncoding.empty()) append("$.ce", message.contentEncoding);
    for (const auto& property : message.properties) {
        append(SasToken::urlEncode(property.first), property.second);
    }
    return topic.str();
}

std::string MqttDeviceClient::cloudToDeviceTopicPrefix() const {
    return "devices/" + connection_.deviceId + "/messages/devicebound/";
}

CloudMessage MqttDeviceClient::parseCloudMessage(const std::string& topic, const std::string& payload) {
    CloudMessage message;
    message.payload = payload;

    const auto marker = topic.find("/messages/devicebound/");
    if (marker != std::string::npos) {
        std::istringstream bag(topic.substr(marker + std::string("/messages/devicebound/").size()));
        std::string pair;
        while (std::getline(bag, pair, '&')) {
            if (pair.empty()) {
                continue;
            }
            const auto equalPos = pair.find('=');
            const std::string key = SasToken::urlDecode(pair.substr(0, equalPos));
            const std::string value = equalPos == std::string::npos ? std::string() : SasToken::urlDecode(pair.substr(equalPos + 1));
            if (key == "$.mid") {
                message.messageId = value;
            } else {
                message.properties[key] = value;
            }
        }
    }
    message.lockToken = message.messageId;
    return message;
}

ConnectionStatusInfo MqttDeviceClient::connectionStatusInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool MqttDeviceClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == Phase::Connected;
}

void MqttDeviceClient::setStatus(ConnectionStatus status, ConnectionStatusReason reason, bool notify) {
    const ConnectionStatusInfo info = ConnectionStatusInfo::make(status, reason);
    ConnectionStatusHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = info;
        handler = statusHandler_;
    }
    changed_.notify_all();
    logDebug(kComponent) << connection_.clientId() << " " << info;
    if (notify && handler) {
        handler(info);
    }
}

void MqttDeviceClient::setConnectionStatusHandler(ConnectionStatusHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusHandler_ = std::move(handler);
}

OperationResult MqttDeviceClient::open(const CancellationToken& token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (phase_) {
            case Phase::Connected:
                return OperationResult::success();
            case Phase::Closed:
                return OperationResult::fatal(ErrorCode::NotConnected, "client was closed");
            case Phase::Connecting:
            case Phase::Reconnecting:
                return OperationResult::transient(ErrorCode::NotConnected, "connection attempt in progress");
            case Phase::Idle:
                phase_ = Phase::Connecting;
                break;
        }
    }

    OperationResult result = connectOnce(token);
    if (result.ok() && !subscribeAll()) {
        mqtt_->disconnect();
        result = OperationResult::transient(ErrorCode::NetworkError, "subscribing to device topics failed");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::Connecting) {
            phase_ = result.ok() ? Phase::Connected : Phase::Idle;
        }
    }

    if (result.ok()) {
        setStatus(ConnectionStatus::Connected, ConnectionStatusReason::Ok, true);
    } else if (result.code == ErrorCode::Unauthorized) {
        setStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::BadCredential, true);
    } else if (result.code == ErrorCode::DeviceNotFound) {
        setStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::DeviceDisabled, true);
    } else if (!result.isCanceled()) {
        setStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError, false);
    }
    return result;
}

OperationResult MqttDeviceClient::connectOnce(const CancellationToken& token) {
    MqttConnectOptions connect;
    connect.host = connection_.endpointHost();
    connect.clientId = connection_.clientId();
    connect.username = username();
    connect.caPath = options_.caPath;
    connect.keepAliveSeconds = options_.keepAliveSeconds;
    connect.connectTimeoutSeconds = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(options_.operationTimeout).count());
    connect.password = SasToken::generate(connection_, *clock_, options_.sasTtlSeconds);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        attemptPending_ = true;
        attemptOutcome_.reset();
    }

    if (!mqtt_->connect(connect)) {
        std::lock_guard<std::mutex> lock(mutex_);
        attemptPending_ = false;
        return OperationResult::transient(ErrorCode::NetworkError, "connection attempt could not be started");
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.operationTimeout;
    std::unique_lock<std::mutex> lock(mutex_);
    while (!attemptOutcome_) {
        if (token.isCancellationRequested()) {
            attemptPending_ = false;
            lock.unlock();
            mqtt_->disconnect();
            return OperationResult::canceled("open canceled");
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            attemptPending_ = false;
            lock.unlock();
            mqtt_->disconnect();
            return OperationResult::transient(ErrorCode::Timeout, "no CONNACK within the operation timeout");
        }
        changed_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice));
    }

    const MqttConnectionEvent outcome = *attemptOutcome_;
    attemptPending_ = false;
    attemptOutcome_.reset();
    lock.unlock();

    if (outcome.kind == MqttConnectionEvent::Kind::Connected) {
        return OperationResult::success();
    }
    return failureFor(outcome);
}

OperationResult MqttDeviceClient::failureFor(const MqttConnectionEvent& event) {
    switch (event.returnCode) {
        case connack::kBadUsernameOrPassword:
        case connack::kNotAuthorized:
            return OperationResult::fatal(ErrorCode::Unauthorized, "credential rejected: " + event.reason);
        case connack::kIdentifierRejected:
            return OperationResult::fatal(ErrorCode::DeviceNotFound, "device rejected: " + event.reason);
        case connack::kServerUnavailable:
            return OperationResult::transient(ErrorCode::ServerBusy, "hub unavailable: " + event.reason);
        default:
            return OperationResult::transient(ErrorCode::NetworkError, "connection failed: " + event.reason);
    }
}

bool MqttDeviceClient::subscribeAll() {
    bool ok = mqtt_->subscribe(cloudToDeviceTopicPrefix() + "#", 1);
    for (const auto& topic : TwinHandler::subscriptionTopics()) {
        ok = mqtt_->subscribe(topic, kTwinQos) && ok;
    }
    return ok;
}

void MqttDeviceClient::onMqttConnection(const MqttConnectionEvent& event) {
    bool startReconnect = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attemptPending_ &&
            (event.kind == MqttConnectionEvent::Kind::Connected ||
             event.kind == MqttConnectionEvent::Kind::ConnectFailed)) {
            attemptOutcome_ = event;
        } else if (event.kind == MqttConnectionEvent::Kind::ConnectionLost && phase_ == Phase::Connected) {
            phase_ = Phase::Reconnecting;
            startReconnect = true;
        }
    }
    changed_.notify_all();

    if (!startReconnect) {
        return;
    }

    twin_.failPending();
    setStatus(ConnectionStatus::DisconnectedRetrying, ConnectionStatusReason::CommunicationError, true);

    std::lock_guard<std::mutex> lock(workerMutex_);
    if (reconnectWorker_.joinable()) {
        if (reconnectWorker_.get_id() == std::this_thread::get_id()) {
            reconnectWorker_.detach();
        } else {
            reconnectWorker_.join();
        }
    }
    reconnectWorker_ = std::thread([this] { reconnectLoop(); });
}

void MqttDeviceClient::reconnectLoop() {
    const CancellationToken stop = stopReconnect_.token();

    for (int attempt = 1; attempt <= options_.reconnectAttempts; ++attempt) {
        if (!stop.waitFor(options_.reconnectInterval)) {
            return;
        }
        logInfo(kComponent) << "reconnect attempt " << attempt << "/" << options_.reconnectAttempts;

        const OperationResult result = connectOnce(stop);
        if (result.isCanceled()) {
            return;
        }
        if (result.ok() && subscribeAll()) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (phase_ != Phase::Reconnecting) {
                    return;
                }
                phase_ = Phase::Connected;
            }
            setStatus(ConnectionStatus::Connected, ConnectionStatusReason::Ok, true);
            return;
        }

        if (result.code == ErrorCode::Unauthorized || result.code == ErrorCode::DeviceNotFound) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                phase_ = Phase::Idle;
            }
            setStatus(ConnectionStatus::Disconnected,
                      result.code == ErrorCode::Unauthorized ? ConnectionStatusReason::BadCredential
                                                             : ConnectionStatusReason::DeviceDisabled,
                      true);
            return;
        }
        logWarn(kComponent) << "reconnect attempt " << attempt << " failed: " << result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != Phase::Reconnecting) {
            return;
        }
        phase_ = Phase::Idle;
    }
    logWarn(kComponent) << "transport reconnect attempts exhausted";
    setStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::RetryExpired, true);
}

void MqttDeviceClient::stopReconnect() {
    stopReconnect_.cancel();
    changed_.notify_all();

    std::lock_guard<std::mutex> lock(workerMutex_);
    if (reconnectWorker_.joinable()) {
        if (reconnectWorker_.get_id() == std::this_thread::get_id()) {
            reconnectWorker_.detach();
        } else {
            reconnectWorker_.join();
        }
    }
}

OperationResult MqttDeviceClient::close(const CancellationToken&) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::Closed) {
            return OperationResult::success();
        }
        phase_ = Phase::Closed;
    }

    stopReconnect();
    mqtt_->disconnect();
    twin_.failPending();
    changed_.notify_all();
    setStatus(ConnectionStatus::Disabled, ConnectionStatusReason::ClientClosed, true);
    return OperationResult::success();
}

OperationResult MqttDeviceClient::sendEvent(const TelemetryMessage& message, const CancellationToken& token) {
    if (token.isCancellationRequested()) {
        return OperationResult::canceled("send canceled");
    }
    if (!isConnected()) {
        return notConnected();
    }
    if (!mqtt_->publish(telemetryTopic(message), message.payload, kTelemetryQos)) {
        return OperationResult::transient(ErrorCode::NetworkError, "publishing telemetry failed");
    }
    return OperationResult::success();
}

OperationResult MqttDeviceClient::receive(std::optional<CloudMessage>& message,
                                          std::chrono::milliseconds timeout,
                                          const CancellationToken& token) {
    message.reset();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    while (inbox_.empty()) {
        if (phase_ != Phase::Connected) {
            return notConnected();
        }
        if (token.isCancellationRequested()) {
            return OperationResult::canceled("receive canceled");
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return OperationResult::success();
        }
        changed_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice));
    }

    message = std::move(inbox_.front());
    inbox_.pop_front();
    return OperationResult::success();
}

OperationResult MqttDeviceClient::complete(const CloudMessage&, const CancellationToken&) {
    // QoS 1 deliveries are acknowledged by the MQTT library on arrival.
    return isConnected() ? OperationResult::success() : notConnected();
}

OperationResult MqttDeviceClient::setMessageHandler(MessageHandler handler, const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != Phase::Connected) {
        return notConnected();
    }
    messageHandler_ = std::move(handler);
    return OperationResult::success();
}

OperationResult MqttDeviceClient::setDesiredPropertyUpdateHandler(DesiredPropertyHandler handler,
                                                                  const CancellationToken&) {
    if (!isConnected()) {
        return notConnected();
    }
    twin_.setDesiredPatchCallback(std::move(handler));
    return OperationResult::success();
}

OperationResult MqttDeviceClient::getTwin(ports::TwinDocument& twin, const CancellationToken& token) {
    if (!isConnected()) {
        return notConnected();
    }

    const std::string requestId = twin_.beginRequest();
    if (!mqtt_->publish(TwinHandler::getTopic(requestId), "", kTwinQos)) {
        twin_.abandonRequest(requestId);
        return OperationResult::transient(ErrorCode::NetworkError, "publishing twin GET failed");
    }

    TwinResponse response;
    OperationResult result = twin_.awaitResponse(requestId, options_.operationTimeout, token, response);
    if (!result.ok()) {
        return result;
    }
    result = TwinHandler::resultForStatus(response.status, "GetTwin");
    if (!result.ok()) {
        return result;
    }
    return TwinHandler::parseTwinDocument(response.payload, twin);
}

OperationResult MqttDeviceClient::updateReportedProperties(const nlohmann::json& patch, const CancellationToken& token) {
    if (!isConnected()) {
        return notConnected();
    }

    const std::string requestId = twin_.beginRequest();
    if (!mqtt_->publish(TwinHandler::reportedPatchTopic(requestId), patch.dump(), kTwinQos)) {
        twin_.abandonRequest(requestId);
        return OperationResult::transient(ErrorCode::NetworkError, "publishing reported properties failed");
    }

    TwinResponse response;
    OperationResult result = twin_.awaitResponse(requestId, options_.operationTimeout, token, response);
    if (!result.ok()) {
        return result;
    }
    return TwinHandler::resultForStatus(response.status, "UpdateReportedProperties");
}

void MqttDeviceClient::onMqttMessage(const MqttMessage& message) {
    if (twin_.handleMqttMessage(message)) {
        return;
    }
    if (message.topic.rfind(cloudToDeviceTopicPrefix(), 0) != 0) {
        logDebug(kComponent) << "ignoring message on " << message.topic;
        return;
    }

    CloudMessage cloudMessage = parseCloudMessage(message.topic, message.payload);
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = messageHandler_;
        if (!handler) {
            if (inbox_.size() >= kMaxPendingMessages) {
                logWarn(kComponent) << "inbox full, dropping message " << inbox_.front().messageId;
                inbox_.pop_front();
            }
            inbox_.push_back(cloudMessage);
        }
    }

    if (handler) {
        handler(cloudMessage);
    } else {
        changed_.notify_all();
    }
}

MqttDeviceClientFactory::MqttDeviceClientFactory(MqttClientMaker makeMqtt,
                                                 std::shared_ptr<const IClock> clock,
                                                 MqttDeviceClientOptions options)
    : makeMqtt_(std::move(makeMqtt))
    , clock_(std::move(clock))
    , options_(std::move(options)) {
    if (!makeMqtt_) {
        throw std::invalid_argument("MqttDeviceClientFactory: MQTT client maker cannot be empty");
    }
}

std::shared_ptr<ports::IDeviceClient> MqttDeviceClientFactory::create(const std::string& connectionString) {
    ConnectionString connection = ConnectionString::parse(connectionString);
    logDebug(kComponent) << "creating handle for " << connection.clientId() << "@" << connection.hostName;
    return std::make_shared<MqttDeviceClient>(makeMqtt_(), std::move(connection), clock_, options_);
}

} // namespace hublink::adapters

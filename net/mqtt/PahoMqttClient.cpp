#include "PahoMqttClient.hpp"
#include "Logger.hpp"

namespace hublink {

namespace {

constexpr const char* kComponent = "MQTT";

} // namespace

PahoMqttClient::PahoMqttClient() = default;

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::ensureHandle(const MqttConnectOptions& options) {
    const std::string uri = "ssl://" + options.host + ":" + std::to_string(options.port);
    if (client_ && uri == serverUri_) {
        return true;
    }
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }

    int rc = MQTTAsync_create(&client_, uri.c_str(), options.clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        logError(kComponent) << "failed to create client for " << uri << ", error code: " << rc;
        client_ = nullptr;
        return false;
    }

    rc = MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        logError(kComponent) << "failed to register callbacks, error code: " << rc;
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
        return false;
    }

    serverUri_ = uri;
    return true;
}

bool PahoMqttClient::connect(const MqttConnectOptions& options) {
    if (!ensureHandle(options)) {
        return false;
    }

    username_ = options.username;
    password_ = options.password;
    trustStore_ = options.caPath;

    MQTTAsync_connectOptions connOpts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions sslOpts = MQTTAsync_SSLOptions_initializer;

    connOpts.keepAliveInterval = options.keepAliveSeconds;
    connOpts.cleansession = 0;
    connOpts.connectTimeout = options.connectTimeoutSeconds;
    connOpts.MQTTVersion = MQTTVERSION_3_1_1;
    connOpts.onSuccess = onConnected;
    connOpts.onFailure = onConnectFailure;
    connOpts.context = this;
    connOpts.username = username_.c_str();
    connOpts.password = password_.c_str();
    connOpts.ssl = &sslOpts;

    sslOpts.enableServerCertAuth = 1;
    sslOpts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
    if (!trustStore_.empty()) {
        sslOpts.trustStore = trustStore_.c_str();
    }

    logInfo(kComponent) << "connecting to " << serverUri_ << " as " << options.clientId;
    const int rc = MQTTAsync_connect(client_, &connOpts);
    if (rc != MQTTASYNC_SUCCESS) {
        logWarn(kComponent) << "connection attempt not started, error code: " << rc;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (!client_ || !MQTTAsync_isConnected(client_)) {
        connected_ = false;
        return;
    }

    MQTTAsync_disconnectOptions discOpts = MQTTAsync_disconnectOptions_initializer;
    discOpts.timeout = kDisconnectTimeoutMs;
    discOpts.onSuccess = onDisconnected;
    discOpts.context = this;

    const int rc = MQTTAsync_disconnect(client_, &discOpts);
    if (rc != MQTTASYNC_SUCCESS) {
        logWarn(kComponent) << "disconnect failed, error code: " << rc;
    }
    connected_ = false;
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload, int qos, bool retained) {
    if (!connected_) {
        return false;
    }

    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.data()));
    pubmsg.payloadlen = static_cast<int>(payload.size());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;

    const int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        logWarn(kComponent) << "publish to " << topic << " failed, error code: " << rc;
        return false;
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!connected_) {
        return false;
    }
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    return MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts) == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    if (!connected_) {
        return false;
    }
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    return MQTTAsync_unsubscribe(client_, topic.c_str(), &opts) == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::raise(const MqttConnectionEvent& event) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(event);
    }
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* self = static_cast<PahoMqttClient*>(context);

    MqttMessage msg;
    msg.topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen)) : std::string(topicName);
    msg.payload = std::string(static_cast<const char*>(message->payload), static_cast<std::size_t>(message->payloadlen));
    msg.qos = message->qos;
    msg.retained = message->retained != 0;

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(self->callbackMutex_);
        callback = self->messageCallback_;
    }
    if (callback) {
        callback(msg);
    }
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData*) {
    auto* self = static_cast<PahoMqttClient*>(context);
    self->connected_ = true;
    logInfo(kComponent) << "connected to " << self->serverUri_;
    self->raise({MqttConnectionEvent::Kind::Connected, connack::kAccepted, "Connected"});
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* self = static_cast<PahoMqttClient*>(context);
    self->connected_ = false;

    MqttConnectionEvent event{MqttConnectionEvent::Kind::ConnectFailed, 0, "Connection failed"};
    if (response) {
        // Positive codes are CONNACK refusals, negative ones are library errors.
        event.returnCode = response->code > 0 ? response->code : 0;
        event.reason = "code " + std::to_string(response->code);
        if (response->message) {
            event.reason += " (" + std::string(response->message) + ")";
        }
    }
    logWarn(kComponent) << "connection attempt failed: " << event.reason;
    self->raise(event);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* self = static_cast<PahoMqttClient*>(context);
    self->connected_ = false;

    const std::string reason = cause ? std::string(cause) : "Connection lost";
    logWarn(kComponent) << "connection lost: " << reason;
    self->raise({MqttConnectionEvent::Kind::ConnectionLost, 0, reason});
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData*) {
    auto* self = static_cast<PahoMqttClient*>(context);
    self->connected_ = false;
    self->raise({MqttConnectionEvent::Kind::Disconnected, 0, "Disconnected"});
}

} // namespace hublink

/**
 * @file PahoMqttClient.hpp
 * @brief Paho MQTT C (async) implementation of IMqttClient
 *
 * Wraps one MQTTAsync handle. The handle is created on the first connect and
 * reused by later attempts to the same broker; reconnection policy lives in
 * the IoT hub device client, not here.
 *
 * @date 2025
 * @version 1.0
 *
 * @note For embedded platforms, replace with coreMQTT or Paho Embedded C
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <mutex>
#include <string>

namespace hublink {

class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();

    /// Disconnects if needed and destroys the Paho handle
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

private:
    /// Milliseconds granted to in-flight messages on disconnect
    static constexpr int kDisconnectTimeoutMs = 2000;

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);

    bool ensureHandle(const MqttConnectOptions& options);
    void raise(const MqttConnectionEvent& event);

    MQTTAsync client_ = nullptr;                  ///< Paho handle, created lazily
    std::string serverUri_;
    std::atomic<bool> connected_{false};

    // Strings referenced by the connect options must outlive the async attempt.
    std::string username_;
    std::string password_;
    std::string trustStore_;

    mutable std::mutex callbackMutex_;
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
};

} // namespace hublink

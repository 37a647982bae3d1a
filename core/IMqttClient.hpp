/**
 * @file IMqttClient.hpp
 * @brief Low-level MQTT client interface used by the IoT hub device client
 *
 * Connection outcomes are reported as events carrying the CONNACK return
 * code so that callers can tell a rejected credential from a network failure.
 * Publishing while disconnected fails immediately; there is no offline queue.
 *
 * @date 2025
 * @version 1.0
 *
 * @note Callbacks run on the MQTT library's thread
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace hublink {

/**
 * @brief MQTT message as published or received
 */
struct MqttMessage {
    std::string topic;              ///< Full topic including any property bag
    std::string payload;            ///< Raw payload bytes
    int qos = 0;                    ///< Quality of Service level (0 or 1 for IoT hub)
    bool retained = false;
};

/**
 * @brief Parameters for one connection attempt
 */
struct MqttConnectOptions {
    std::string host;                   ///< Broker hostname
    std::uint16_t port = 8883;          ///< TLS port
    std::string clientId;
    std::string username;
    std::string password;               ///< SAS token for IoT hub
    std::string caPath;                 ///< Optional trust store (.pem); empty uses system defaults
    int keepAliveSeconds = 240;
    int connectTimeoutSeconds = 30;
};

/**
 * @brief Connection lifecycle event
 */
struct MqttConnectionEvent {
    enum class Kind {
        Connected,          ///< CONNACK accepted
        ConnectFailed,      ///< Attempt failed; returnCode holds the CONNACK code when known
        ConnectionLost,     ///< Established connection dropped
        Disconnected        ///< Disconnect requested by the client completed
    };

    Kind kind = Kind::Disconnected;
    int returnCode = 0;     ///< CONNACK return code, 0 when not applicable
    std::string reason;
};

/// CONNACK return codes (MQTT 3.1.1)
namespace connack {
constexpr int kAccepted = 0;
constexpr int kUnacceptableProtocol = 1;
constexpr int kIdentifierRejected = 2;
constexpr int kServerUnavailable = 3;
constexpr int kBadUsernameOrPassword = 4;
constexpr int kNotAuthorized = 5;
} // namespace connack

/**
 * @brief Platform-independent MQTT client interface
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    using MessageCallback = std::function<void(const MqttMessage&)>;
    using ConnectionCallback = std::function<void(const MqttConnectionEvent&)>;

    /**
     * @brief Start an asynchronous connection attempt
     * @return true if the attempt was initiated; the outcome arrives as an event
     */
    virtual bool connect(const MqttConnectOptions& options) = 0;

    /// Disconnect gracefully; safe to call when not connected
    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Publish a message
     * @return false if not connected or the library rejected the message
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                         int qos = 0, bool retained = false) = 0;

    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    virtual bool unsubscribe(const std::string& topic) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace hublink

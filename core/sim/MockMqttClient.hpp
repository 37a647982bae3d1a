#pragma once

#include "../IMqttClient.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace hublink::sim {

struct PublishedMessage {
    std::string topic;
    std::string payload;
    int qos = 0;
};

// Broker stand-in for the MQTT device client. Connection outcomes are raised
// synchronously from connect(), and twin requests are answered in place the
// way the hub answers them on $iothub/twin/res/.
class MockMqttClient : public IMqttClient {
public:
    /// Scripted connect outcome that produces no event at all
    static constexpr int kNoResponse = -1;

    MockMqttClient() = default;
    ~MockMqttClient() override = default;

    // IMqttClient interface
    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    // CONNACK codes for the next connects; connects beyond the script are accepted
    void scriptConnectResults(std::deque<int> returnCodes);
    void setFailPublish(bool fail);

    void setTwin(nlohmann::json desired, nlohmann::json reported = nlohmann::json::object());
    void setTwinGetStatus(int status);
    void setReportedPatchStatus(int status);
    void setAutoRespondTwin(bool enabled);

    void simulateConnectionLost(const std::string& cause = "socket closed");
    void injectMessage(const std::string& topic, const std::string& payload);

    // Inspection
    int connectCount() const;
    MqttConnectOptions lastConnectOptions() const;
    std::vector<PublishedMessage> publishedMessages() const;
    std::vector<PublishedMessage> publishedTo(const std::string& topicPrefix) const;
    std::vector<std::string> subscriptions() const;

private:
    void raise(const MqttConnectionEvent& event);
    void deliver(const MqttMessage& message);

    mutable std::mutex mutex_;
    bool connected_ = false;
    bool failPublish_ = false;
    int connectCount_ = 0;
    MqttConnectOptions lastOptions_;
    std::deque<int> connectScript_;

    nlohmann::json twinDesired_ = nlohmann::json::object();
    nlohmann::json twinReported_ = nlohmann::json::object();
    int twinGetStatus_ = 200;
    int reportedPatchStatus_ = 204;
    bool autoRespondTwin_ = true;
    std::int64_t reportedVersion_ = 1;

    std::vector<PublishedMessage> published_;
    std::vector<std::string> subscriptions_;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
};

} // namespace hublink::sim

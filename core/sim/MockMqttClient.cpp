#include "MockMqttClient.hpp"
#include "../TwinHandler.hpp"
#include <algorithm>

namespace hublink::sim {

bool MockMqttClient::connect(const MqttConnectOptions& options) {
    int returnCode = connack::kAccepted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++connectCount_;
        lastOptions_ = options;
        if (!connectScript_.empty()) {
            returnCode = connectScript_.front();
            connectScript_.pop_front();
        }
        connected_ = returnCode == connack::kAccepted;
    }

    if (returnCode == kNoResponse) {
        return true;
    }
    if (returnCode == connack::kAccepted) {
        raise({MqttConnectionEvent::Kind::Connected, connack::kAccepted, "Mock connection established"});
    } else {
        raise({MqttConnectionEvent::Kind::ConnectFailed, returnCode, "CONNACK " + std::to_string(returnCode)});
    }
    return true;
}

void MockMqttClient::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return;
        }
        connected_ = false;
    }
    raise({MqttConnectionEvent::Kind::Disconnected, 0, "Disconnected"});
}

bool MockMqttClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload, int qos, bool) {
    MqttMessage response;
    bool respond = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_ || failPublish_) {
            return false;
        }
        published_.push_back({topic, payload, qos});

        if (autoRespondTwin_) {
            const std::string requestId = TwinHandler::extractRequestId(topic);
            if (topic.rfind(TwinHandler::kGetTopicPrefix, 0) == 0) {
                nlohmann::json document;
                document["desired"] = twinDesired_;
                document["reported"] = twinReported_;
                response.topic = std::string(TwinHandler::kResponseTopicPrefix) + std::to_string(twinGetStatus_) +
                                 "/?$rid=" + requestId;
                response.payload = twinGetStatus_ == 200 ? document.dump() : std::string();
                respond = true;
            } else if (topic.rfind(TwinHandler::kReportedTopicPrefix, 0) == 0) {
                const nlohmann::json patch = nlohmann::json::parse(payload, nullptr, false);
                if (reportedPatchStatus_ == 204 && patch.is_object()) {
                    twinReported_.merge_patch(patch);
                    ++reportedVersion_;
                }
                response.topic = std::string(TwinHandler::kResponseTopicPrefix) + std::to_string(reportedPatchStatus_) +
                                 "/?$rid=" + requestId + "&$version=" + std::to_string(reportedVersion_);
                respond = true;
            }
        }
    }

    if (respond) {
        deliver(response);
    }
    return true;
}

bool MockMqttClient::subscribe(const std::string& topic, int) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return false;
    }
    if (std::find(subscriptions_.begin(), subscriptions_.end(), topic) == subscriptions_.end()) {
        subscriptions_.push_back(topic);
    }
    return true;
}

bool MockMqttClient::unsubscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(std::remove(subscriptions_.begin(), subscriptions_.end(), topic), subscriptions_.end());
    return connected_;
}

void MockMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageCallback_ = std::move(callback);
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::scriptConnectResults(std::deque<int> returnCodes) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectScript_ = std::move(returnCodes);
}

void MockMqttClient::setFailPublish(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPublish_ = fail;
}

void MockMqttClient::setTwin(nlohmann::json desired, nlohmann::json reported) {
    std::lock_guard<std::mutex> lock(mutex_);
    twinDesired_ = std::move(desired);
    twinReported_ = std::move(reported);
}

void MockMqttClient::setTwinGetStatus(int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    twinGetStatus_ = status;
}

void MockMqttClient::setReportedPatchStatus(int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    reportedPatchStatus_ = status;
}

void MockMqttClient::setAutoRespondTwin(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    autoRespondTwin_ = enabled;
}

void MockMqttClient::simulateConnectionLost(const std::string& cause) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
    }
    raise({MqttConnectionEvent::Kind::ConnectionLost, 0, cause});
}

void MockMqttClient::injectMessage(const std::string& topic, const std::string& payload) {
    MqttMessage message;
    message.topic = topic;
    message.payload = payload;
    message.qos = 1;
    deliver(message);
}

int MockMqttClient::connectCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectCount_;
}

MqttConnectOptions MockMqttClient::lastConnectOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastOptions_;
}

std::vector<PublishedMessage> MockMqttClient::publishedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

std::vector<PublishedMessage> MockMqttClient::publishedTo(const std::string& topicPrefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PublishedMessage> matching;
    for (const auto& message : published_) {
        if (message.topic.rfind(topicPrefix, 0) == 0) {
            matching.push_back(message);
        }
    }
    return matching;
}

std::vector<std::string> MockMqttClient::subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

void MockMqttClient::raise(const MqttConnectionEvent& event) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(event);
    }
}

void MockMqttClient::deliver(const MqttMessage& message) {
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = messageCallback_;
    }
    if (callback) {
        callback(message);
    }
}

} // namespace hublink::sim

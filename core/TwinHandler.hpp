/**
 * @file TwinHandler.hpp
 * @brief Device twin protocol over MQTT: request correlation and desired patches
 *
 * IoT hub answers twin GET and reported-property PATCH requests on
 * "$iothub/twin/res/{status}/?$rid={rid}". Each request gets a fresh request
 * id; callers block on awaitResponse() until the matching response arrives,
 * the timeout elapses, the connection drops or cancellation is requested.
 * Desired-property PATCH notifications are forwarded to a callback.
 *
 * @date 2025
 * @version 1.0
 *
 * @note Thread-safe: responses arrive on the MQTT thread, waiters block elsewhere
 */

#pragma once

#include "CancellationToken.hpp"
#include "IMqttClient.hpp"
#include "OperationResult.hpp"
#include "ports/IDeviceClient.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hublink {

/**
 * @brief Raw response to one twin request
 */
struct TwinResponse {
    int status = 0;          ///< HTTP-style status from the response topic, 0 if the request was abandoned
    std::string payload;
};

class TwinHandler {
public:
    /// Desired properties (including "$version") and their version
    using DesiredPatchCallback = std::function<void(const nlohmann::json&, std::int64_t)>;

    static constexpr const char* kResponseTopicPrefix = "$iothub/twin/res/";
    static constexpr const char* kDesiredPatchTopicPrefix = "$iothub/twin/PATCH/properties/desired/";
    static constexpr const char* kGetTopicPrefix = "$iothub/twin/GET/";
    static constexpr const char* kReportedTopicPrefix = "$iothub/twin/PATCH/properties/reported/";

    TwinHandler() = default;

    TwinHandler(const TwinHandler&) = delete;
    TwinHandler& operator=(const TwinHandler&) = delete;

    /// Topics to subscribe after every connect
    static std::vector<std::string> subscriptionTopics();

    static std::string getTopic(const std::string& requestId);
    static std::string reportedPatchTopic(const std::string& requestId);

    /**
     * @brief Allocate a request id and register it as pending
     * @note Register before publishing so a fast response is not missed
     */
    std::string beginRequest();

    /**
     * @brief Wait for the response to @p requestId
     * @return Success with @p response filled, Timeout, NotConnected if the
     *         connection dropped, or Canceled
     */
    OperationResult awaitResponse(const std::string& requestId,
                                  std::chrono::milliseconds timeout,
                                  const CancellationToken& token,
                                  TwinResponse& response);

    /// Forget a pending request (publish failed)
    void abandonRequest(const std::string& requestId);

    /// Wake every waiter with an abandoned response (connection dropped)
    void failPending();

    /**
     * @brief Route an incoming MQTT message
     * @return true if the message belonged to the twin protocol
     */
    bool handleMqttMessage(const MqttMessage& message);

    void setDesiredPatchCallback(DesiredPatchCallback callback);

    /// Map a response status to an operation result
    static OperationResult resultForStatus(int status, const std::string& operation);

    /// Parse a GET response payload {"desired":{...},"reported":{...}}
    static OperationResult parseTwinDocument(const std::string& payload, ports::TwinDocument& twin);

    static int extractStatusCode(const std::string& topic);
    static std::string extractRequestId(const std::string& topic);
    static std::int64_t extractVersion(const std::string& topic);

    std::size_t pendingCount() const;

private:
    struct Pending {
        bool done = false;
        TwinResponse response;
    };

    void processResponse(const std::string& topic, const std::string& payload);
    void processDesiredPatch(const std::string& topic, const std::string& payload);

    mutable std::mutex mutex_;
    std::condition_variable responded_;
    std::map<std::string, Pending> pending_;
    std::uint64_t nextRequestId_ = 1;
    DesiredPatchCallback desiredCallback_;
};

} // namespace hublink

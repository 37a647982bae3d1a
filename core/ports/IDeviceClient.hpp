#pragma once

#include "../CancellationToken.hpp"
#include "../ConnectionStatus.hpp"
#include "../OperationResult.hpp"
#include "../Telemetry.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace hublink::ports {

struct TwinDocument {
    nlohmann::json desired = nlohmann::json::object();
    nlohmann::json reported = nlohmann::json::object();
    std::int64_t desiredVersion = 0;
};

// One transport handle bound to a single credential. Handles are not reused:
// once closed, a fresh one is created through IDeviceClientFactory.
class IDeviceClient {
public:
    virtual ~IDeviceClient() = default;

    using ConnectionStatusHandler = std::function<void(const ConnectionStatusInfo&)>;
    using MessageHandler = std::function<void(const CloudMessage&)>;
    // desired properties (including "$version") and their version
    using DesiredPropertyHandler = std::function<void(const nlohmann::json&, std::int64_t)>;

    // Opening an already open handle succeeds without side effects.
    virtual OperationResult open(const CancellationToken& token) = 0;
    virtual OperationResult close(const CancellationToken& token) = 0;

    virtual OperationResult sendEvent(const TelemetryMessage& message, const CancellationToken& token) = 0;

    // Success with an empty message means the timeout elapsed.
    virtual OperationResult receive(std::optional<CloudMessage>& message,
                                    std::chrono::milliseconds timeout,
                                    const CancellationToken& token) = 0;
    virtual OperationResult complete(const CloudMessage& message, const CancellationToken& token) = 0;

    virtual void setConnectionStatusHandler(ConnectionStatusHandler handler) = 0;
    virtual OperationResult setMessageHandler(MessageHandler handler, const CancellationToken& token) = 0;
    virtual OperationResult setDesiredPropertyUpdateHandler(DesiredPropertyHandler handler,
                                                            const CancellationToken& token) = 0;

    virtual OperationResult getTwin(TwinDocument& twin, const CancellationToken& token) = 0;
    virtual OperationResult updateReportedProperties(const nlohmann::json& patch,
                                                     const CancellationToken& token) = 0;

    virtual ConnectionStatusInfo connectionStatusInfo() const = 0;
};

class IDeviceClientFactory {
public:
    virtual ~IDeviceClientFactory() = default;

    virtual std::shared_ptr<IDeviceClient> create(const std::string& connectionString) = 0;
};

} // namespace hublink::ports

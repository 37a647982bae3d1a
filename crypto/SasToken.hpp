#pragma once

#include "IClock.hpp"
#include <cstdint>
#include <string>

namespace hublink {

// Parsed IoT hub device connection string:
// "HostName=...;DeviceId=...;SharedAccessKey=...[;ModuleId=...][;GatewayHostName=...]"
struct ConnectionString {
    std::string hostName;
    std::string deviceId;
    std::string sharedAccessKey;
    std::string moduleId;
    std::string gatewayHostName;

    // Throws std::runtime_error when a required field is missing or malformed
    static ConnectionString parse(const std::string& text);

    // "<host>/devices/<deviceId>[/modules/<moduleId>]"
    std::string resourceUri() const;

    // Host the transport connects to (gateway when present)
    std::string endpointHost() const;

    // MQTT client id: deviceId or deviceId/moduleId
    std::string clientId() const;
};

class SasToken {
public:
    static constexpr std::uint64_t kDefaultTtlSeconds = 3600;

    static std::string generate(const ConnectionString& connection,
                                const IClock& clock,
                                std::uint64_t ttlSeconds = kDefaultTtlSeconds);

    static std::string generate(const std::string& resourceUri,
                                const std::string& keyBase64,
                                std::uint64_t expiryEpochSeconds);

    static std::string urlEncode(const std::string& value);
    static std::string urlDecode(const std::string& value);
    static std::string base64Decode(const std::string& encoded);
    static std::string base64Encode(const std::string& data);

private:
    static std::string hmacSha256(const std::string& key, const std::string& message);
};

} // namespace hublink

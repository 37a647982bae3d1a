#pragma once

#include <map>
#include <string>

namespace hublink {

/// Device-to-cloud message
struct TelemetryMessage {
    std::string messageId;
    std::string payload;
    std::string contentType = "application/json";
    std::string contentEncoding = "utf-8";
    std::map<std::string, std::string> properties;
};

/// Cloud-to-device message; lockToken identifies it when completing
struct CloudMessage {
    std::string lockToken;
    std::string messageId;
    std::string payload;
    std::map<std::string, std::string> properties;
};

} // namespace hublink

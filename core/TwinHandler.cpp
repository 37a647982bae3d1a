#include "TwinHandler.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <system_error>

namespace hublink {

namespace {

constexpr const char* kComponent = "TwinProtocol";
constexpr std::chrono::milliseconds kWaitSlice{50};

std::string queryValue(const std::string& topic, const std::string& key) {
    const std::string marker = key + "=";
    auto pos = topic.find("?" + marker);
    if (pos == std::string::npos) {
        pos = topic.find("&" + marker);
    }
    if (pos == std::string::npos) {
        return {};
    }
    const auto start = pos + 1 + marker.size();
    const auto end = topic.find('&', start);
    return topic.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

// Unsigned decimal; anything else, including a value that overflows T, is 0
template <typename T>
T parseDigits(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        return 0;
    }
    T value = 0;
    const char* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return 0;
    }
    return value;
}

// Non-negative integer that fits std::int64_t, otherwise 0
std::int64_t versionOf(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const auto version = value.get<std::uint64_t>();
        return version > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
            ? 0 : static_cast<std::int64_t>(version);
    }
    if (value.is_number_integer()) {
        return std::max<std::int64_t>(0, value.get<std::int64_t>());
    }
    return 0;
}

} // namespace

std::vector<std::string> TwinHandler::subscriptionTopics() {
    return {std::string(kResponseTopicPrefix) + "#", std::string(kDesiredPatchTopicPrefix) + "#"};
}

std::string TwinHandler::getTopic(const std::string& requestId) {
    return std::string(kGetTopicPrefix) + "?$rid=" + requestId;
}

std::string TwinHandler::reportedPatchTopic(const std::string& requestId) {
    return std::string(kReportedTopicPrefix) + "?$rid=" + requestId;
}

std::string TwinHandler::beginRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string requestId = std::to_string(nextRequestId_++);
    pending_[requestId] = Pending{};
    return requestId;
}

OperationResult TwinHandler::awaitResponse(const std::string& requestId,
                                           std::chrono::milliseconds timeout,
                                           const CancellationToken& token,
                                           TwinResponse& response) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    for (;;) {
        auto it = pending_.find(requestId);
        if (it == pending_.end()) {
            return OperationResult::fatal(ErrorCode::InvalidArgument, "Unknown twin request " + requestId);
        }
        if (it->second.done) {
            response = std::move(it->second.response);
            pending_.erase(it);
            if (response.status == 0) {
                return OperationResult::transient(ErrorCode::NotConnected, "Connection lost while waiting for twin response");
            }
            return OperationResult::success();
        }
        if (token.isCancellationRequested()) {
            pending_.erase(it);
            return OperationResult::canceled("Twin request canceled");
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            pending_.erase(it);
            return OperationResult::transient(ErrorCode::Timeout, "Twin request " + requestId + " timed out");
        }
        responded_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice));
    }
}

void TwinHandler::abandonRequest(const std::string& requestId) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(requestId);
}

void TwinHandler::failPending() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : pending_) {
            entry.second.done = true;
            entry.second.response = TwinResponse{};
        }
    }
    responded_.notify_all();
}

bool TwinHandler::handleMqttMessage(const MqttMessage& message) {
    if (message.topic.rfind(kResponseTopicPrefix, 0) == 0) {
        processResponse(message.topic, message.payload);
        return true;
    }
    if (message.topic.rfind(kDesiredPatchTopicPrefix, 0) == 0) {
        processDesiredPatch(message.topic, message.payload);
        return true;
    }
    return false;
}

void TwinHandler::setDesiredPatchCallback(DesiredPatchCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    desiredCallback_ = std::move(callback);
}

void TwinHandler::processResponse(const std::string& topic, const std::string& payload) {
    const int status = extractStatusCode(topic);
    const std::string requestId = extractRequestId(topic);
    if (status == 0) {
        logWarn(kComponent) << "ignoring twin response without a valid status: " << topic;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(requestId);
        if (it == pending_.end()) {
            logDebug(kComponent) << "response for unknown request " << requestId << " (status " << status << ")";
            return;
        }
        it->second.done = true;
        it->second.response.status = status;
        it->second.response.payload = payload;
    }
    logDebug(kComponent) << "response for request " << requestId << " with status " << status;
    responded_.notify_all();
}

void TwinHandler::processDesiredPatch(const std::string& topic, const std::string& payload) {
    nlohmann::json desired;
    try {
        desired = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        logError(kComponent) << "discarding malformed desired patch: " << e.what();
        return;
    }

    std::int64_t version = extractVersion(topic);
    if (version == 0 && desired.is_object() && desired.contains("$version")) {
        version = versionOf(desired["$version"]);
    }

    DesiredPatchCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = desiredCallback_;
    }
    if (callback) {
        callback(desired, version);
    } else {
        logDebug(kComponent) << "desired patch version " << version << " dropped, no handler";
    }
}

OperationResult TwinHandler::resultForStatus(int status, const std::string& operation) {
    if (status >= 200 && status < 300) {
        return OperationResult::success();
    }
    const std::string message = operation + " returned status " + std::to_string(status);
    if (status == 401 || status == 403) {
        return OperationResult::fatal(ErrorCode::Unauthorized, message);
    }
    if (status == 404) {
        return OperationResult::fatal(ErrorCode::DeviceNotFound, message);
    }
    if (status == 429) {
        return OperationResult::transient(ErrorCode::Throttled, message);
    }
    if (status >= 500) {
        return OperationResult::transient(ErrorCode::ServerBusy, message);
    }
    return OperationResult::fatal(ErrorCode::InvalidResponse, message);
}

OperationResult TwinHandler::parseTwinDocument(const std::string& payload, ports::TwinDocument& twin) {
    try {
        const nlohmann::json document = nlohmann::json::parse(payload);
        twin.desired = document.value("desired", nlohmann::json::object());
        twin.reported = document.value("reported", nlohmann::json::object());
        twin.desiredVersion = twin.desired.contains("$version") ? versionOf(twin.desired["$version"]) : 0;
        return OperationResult::success();
    } catch (const nlohmann::json::exception& e) {
        return OperationResult::fatal(ErrorCode::InvalidResponse, std::string("Malformed twin document: ") + e.what());
    }
}

int TwinHandler::extractStatusCode(const std::string& topic) {
    const std::string prefix = kResponseTopicPrefix;
    if (topic.rfind(prefix, 0) != 0) {
        return 0;
    }
    const auto end = topic.find('/', prefix.size());
    const std::string code = topic.substr(prefix.size(), end == std::string::npos ? std::string::npos : end - prefix.size());
    return parseDigits<int>(code);
}

std::string TwinHandler::extractRequestId(const std::string& topic) {
    return queryValue(topic, "$rid");
}

std::int64_t TwinHandler::extractVersion(const std::string& topic) {
    const std::string version = queryValue(topic, "$version");
    return parseDigits<std::int64_t>(version);
}

std::size_t TwinHandler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace hublink

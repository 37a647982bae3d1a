#include "DeviceApp.hpp"
#include "../Logger.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <thread>

namespace hublink::domain {

namespace {

constexpr const char* kComponent = "App";
constexpr int kTemperatureAlertThreshold = 30;

std::shared_ptr<const RetryExecutor> makeExecutor(const std::shared_ptr<IRng>& rng,
                                                  adapters::BackoffOptions options) {
    auto policy = std::make_shared<adapters::JitteredExponentialBackoffPolicy>(rng, std::move(options));
    return std::make_shared<RetryExecutor>(policy);
}

} // namespace

DeviceApp::DeviceApp(std::shared_ptr<ports::IDeviceClientFactory> factory,
                     std::shared_ptr<IRng> rng,
                     DeviceAppConfig config,
                     CancellationSource appCancellation)
    : rng_(std::move(rng))
    , config_(std::move(config))
    , appCancellation_(std::move(appCancellation)) {
    if (!rng_) {
        throw std::invalid_argument("DeviceApp: rng cannot be null");
    }

    // A rejected credential is resolved by the status handler through
    // re-initialization, so operations keep retrying meanwhile.
    adapters::BackoffOptions backoff = config_.backoff;
    backoff.alwaysRetry.insert(ErrorCode::Unauthorized);
    executor_ = makeExecutor(rng_, backoff);

    backoff.alwaysRetry.insert(ErrorCode::MessageLockLost);
    receiveExecutor_ = makeExecutor(rng_, backoff);

    auto credentials = std::make_shared<CredentialSet>(config_.connectionStrings);
    lifecycle_ = std::make_shared<ConnectionLifecycleManager>(
        std::move(factory), credentials, executor_, appCancellation_, config_.lifecycle);

    std::weak_ptr<ConnectionLifecycleManager> weakLifecycle = lifecycle_;
    twin_ = std::make_shared<TwinReconciler>(
        [weakLifecycle] {
            auto lifecycle = weakLifecycle.lock();
            return lifecycle ? lifecycle->currentClient() : nullptr;
        },
        [weakLifecycle] {
            auto lifecycle = weakLifecycle.lock();
            return lifecycle && lifecycle->isConnected();
        },
        executor_);

    auto twin = twin_;
    lifecycle_->setConnectedHandler([twin](const CancellationToken& token) {
        const OperationResult result = twin->reconcile(token);
        if (!result.ok() && !result.isCanceled()) {
            logError(kComponent) << "twin reconciliation failed: " << result;
        }
    });

    const CancellationToken appToken = appCancellation_.token();
    lifecycle_->setDesiredPropertyHandler([this, twin, appToken](const nlohmann::json& desired, std::int64_t version) {
        twinUpdates_.spawn("DesiredPropertyUpdate", [twin, desired, version, appToken] {
            twin->onDesiredPropertyUpdate(desired, version, appToken);
        });
    });

    if (config_.receiveMode == ReceiveMode::Callback) {
        lifecycle_->setMessageHandler([this](const CloudMessage& message) { onCloudMessage(message); });
    }
}

DeviceApp::~DeviceApp() {
    twinUpdates_.drain();
}

OperationResult DeviceApp::run() {
    const CancellationToken token = appCancellation_.token();

    logInfo(kComponent) << "starting with " << config_.connectionStrings.size()
                        << " connection string(s), receive mode "
                        << (config_.receiveMode == ReceiveMode::Poll ? "poll" : "callback");

    OperationResult initialized = lifecycle_->initialize(token);
    if (!initialized.ok() && !initialized.isCanceled()) {
        logError(kComponent) << "initialization failed: " << initialized;
        appCancellation_.cancel();
        twinUpdates_.drain();
        lifecycle_->shutdown();
        return initialized;
    }

    std::thread receiver;
    if (config_.receiveMode == ReceiveMode::Poll) {
        receiver = std::thread([this, token] { receiveLoop(token); });
    }

    sendLoop(token);

    if (receiver.joinable()) {
        receiver.join();
    }

    logInfo(kComponent) << "cancellation requested, shutting down after "
                        << sent_.load() << " message(s) sent";
    twinUpdates_.drain();
    const OperationResult closed = lifecycle_->shutdown();
    if (!closed.ok()) {
        logWarn(kComponent) << "closing client failed: " << closed;
    }
    return OperationResult::success();
}

TelemetryMessage DeviceApp::createTelemetryMessage(int number, IRng& rng) {
    const int temperature = rng.uniformInt(20, 34);
    const int humidity = rng.uniformInt(60, 79);

    nlohmann::json body = {{"temperature", temperature}, {"humidity", humidity}};

    TelemetryMessage message;
    message.messageId = std::to_string(number);
    message.payload = body.dump();
    message.properties["temperatureAlert"] = temperature > kTemperatureAlertThreshold ? "true" : "false";
    return message;
}

void DeviceApp::sendLoop(const CancellationToken& token) {
    int messageNumber = 0;

    while (!token.isCancellationRequested()) {
        if (lifecycle_->isConnected()) {
            const TelemetryMessage message = createTelemetryMessage(++messageNumber, *rng_);
            const std::string name = "SendTelemetryMessage_" + std::to_string(messageNumber);

            RetryReport report = executor_->run(
                name,
                [this, &message, &token] {
                    auto client = lifecycle_->currentClient();
                    if (!client) {
                        return OperationResult::transient(ErrorCode::NotConnected, "no client");
                    }
                    return client->sendEvent(message, token);
                },
                [this] { return lifecycle_->isConnected(); },
                token);

            if (report.result.ok()) {
                sent_.fetch_add(1);
                logInfo(kComponent) << "sent message " << message.messageId << ": " << message.payload;
            } else if (report.result.isCanceled()) {
                break;
            } else {
                logError(kComponent) << name << " failed: " << report.result;
            }
        }

        if (!token.waitFor(config_.sendInterval)) {
            break;
        }
    }
}

void DeviceApp::receiveLoop(const CancellationToken& token) {
    while (!token.isCancellationRequested()) {
        RetryReport report = receiveExecutor_->run(
            "ReceiveAndCompleteC2DMessage",
            [this, &token] {
                auto client = lifecycle_->currentClient();
                if (!client) {
                    return OperationResult::transient(ErrorCode::NotConnected, "no client");
                }

                std::optional<CloudMessage> message;
                OperationResult received = client->receive(message, config_.receiveTimeout, token);
                if (!received.ok()) {
                    return received;
                }
                if (!message) {
                    logInfo(kComponent) << "No message received";
                    return OperationResult::success();
                }

                received_.fetch_add(1);
                logCloudMessage(*message);
                return client->complete(*message, token);
            },
            [this] { return lifecycle_->isConnected(); },
            token);

        if (report.result.isCanceled()) {
            break;
        }
        if (!report.result.ok()) {
            logError(kComponent) << "receiving messages failed: " << report.result;
            if (!token.waitFor(config_.receiveTimeout)) {
                break;
            }
        }
    }
}

void DeviceApp::onCloudMessage(const CloudMessage& message) {
    received_.fetch_add(1);
    logCloudMessage(message);

    auto client = lifecycle_->currentClient();
    if (!client) {
        return;
    }
    const OperationResult completed = client->complete(message, appCancellation_.token());
    if (!completed.ok() && !completed.isCanceled()) {
        logWarn(kComponent) << "completing message " << message.messageId << " failed: " << completed;
    }
}

void DeviceApp::logCloudMessage(const CloudMessage& message) const {
    auto line = logInfo(kComponent);
    line << "received message " << message.messageId << ": " << message.payload;
    for (const auto& property : message.properties) {
        line << " [" << property.first << "=" << property.second << "]";
    }
}

} // namespace hublink::domain

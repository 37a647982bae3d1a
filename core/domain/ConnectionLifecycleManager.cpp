#include "ConnectionLifecycleManager.hpp"
#include "../Logger.hpp"
#include <stdexcept>

namespace hublink::domain {

namespace {

constexpr const char* kComponent = "Lifecycle";

} // namespace

ConnectionLifecycleManager::ConnectionLifecycleManager(std::shared_ptr<ports::IDeviceClientFactory> factory,
                                                       std::shared_ptr<CredentialSet> credentials,
                                                       std::shared_ptr<const RetryExecutor> executor,
                                                       CancellationSource appCancellation,
                                                       LifecycleOptions options)
    : factory_(std::move(factory))
    , credentials_(std::move(credentials))
    , executor_(std::move(executor))
    , appCancellation_(std::move(appCancellation))
    , options_(options) {
    if (!factory_) {
        throw std::invalid_argument("ConnectionLifecycleManager: client factory cannot be null");
    }
    if (!credentials_) {
        throw std::invalid_argument("ConnectionLifecycleManager: credential set cannot be null");
    }
    if (!executor_) {
        throw std::invalid_argument("ConnectionLifecycleManager: retry executor cannot be null");
    }
}

ConnectionLifecycleManager::~ConnectionLifecycleManager() {
    tasks_.drain();
}

void ConnectionLifecycleManager::setMessageHandler(ports::IDeviceClient::MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    messageHandler_ = std::move(handler);
}

void ConnectionLifecycleManager::setDesiredPropertyHandler(ports::IDeviceClient::DesiredPropertyHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    desiredHandler_ = std::move(handler);
}

void ConnectionLifecycleManager::setConnectedHandler(ConnectedHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    connectedHandler_ = std::move(handler);
}

std::shared_ptr<ports::IDeviceClient> ConnectionLifecycleManager::currentClient() const {
    return std::atomic_load(&client_);
}

bool ConnectionLifecycleManager::isConnected() const {
    if (!currentClient()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(statusMutex_);
    return lastStatus_.status == ConnectionStatus::Connected;
}

ConnectionStatusInfo ConnectionLifecycleManager::lastStatus() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return lastStatus_;
}

bool ConnectionLifecycleManager::shouldInitialize() const {
    if (shutdown_.load() || credentials_->empty()) {
        return false;
    }
    if (!currentClient()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(statusMutex_);
    return lastStatus_.status == ConnectionStatus::Disconnected ||
           lastStatus_.status == ConnectionStatus::Disabled;
}

OperationResult ConnectionLifecycleManager::initialize(const CancellationToken& token) {
    if (token.isCancellationRequested() || shutdown_.load()) {
        return OperationResult::canceled("Initialization canceled");
    }

    if (!shouldInitialize()) {
        logDebug(kComponent) << "initialization not needed (generation " << generation() << ")";
        return credentials_->empty()
            ? OperationResult::fatal(ErrorCode::Unauthorized, "No credentials left")
            : OperationResult::success();
    }

    OperationResult openResult;
    {
        std::lock_guard<std::mutex> gate(initMutex_);
        if (!shouldInitialize()) {
            logDebug(kComponent) << "initialization already done by a concurrent caller";
            return credentials_->empty()
                ? OperationResult::fatal(ErrorCode::Unauthorized, "No credentials left")
                : OperationResult::success();
        }
        openResult = replaceClient(token);
    }

    if (!openResult.ok()) {
        if (openResult.isCanceled()) {
            return openResult;
        }
        openResult = retryOpen(std::move(openResult), token);
        if (!openResult.ok()) {
            return openResult;
        }
    }

    return subscribeCallbacks(token);
}

OperationResult ConnectionLifecycleManager::replaceClient(const CancellationToken& token) {
    auto previous = currentClient();
    if (previous) {
        OperationResult closed = previous->close(token);
        if (!closed.ok()) {
            if (closed.code == ErrorCode::Unauthorized) {
                logDebug(kComponent) << "closing previous client rejected its credential, ignored";
            } else {
                logWarn(kComponent) << "closing previous client failed: " << closed;
            }
        }
    }

    auto credential = credentials_->head();
    if (!credential) {
        return OperationResult::fatal(ErrorCode::Unauthorized, "No credentials left");
    }

    auto client = factory_->create(*credential);
    if (!client) {
        return OperationResult::fatal(ErrorCode::Unknown, "Client factory returned no client");
    }

    const std::uint64_t generation = generation_.load() + 1;
    client->setConnectionStatusHandler([this, generation](const ConnectionStatusInfo& info) {
        onConnectionStatusChanged(generation, info);
    });

    // Published under the same lock as the generation check in onConnectionStatusChanged.
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        activeCredential_ = *credential;
        lastStatus_ = client->connectionStatusInfo();
        std::atomic_store(&client_, client);
        generation_.store(generation);
    }
    initializations_.fetch_add(1);

    logInfo(kComponent) << "initialized client generation " << generation
                        << " with credential #" << credentials_->headIndex();

    OperationResult opened = client->open(token);
    if (opened.ok()) {
        logInfo(kComponent) << "client generation " << generation << " opened";
    } else {
        logWarn(kComponent) << "opening client generation " << generation << " failed: " << opened;
    }

    // Resync with the handle in case it failed without notifying.
    std::lock_guard<std::mutex> lock(statusMutex_);
    if (generation_.load() == generation) {
        lastStatus_ = client->connectionStatusInfo();
    }
    return opened;
}

OperationResult ConnectionLifecycleManager::retryOpen(OperationResult firstFailure, const CancellationToken& token) {
    const ports::RetryDecision decision = executor_->policy().shouldRetry(1, firstFailure);
    if (!decision.retry) {
        return firstFailure;
    }
    if (!token.waitFor(decision.delay)) {
        return OperationResult::canceled("Open canceled");
    }

    RetryReport report = executor_->run(
        "OpenConnection",
        [this, &token] {
            auto client = currentClient();
            if (!client) {
                return OperationResult::transient(ErrorCode::NotConnected, "no client");
            }
            if (client->connectionStatusInfo().status == ConnectionStatus::Connected) {
                return OperationResult::success();
            }
            return client->open(token);
        },
        [this] { return currentClient() != nullptr && !credentials_->empty(); },
        token);
    return report.result;
}

OperationResult ConnectionLifecycleManager::subscribeCallbacks(const CancellationToken& token) {
    ports::IDeviceClient::MessageHandler messageHandler;
    ports::IDeviceClient::DesiredPropertyHandler desiredHandler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        messageHandler = messageHandler_;
        desiredHandler = desiredHandler_;
    }

    auto ready = [this] { return isConnected(); };

    if (messageHandler) {
        RetryReport report = executor_->run(
            "SetMessageHandler",
            [this, &messageHandler, &token] {
                auto client = currentClient();
                if (!client) {
                    return OperationResult::transient(ErrorCode::NotConnected, "no client");
                }
                return client->setMessageHandler(messageHandler, token);
            },
            ready, token);
        if (!report.result.ok()) {
            return report.result;
        }
    }

    if (desiredHandler) {
        RetryReport report = executor_->run(
            "SetDesiredPropertyUpdateHandler",
            [this, &desiredHandler, &token] {
                auto client = currentClient();
                if (!client) {
                    return OperationResult::transient(ErrorCode::NotConnected, "no client");
                }
                return client->setDesiredPropertyUpdateHandler(desiredHandler, token);
            },
            ready, token);
        if (!report.result.ok()) {
            return report.result;
        }
    }

    return OperationResult::success();
}

void ConnectionLifecycleManager::onConnectionStatusChanged(std::uint64_t generation,
                                                           const ConnectionStatusInfo& info) {
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        if (generation != generation_.load()) {
            logDebug(kComponent) << "ignoring notification from superseded client generation "
                                 << generation << ": " << info;
            return;
        }
        lastStatus_ = info;
    }
    logInfo(kComponent) << "connection status changed (generation " << generation << "): " << info;

    if (shutdown_.load()) {
        return;
    }

    switch (info.status) {
        case ConnectionStatus::Connected: {
            ConnectedHandler handler;
            {
                std::lock_guard<std::mutex> lock(handlersMutex_);
                handler = connectedHandler_;
            }
            if (handler) {
                const CancellationToken token = appCancellation_.token();
                tasks_.spawn("OnConnected", [handler, token] { handler(token); });
            }
            return;
        }

        case ConnectionStatus::DisconnectedRetrying:
            logInfo(kComponent) << "transport is retrying, waiting for its retry policy";
            return;

        case ConnectionStatus::Disabled:
            logInfo(kComponent) << "client closed, a new initialization is required to resume";
            return;

        case ConnectionStatus::Disconnected:
            break;
    }

    switch (info.reason) {
        case ConnectionStatusReason::BadCredential:
            tasks_.spawn("HandleBadCredential", [this, generation] { handleBadCredential(generation); });
            return;

        case ConnectionStatusReason::DeviceDisabled:
            logError(kComponent) << "device is disabled on the hub, stopping";
            appCancellation_.cancel();
            return;

        case ConnectionStatusReason::RetryExpired:
            if (options_.reinitializeOnRetryExpired) {
                reinitializeInBackground("RetryExpired");
            } else {
                logWarn(kComponent) << "transport retries expired, re-initialization disabled";
            }
            return;

        case ConnectionStatusReason::CommunicationError:
            if (options_.reinitializeOnCommunicationError) {
                reinitializeInBackground("CommunicationError");
            } else {
                logWarn(kComponent) << "communication error, re-initialization disabled";
            }
            return;

        default:
            logError(kComponent) << "unexpected connection status: " << info;
            return;
    }
}

void ConnectionLifecycleManager::handleBadCredential(std::uint64_t generation) {
    std::string rejected;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        if (badCredentialHandled_ >= generation || generation != generation_.load()) {
            logDebug(kComponent) << "bad credential for generation " << generation << " already handled";
            return;
        }
        badCredentialHandled_ = generation;
        rejected = activeCredential_;
    }

    const std::size_t remaining = credentials_->discardIfHead(rejected);
    if (remaining == 0) {
        logError(kComponent) << "credential rejected and no credentials left, stopping";
        appCancellation_.cancel();
        return;
    }

    logWarn(kComponent) << "credential rejected, " << remaining << " credential(s) left, re-initializing";
    const OperationResult result = initialize(appCancellation_.token());
    if (result.isCanceled()) {
        logInfo(kComponent) << "re-initialization canceled";
    } else if (!result.ok()) {
        logError(kComponent) << "re-initialization after bad credential failed: " << result;
    }
}

void ConnectionLifecycleManager::reinitializeInBackground(const char* trigger) {
    const std::string name = std::string("Reinitialize_") + trigger;
    tasks_.spawn(name, [this, name] {
        const OperationResult result = initialize(appCancellation_.token());
        if (result.isCanceled()) {
            logInfo(kComponent) << name << " canceled";
        } else if (!result.ok()) {
            logError(kComponent) << name << " failed: " << result;
        }
    });
}

OperationResult ConnectionLifecycleManager::shutdown() {
    if (shutdown_.exchange(true)) {
        return OperationResult::success();
    }

    OperationResult result;
    {
        std::lock_guard<std::mutex> gate(initMutex_);
        auto client = currentClient();
        if (client) {
            CancellationSource cleanup;
            result = client->close(cleanup.token());
            if (!result.ok() && result.code == ErrorCode::Unauthorized) {
                result = OperationResult::success();
            }
            logInfo(kComponent) << "client generation " << generation() << " closed: " << result;
        }
    }

    tasks_.drain();
    return result;
}

} // namespace hublink::domain

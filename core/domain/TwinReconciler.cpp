#include "TwinReconciler.hpp"
#include "../Logger.hpp"
#include <stdexcept>

namespace hublink::domain {

namespace {

constexpr const char* kComponent = "Twin";

OperationResult noClient() {
    return OperationResult::transient(ErrorCode::NotConnected, "no client");
}

} // namespace

TwinReconciler::TwinReconciler(ClientProvider clientProvider,
                               ReadinessCheck isReady,
                               std::shared_ptr<const RetryExecutor> executor)
    : clientProvider_(std::move(clientProvider))
    , isReady_(std::move(isReady))
    , executor_(std::move(executor)) {
    if (!clientProvider_) {
        throw std::invalid_argument("TwinReconciler: client provider cannot be empty");
    }
    if (!executor_) {
        throw std::invalid_argument("TwinReconciler: retry executor cannot be null");
    }
}

OperationResult TwinReconciler::reconcile(const CancellationToken& token) {
    ports::TwinDocument twin;
    RetryReport report = executor_->run(
        "GetTwin",
        [this, &twin, &token] {
            auto client = clientProvider_();
            return client ? client->getTwin(twin, token) : noClient();
        },
        isReady_, token);

    if (report.result.isCanceled()) {
        logInfo(kComponent) << "reconciliation canceled";
        return report.result;
    }
    if (!report.result.ok()) {
        logError(kComponent) << "fetching twin failed: " << report.result;
        return report.result;
    }

    logInfo(kComponent) << "fetched twin, desired version " << twin.desiredVersion
                        << ", local watermark " << watermark();
    return applyIfNewer(twin.desired, twin.desiredVersion, token);
}

OperationResult TwinReconciler::onDesiredPropertyUpdate(const nlohmann::json& desired,
                                                        std::int64_t version,
                                                        const CancellationToken& token) {
    logInfo(kComponent) << "desired property update received, version " << version;
    return applyIfNewer(desired, version, token);
}

OperationResult TwinReconciler::applyIfNewer(const nlohmann::json& desired,
                                             std::int64_t version,
                                             const CancellationToken& token) {
    std::lock_guard<std::mutex> lock(applyMutex_);
    if (version <= watermark_.load()) {
        logInfo(kComponent) << "desired version " << version << " already applied (watermark "
                            << watermark_.load() << "), skipping";
        return OperationResult::success();
    }
    return apply(desired, version, token);
}

OperationResult TwinReconciler::apply(const nlohmann::json& desired,
                                      std::int64_t version,
                                      const CancellationToken& token) {
    nlohmann::json reported = nlohmann::json::object();
    if (desired.is_object()) {
        for (auto it = desired.begin(); it != desired.end(); ++it) {
            if (!it.key().empty() && it.key().front() == '$') {
                continue;
            }
            logInfo(kComponent) << "desired " << it.key() << " = " << it.value().dump();
            reported[it.key()] = it.value();
        }
    }

    const std::int64_t previous = watermark_.exchange(version);
    applied_.fetch_add(1);
    logInfo(kComponent) << "watermark advanced " << previous << " -> " << version;

    RetryReport report = executor_->run(
        "UpdateReportedProperties",
        [this, &reported, &token] {
            auto client = clientProvider_();
            return client ? client->updateReportedProperties(reported, token) : noClient();
        },
        isReady_, token);

    if (report.result.isCanceled()) {
        logInfo(kComponent) << "reporting properties canceled";
        return OperationResult::success();
    }
    if (!report.result.ok()) {
        logError(kComponent) << "reporting properties failed: " << report.result;
    }
    return report.result;
}

} // namespace hublink::domain

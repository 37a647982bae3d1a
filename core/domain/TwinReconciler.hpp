/**
 * @file TwinReconciler.hpp
 * @brief Keeps reported properties in step with the desired-property document
 *
 * Holds the version watermark: the highest desired-property version already
 * applied. Both the live update path and reconnect reconciliation go through
 * the same guarded apply step, so a version at or below the watermark is never
 * applied twice.
 *
 * @date 2025
 * @version 1.0
 *
 * @note Accept-all policy: every desired key is echoed as a reported property
 */

#pragma once

#include "../CancellationToken.hpp"
#include "../OperationResult.hpp"
#include "../ports/IDeviceClient.hpp"
#include "RetryExecutor.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace hublink::domain {

class TwinReconciler {
public:
    using ClientProvider = std::function<std::shared_ptr<ports::IDeviceClient>()>;
    using ReadinessCheck = RetryExecutor::ReadinessCheck;

    static constexpr std::int64_t kInitialWatermark = 1;

    /**
     * @param clientProvider Returns the current handle (may change between calls)
     * @param isReady Readiness predicate for twin operations
     * @param executor Retry executor for GetTwin and UpdateReportedProperties
     */
    TwinReconciler(ClientProvider clientProvider,
                   ReadinessCheck isReady,
                   std::shared_ptr<const RetryExecutor> executor);

    /**
     * @brief Fetch the twin and apply its desired properties if they are newer
     * @return Success (applied or nothing to do), Canceled, or the fetch failure
     */
    OperationResult reconcile(const CancellationToken& token);

    /**
     * @brief Live desired-property notification
     * @param desired Desired properties as delivered by the hub
     * @param version Version of @p desired
     */
    OperationResult onDesiredPropertyUpdate(const nlohmann::json& desired,
                                            std::int64_t version,
                                            const CancellationToken& token);

    std::int64_t watermark() const { return watermark_.load(); }

    /// Number of updates actually applied
    std::size_t appliedCount() const { return applied_.load(); }

private:
    OperationResult applyIfNewer(const nlohmann::json& desired, std::int64_t version, const CancellationToken& token);
    OperationResult apply(const nlohmann::json& desired, std::int64_t version, const CancellationToken& token);

    ClientProvider clientProvider_;
    ReadinessCheck isReady_;
    std::shared_ptr<const RetryExecutor> executor_;

    std::mutex applyMutex_;
    std::atomic<std::int64_t> watermark_{kInitialWatermark};
    std::atomic<std::size_t> applied_{0};
};

} // namespace hublink::domain

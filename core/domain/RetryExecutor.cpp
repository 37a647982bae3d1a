#include "RetryExecutor.hpp"
#include "../Logger.hpp"
#include <stdexcept>

namespace hublink::domain {

RetryExecutor::RetryExecutor(std::shared_ptr<const ports::IRetryPolicy> policy)
    : policy_(std::move(policy)) {
    if (!policy_) {
        throw std::invalid_argument("RetryExecutor: policy cannot be null");
    }
}

RetryReport RetryExecutor::run(const std::string& name,
                               const Operation& operation,
                               const ReadinessCheck& isReady,
                               const CancellationToken& token) const {
    RetryReport report;
    int failures = 0;

    while (!token.isCancellationRequested()) {
        OperationResult lastFailure;

        if (isReady && !isReady()) {
            ++report.skipped;
            logInfo("Retry") << name << ": client not ready, attempt discarded";
            lastFailure = OperationResult::transient(ErrorCode::NotConnected, "client not ready");
        } else {
            ++report.attempts;
            logDebug("Retry") << name << ": attempt " << report.attempts << " started";

            OperationResult result = operation();

            if (result.ok()) {
                logDebug("Retry") << name << ": attempt " << report.attempts << " succeeded";
                report.result = std::move(result);
                return report;
            }
            if (result.isCanceled()) {
                logInfo("Retry") << name << ": canceled during attempt " << report.attempts;
                report.result = std::move(result);
                return report;
            }

            ++failures;
            logWarn("Retry") << name << ": attempt " << report.attempts << " failed: " << result;
            lastFailure = std::move(result);
        }

        const ports::RetryDecision decision = policy_->shouldRetry(failures, lastFailure);
        if (!decision.retry) {
            logWarn("Retry") << name << ": giving up after " << report.attempts
                             << " attempt(s): " << lastFailure;
            report.result = std::move(lastFailure);
            return report;
        }

        if (!token.waitFor(decision.delay)) {
            break;
        }
    }

    logInfo("Retry") << name << ": canceled after " << report.attempts << " attempt(s)";
    report.result = OperationResult::canceled(name + " canceled");
    return report;
}

} // namespace hublink::domain

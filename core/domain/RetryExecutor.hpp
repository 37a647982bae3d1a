/**
 * @file RetryExecutor.hpp
 * @brief Runs an operation until it succeeds, the policy gives up or cancellation
 *
 * The operation returns an OperationResult instead of throwing; the executor
 * branches on its status. A readiness predicate gates each attempt: while it
 * reports false the attempt is skipped, logged, and not charged against the
 * retry policy's attempt counter.
 *
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "../CancellationToken.hpp"
#include "../OperationResult.hpp"
#include "../ports/IRetryPolicy.hpp"
#include <functional>
#include <memory>
#include <string>

namespace hublink::domain {

/// Outcome of one executor run
struct RetryReport {
    OperationResult result;   ///< Success, the last failure, or Canceled
    int attempts = 0;         ///< Executions of the operation
    int skipped = 0;          ///< Iterations skipped because the readiness check failed
};

class RetryExecutor {
public:
    using Operation = std::function<OperationResult()>;
    using ReadinessCheck = std::function<bool()>;

    explicit RetryExecutor(std::shared_ptr<const ports::IRetryPolicy> policy);

    /**
     * @brief Execute @p operation with retries
     * @param name Operation name used in log lines
     * @param operation Work to perform; must not throw for expected failures
     * @param isReady Readiness predicate; an empty function means always ready
     * @param token Cancellation; an interrupted delay ends the run as Canceled
     */
    RetryReport run(const std::string& name,
                    const Operation& operation,
                    const ReadinessCheck& isReady,
                    const CancellationToken& token) const;

    const ports::IRetryPolicy& policy() const { return *policy_; }

private:
    std::shared_ptr<const ports::IRetryPolicy> policy_;
};

} // namespace hublink::domain

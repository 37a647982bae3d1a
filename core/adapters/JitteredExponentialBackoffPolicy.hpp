#pragma once

#include "../ports/IRetryPolicy.hpp"
#include "../IRng.hpp"
#include <chrono>
#include <climits>
#include <memory>
#include <set>

namespace hublink::adapters {

struct BackoffOptions {
    int maxRetries = INT_MAX;
    int maxExponent = 20;
    std::chrono::milliseconds maxJitter{1000};
    std::set<ErrorCode> alwaysRetry;
};

// delay = |2^min(attempt, maxExponent) + jitter| ms, jitter uniform in [-maxJitter, +maxJitter)
class JitteredExponentialBackoffPolicy : public ports::IRetryPolicy {
public:
    explicit JitteredExponentialBackoffPolicy(std::shared_ptr<IRng> rng, BackoffOptions options = {});

    ports::RetryDecision shouldRetry(int attemptCount, const OperationResult& lastFailure) const override;

    std::chrono::milliseconds computeDelay(int attemptCount) const;
    bool isTransient(const OperationResult& failure) const;

    // Upper bound of any delay this policy can return
    std::chrono::milliseconds maxDelay() const;

    const BackoffOptions& options() const { return options_; }

private:
    std::shared_ptr<IRng> rng_;
    BackoffOptions options_;
};

} // namespace hublink::adapters

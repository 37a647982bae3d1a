#pragma once

#include "../OperationResult.hpp"
#include <chrono>

namespace hublink::ports {

struct RetryDecision {
    bool retry = false;
    std::chrono::milliseconds delay{0};
};

class IRetryPolicy {
public:
    virtual ~IRetryPolicy() = default;

    // attemptCount is the number of failed executions so far (1-based).
    virtual RetryDecision shouldRetry(int attemptCount, const OperationResult& lastFailure) const = 0;
};

} // namespace hublink::ports

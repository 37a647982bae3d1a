#include "JitteredExponentialBackoffPolicy.hpp"
#include "../Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hublink::adapters {

namespace {

constexpr int kExponentCeiling = 30;

bool isNetworkClass(ErrorCode code) {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout;
}

} // namespace

JitteredExponentialBackoffPolicy::JitteredExponentialBackoffPolicy(std::shared_ptr<IRng> rng,
                                                                   BackoffOptions options)
    : rng_(std::move(rng)), options_(std::move(options)) {
    if (!rng_) {
        throw std::invalid_argument("JitteredExponentialBackoffPolicy: rng cannot be null");
    }
    if (options_.maxExponent < 0 || options_.maxExponent > kExponentCeiling) {
        throw std::invalid_argument("JitteredExponentialBackoffPolicy: maxExponent must be within [0, 30]");
    }
    if (options_.maxJitter.count() < 0) {
        throw std::invalid_argument("JitteredExponentialBackoffPolicy: maxJitter cannot be negative");
    }
}

ports::RetryDecision JitteredExponentialBackoffPolicy::shouldRetry(int attemptCount,
                                                                   const OperationResult& lastFailure) const {
    if (lastFailure.isCanceled()) {
        return {};
    }

    if (attemptCount > options_.maxRetries) {
        logWarn("Backoff") << "attempt " << attemptCount << " exceeds max retries "
                           << options_.maxRetries << ", giving up: " << lastFailure;
        return {};
    }

    if (!isTransient(lastFailure)) {
        logInfo("Backoff") << "attempt " << attemptCount << " failed with non-transient error, "
                           << "not retrying: " << lastFailure;
        return {};
    }

    const auto delay = computeDelay(attemptCount);
    logInfo("Backoff") << "attempt " << attemptCount << " will be retried in "
                       << delay.count() << "ms: " << lastFailure;
    return {true, delay};
}

std::chrono::milliseconds JitteredExponentialBackoffPolicy::computeDelay(int attemptCount) const {
    const int exponent = std::clamp(attemptCount, 0, options_.maxExponent);
    const double base = static_cast<double>(1LL << exponent);
    const double jitterBound = static_cast<double>(options_.maxJitter.count());

    double jitter = 0.0;
    if (jitterBound > 0.0) {
        jitter = rng_->uniform(-jitterBound, jitterBound);
    }

    return std::chrono::milliseconds(static_cast<long long>(std::fabs(base + jitter)));
}

bool JitteredExponentialBackoffPolicy::isTransient(const OperationResult& failure) const {
    if (failure.status == OperationStatus::TransientFailure) {
        return true;
    }
    if (isNetworkClass(failure.code)) {
        return true;
    }
    return options_.alwaysRetry.count(failure.code) > 0;
}

std::chrono::milliseconds JitteredExponentialBackoffPolicy::maxDelay() const {
    return std::chrono::milliseconds((1LL << options_.maxExponent) + options_.maxJitter.count());
}

} // namespace hublink::adapters

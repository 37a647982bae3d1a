#include <gtest/gtest.h>
#include "../core/domain/RetryExecutor.hpp"
#include "../core/adapters/JitteredExponentialBackoffPolicy.hpp"
#include "../core/sim/FixedRng.hpp"
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace hublink;
using domain::RetryExecutor;

namespace {

// Records every question asked and answers with a fixed delay.
class RecordingPolicy : public ports::IRetryPolicy {
public:
    explicit RecordingPolicy(std::chrono::milliseconds delay, int maxRetries = 100)
        : delay_(delay), maxRetries_(maxRetries) {}

    ports::RetryDecision shouldRetry(int attemptCount, const OperationResult& lastFailure) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        attempts_.push_back(attemptCount);
        failures_.push_back(lastFailure);
        if (lastFailure.status != OperationStatus::TransientFailure || attemptCount > maxRetries_) {
            return {};
        }
        return {true, delay_};
    }

    std::vector<int> attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    std::vector<OperationResult> failures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_;
    }

private:
    std::chrono::milliseconds delay_;
    int maxRetries_;
    mutable std::mutex mutex_;
    mutable std::vector<int> attempts_;
    mutable std::vector<OperationResult> failures_;
};

// Returns scripted results in order, then success.
class ScriptedOperation {
public:
    explicit ScriptedOperation(std::deque<OperationResult> results) : results_(std::move(results)) {}

    OperationResult operator()() {
        ++calls_;
        if (results_.empty()) {
            return OperationResult::success();
        }
        OperationResult next = results_.front();
        results_.pop_front();
        return next;
    }

    int calls() const { return calls_; }

private:
    std::deque<OperationResult> results_;
    int calls_ = 0;
};

OperationResult transient() {
    return OperationResult::transient(ErrorCode::NetworkError, "connection reset");
}

} // namespace

class RetryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_ = std::make_shared<RecordingPolicy>(std::chrono::milliseconds(1));
        executor_ = std::make_unique<RetryExecutor>(policy_);
    }

    std::shared_ptr<RecordingPolicy> policy_;
    std::unique_ptr<RetryExecutor> executor_;
    CancellationSource cancellation_;
};

TEST_F(RetryExecutorTest, SucceedsOnFirstAttempt) {
    ScriptedOperation operation({});
    auto report = executor_->run("Op", std::ref(operation), nullptr, cancellation_.token());

    EXPECT_TRUE(report.result.ok());
    EXPECT_EQ(report.attempts, 1);
    EXPECT_EQ(report.skipped, 0);
    EXPECT_TRUE(policy_->attempts().empty());
}

TEST_F(RetryExecutorTest, RetriesTransientFailuresUntilSuccess) {
    ScriptedOperation operation({transient(), transient()});
    auto report = executor_->run("Op", std::ref(operation), [] { return true; }, cancellation_.token());

    EXPECT_TRUE(report.result.ok());
    EXPECT_EQ(report.attempts, 3);
    EXPECT_EQ(policy_->attempts(), (std::vector<int>{1, 2}));
}

TEST_F(RetryExecutorTest, StopsOnFatalFailure) {
    ScriptedOperation operation({OperationResult::fatal(ErrorCode::DeviceNotFound, "gone"), transient()});
    auto report = executor_->run("Op", std::ref(operation), nullptr, cancellation_.token());

    EXPECT_EQ(report.result.status, OperationStatus::FatalFailure);
    EXPECT_EQ(report.result.code, ErrorCode::DeviceNotFound);
    EXPECT_EQ(report.attempts, 1);
    EXPECT_EQ(operation.calls(), 1);
}

TEST_F(RetryExecutorTest, ReturnsLastFailureWhenRetriesRunOut) {
    auto policy = std::make_shared<RecordingPolicy>(std::chrono::milliseconds(1), 2);
    RetryExecutor executor(policy);

    ScriptedOperation operation({transient(), transient(),
                                 OperationResult::transient(ErrorCode::Throttled, "third"), transient()});
    auto report = executor.run("Op", std::ref(operation), nullptr, cancellation_.token());

    EXPECT_FALSE(report.result.ok());
    EXPECT_EQ(report.result.code, ErrorCode::Throttled);
    EXPECT_EQ(report.attempts, 3);
    EXPECT_EQ(policy->attempts(), (std::vector<int>{1, 2, 3}));
}

TEST_F(RetryExecutorTest, NotReadyIterationsAreSkippedWithoutCountingFailures) {
    int readinessChecks = 0;
    ScriptedOperation operation({transient()});
    auto isReady = [&readinessChecks] { return ++readinessChecks > 3; };

    auto report = executor_->run("Op", std::ref(operation), isReady, cancellation_.token());

    EXPECT_TRUE(report.result.ok());
    EXPECT_EQ(report.skipped, 3);
    EXPECT_EQ(report.attempts, 2);
    EXPECT_EQ(operation.calls(), 2);

    // Skips consult the policy with the failure count unchanged.
    EXPECT_EQ(policy_->attempts(), (std::vector<int>{0, 0, 0, 1}));
    EXPECT_EQ(policy_->failures().front().code, ErrorCode::NotConnected);
}

TEST_F(RetryExecutorTest, OperationCancellationIsReturnedImmediately) {
    ScriptedOperation operation({OperationResult::canceled("stop")});
    auto report = executor_->run("Op", std::ref(operation), nullptr, cancellation_.token());

    EXPECT_TRUE(report.result.isCanceled());
    EXPECT_EQ(report.attempts, 1);
    EXPECT_TRUE(policy_->attempts().empty());
}

TEST_F(RetryExecutorTest, CancelledTokenRunsNothing) {
    cancellation_.cancel();
    ScriptedOperation operation({});
    auto report = executor_->run("Op", std::ref(operation), nullptr, cancellation_.token());

    EXPECT_TRUE(report.result.isCanceled());
    EXPECT_EQ(report.attempts, 0);
    EXPECT_EQ(operation.calls(), 0);
}

TEST_F(RetryExecutorTest, CancellationInterruptsBackoffSleep) {
    auto policy = std::make_shared<RecordingPolicy>(std::chrono::seconds(30));
    RetryExecutor executor(policy);

    ScriptedOperation operation({transient()});
    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancellation_.cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto report = executor.run("Op", std::ref(operation), nullptr, cancellation_.token());
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_TRUE(report.result.isCanceled());
    EXPECT_EQ(report.attempts, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(RetryExecutorTest, WorksWithBackoffPolicy) {
    adapters::BackoffOptions options;
    options.maxExponent = 0;
    options.maxJitter = std::chrono::milliseconds(0);
    options.maxRetries = 3;
    RetryExecutor executor(std::make_shared<adapters::JitteredExponentialBackoffPolicy>(
        std::make_shared<sim::FixedRng>(), options));

    ScriptedOperation operation({transient(), transient(), transient(), transient(), transient()});
    auto report = executor.run("Op", std::ref(operation), nullptr, cancellation_.token());

    EXPECT_EQ(report.result.code, ErrorCode::NetworkError);
    EXPECT_EQ(report.attempts, 4);
}

TEST(RetryExecutorConstructionTest, RejectsNullPolicy) {
    EXPECT_THROW(RetryExecutor(nullptr), std::invalid_argument);
}

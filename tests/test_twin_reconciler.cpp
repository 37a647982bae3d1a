#include <gtest/gtest.h>
#include "../core/domain/TwinReconciler.hpp"
#include "../core/adapters/JitteredExponentialBackoffPolicy.hpp"
#include "../core/sim/FixedRng.hpp"
#include "../core/sim/MockDeviceClient.hpp"
#include <memory>
#include <thread>
#include <vector>

using namespace hublink;
using domain::RetryExecutor;
using domain::TwinReconciler;

class TwinReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        adapters::BackoffOptions options;
        options.maxExponent = 0;
        options.maxJitter = std::chrono::milliseconds(0);
        auto executor = std::make_shared<RetryExecutor>(std::make_shared<adapters::JitteredExponentialBackoffPolicy>(
            std::make_shared<sim::FixedRng>(), options));

        client_ = std::make_shared<sim::MockDeviceClient>("HostName=h;DeviceId=d;SharedAccessKey=a2V5");
        ASSERT_TRUE(client_->open(app_.token()).ok());

        auto client = client_;
        reconciler_ = std::make_unique<TwinReconciler>(
            [client] { return client; },
            [client] { return client->connectionStatusInfo().status == ConnectionStatus::Connected; },
            executor);
    }

    void serverTwin(std::int64_t version, int interval = 30) {
        client_->setTwin({{"telemetryInterval", interval}}, version);
    }

    std::shared_ptr<sim::MockDeviceClient> client_;
    CancellationSource app_;
    std::unique_ptr<TwinReconciler> reconciler_;
};

TEST_F(TwinReconcilerTest, StartsAtInitialWatermark) {
    EXPECT_EQ(reconciler_->watermark(), TwinReconciler::kInitialWatermark);
    EXPECT_EQ(reconciler_->appliedCount(), 0u);
}

TEST_F(TwinReconcilerTest, InitialServerVersionIsNotReapplied) {
    serverTwin(1);
    EXPECT_TRUE(reconciler_->reconcile(app_.token()).ok());

    EXPECT_EQ(client_->getTwinCalls(), 1);
    EXPECT_EQ(reconciler_->appliedCount(), 0u);
    EXPECT_TRUE(client_->reportedPatches().empty());
}

TEST_F(TwinReconcilerTest, SameVersionAsWatermarkAppliesNothing) {
    ASSERT_TRUE(reconciler_->onDesiredPropertyUpdate({{"telemetryInterval", 10}}, 5, app_.token()).ok());
    ASSERT_EQ(reconciler_->watermark(), 5);
    const auto patchesBefore = client_->reportedPatches().size();

    serverTwin(5);
    EXPECT_TRUE(reconciler_->reconcile(app_.token()).ok());

    EXPECT_EQ(reconciler_->appliedCount(), 1u);
    EXPECT_EQ(client_->reportedPatches().size(), patchesBefore);
    EXPECT_EQ(reconciler_->watermark(), 5);
}

TEST_F(TwinReconcilerTest, NewerServerVersionIsAppliedOnce) {
    ASSERT_TRUE(reconciler_->onDesiredPropertyUpdate({{"telemetryInterval", 10}}, 5, app_.token()).ok());

    serverTwin(7, 60);
    EXPECT_TRUE(reconciler_->reconcile(app_.token()).ok());

    EXPECT_EQ(reconciler_->watermark(), 7);
    EXPECT_EQ(reconciler_->appliedCount(), 2u);
    ASSERT_EQ(client_->reportedPatches().size(), 2u);
    EXPECT_EQ(client_->reportedPatches().back(), (nlohmann::json{{"telemetryInterval", 60}}));
}

TEST_F(TwinReconcilerTest, RepeatedReconcileIsIdempotent) {
    serverTwin(3);
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(reconciler_->reconcile(app_.token()).ok());
    }

    EXPECT_EQ(client_->getTwinCalls(), 4);
    EXPECT_EQ(reconciler_->appliedCount(), 1u);
    EXPECT_EQ(client_->reportedPatches().size(), 1u);
}

TEST_F(TwinReconcilerTest, WatermarkNeverDecreases) {
    const std::vector<std::int64_t> versions{3, 2, 5, 5, 4, 8, 1, 8};
    std::int64_t previous = reconciler_->watermark();

    for (std::int64_t version : versions) {
        ASSERT_TRUE(reconciler_->onDesiredPropertyUpdate({{"v", version}}, version, app_.token()).ok());
        EXPECT_GE(reconciler_->watermark(), previous);
        previous = reconciler_->watermark();
    }

    EXPECT_EQ(reconciler_->watermark(), 8);
    EXPECT_EQ(reconciler_->appliedCount(), 3u);
    ASSERT_EQ(client_->reportedPatches().size(), 3u);
    EXPECT_EQ(client_->reportedPatches()[0]["v"], 3);
    EXPECT_EQ(client_->reportedPatches()[1]["v"], 5);
    EXPECT_EQ(client_->reportedPatches()[2]["v"], 8);
}

TEST_F(TwinReconcilerTest, MetadataKeysAreNotReported) {
    nlohmann::json desired = {{"telemetryInterval", 5}, {"$version", 4}, {"$metadata", {{"x", 1}}}};
    ASSERT_TRUE(reconciler_->onDesiredPropertyUpdate(desired, 4, app_.token()).ok());

    ASSERT_EQ(client_->reportedPatches().size(), 1u);
    EXPECT_EQ(client_->reportedPatches().front(), (nlohmann::json{{"telemetryInterval", 5}}));
}

TEST_F(TwinReconcilerTest, ConcurrentDeliveryOfSameVersionAppliesOnce) {
    serverTwin(9);
    std::thread push([this] { reconciler_->onDesiredPropertyUpdate({{"telemetryInterval", 30}}, 9, app_.token()); });
    std::thread fetch([this] { reconciler_->reconcile(app_.token()); });
    push.join();
    fetch.join();

    EXPECT_EQ(reconciler_->watermark(), 9);
    EXPECT_EQ(reconciler_->appliedCount(), 1u);
    EXPECT_EQ(client_->reportedPatches().size(), 1u);
}

TEST_F(TwinReconcilerTest, DisconnectedClientWaitsUntilCancelled) {
    serverTwin(4);
    client_->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError);

    CancellationSource bounded(std::chrono::milliseconds(100));
    EXPECT_TRUE(reconciler_->reconcile(bounded.token()).isCanceled());
    EXPECT_EQ(client_->getTwinCalls(), 0);
    EXPECT_EQ(reconciler_->watermark(), TwinReconciler::kInitialWatermark);
}

TEST_F(TwinReconcilerTest, ReconcileResumesAfterReconnect) {
    serverTwin(4);
    client_->emitStatus(ConnectionStatus::DisconnectedRetrying, ConnectionStatusReason::CommunicationError);

    std::thread reconnect([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        client_->emitStatus(ConnectionStatus::Connected, ConnectionStatusReason::Ok);
    });
    EXPECT_TRUE(reconciler_->reconcile(app_.token()).ok());
    reconnect.join();

    EXPECT_EQ(reconciler_->watermark(), 4);
}

TEST(TwinReconcilerConstructionTest, RejectsMissingCollaborators) {
    auto executor = std::make_shared<RetryExecutor>(std::make_shared<adapters::JitteredExponentialBackoffPolicy>(
        std::make_shared<sim::FixedRng>()));
    EXPECT_THROW(TwinReconciler(nullptr, nullptr, executor), std::invalid_argument);
    EXPECT_THROW(TwinReconciler([] { return std::shared_ptr<ports::IDeviceClient>(); }, nullptr, nullptr),
                 std::invalid_argument);
}

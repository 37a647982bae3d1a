#include <gtest/gtest.h>
#include "../core/domain/ConnectionLifecycleManager.hpp"
#include "../core/adapters/JitteredExponentialBackoffPolicy.hpp"
#include "../core/sim/FixedRng.hpp"
#include "../core/sim/MockDeviceClient.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

using namespace hublink;
using domain::ConnectionLifecycleManager;
using domain::CredentialSet;
using domain::LifecycleOptions;
using domain::RetryExecutor;

namespace {

const std::string kPrimary = "HostName=hub.azure-devices.net;DeviceId=d1;SharedAccessKey=cHJpbWFyeQ==";
const std::string kSecondary = "HostName=hub.azure-devices.net;DeviceId=d1;SharedAccessKey=c2Vjb25kYXJ5";
const std::string kTertiary = "HostName=hub.azure-devices.net;DeviceId=d1;SharedAccessKey=dGVydGlhcnk=";

bool waitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

std::shared_ptr<const RetryExecutor> fastExecutor() {
    adapters::BackoffOptions options;
    options.maxExponent = 0;
    options.maxJitter = std::chrono::milliseconds(0);
    options.maxRetries = 50;
    return std::make_shared<RetryExecutor>(std::make_shared<adapters::JitteredExponentialBackoffPolicy>(
        std::make_shared<sim::FixedRng>(), options));
}

} // namespace

class ConnectionLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<sim::MockDeviceClientFactory>();
        executor_ = fastExecutor();
    }

    void TearDown() override {
        factory_->releaseCreation();
        if (lifecycle_) {
            lifecycle_->shutdown();
        }
    }

    ConnectionLifecycleManager& make(std::vector<std::string> credentials, LifecycleOptions options = {}) {
        credentials_ = std::make_shared<CredentialSet>(std::move(credentials));
        lifecycle_ = std::make_unique<ConnectionLifecycleManager>(factory_, credentials_, executor_, app_, options);
        return *lifecycle_;
    }

    std::shared_ptr<sim::MockDeviceClientFactory> factory_;
    std::shared_ptr<const RetryExecutor> executor_;
    std::shared_ptr<CredentialSet> credentials_;
    CancellationSource app_;
    std::unique_ptr<ConnectionLifecycleManager> lifecycle_;
};

TEST_F(ConnectionLifecycleTest, InitializeOpensOneClient) {
    auto& lifecycle = make({kPrimary});

    EXPECT_TRUE(lifecycle.initialize(app_.token()).ok());

    ASSERT_EQ(factory_->createdCount(), 1u);
    EXPECT_EQ(factory_->latest()->connectionString(), kPrimary);
    EXPECT_EQ(factory_->latest()->openCalls(), 1);
    EXPECT_TRUE(lifecycle.isConnected());
    EXPECT_EQ(lifecycle.generation(), 1u);
}

TEST_F(ConnectionLifecycleTest, RepeatedInitializeIsNoOp) {
    auto& lifecycle = make({kPrimary});

    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());
    EXPECT_TRUE(lifecycle.initialize(app_.token()).ok());

    EXPECT_EQ(factory_->createdCount(), 1u);
    EXPECT_EQ(factory_->latest()->openCalls(), 1);
    EXPECT_EQ(lifecycle.initializationCount(), 1u);
}

TEST_F(ConnectionLifecycleTest, ConcurrentInitializeCreatesSingleReplacement) {
    auto& lifecycle = make({kPrimary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    factory_->holdCreation();
    factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError);
    ASSERT_TRUE(waitUntil([this] { return factory_->creationRequests() == 2u; }));

    std::thread second([&] { EXPECT_TRUE(lifecycle.initialize(app_.token()).ok()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    factory_->releaseCreation();
    second.join();
    lifecycle.waitForBackgroundTasks();

    EXPECT_EQ(factory_->createdCount(), 2u);
    EXPECT_TRUE(lifecycle.isConnected());
}

TEST_F(ConnectionLifecycleTest, TransientOpenFailureIsRetried) {
    factory_->setConfigurator([](sim::MockDeviceClient& client) {
        client.scriptOpenResults({OperationResult::transient(ErrorCode::NetworkError, "refused"),
                                  OperationResult::transient(ErrorCode::Timeout, "no CONNACK")});
    });
    auto& lifecycle = make({kPrimary});

    EXPECT_TRUE(lifecycle.initialize(app_.token()).ok());
    EXPECT_EQ(factory_->createdCount(), 1u);
    EXPECT_EQ(factory_->latest()->openCalls(), 3);
    EXPECT_TRUE(lifecycle.isConnected());
}

TEST_F(ConnectionLifecycleTest, RegistersHandlersAfterOpen) {
    auto& lifecycle = make({kPrimary});
    lifecycle.setMessageHandler([](const CloudMessage&) {});
    lifecycle.setDesiredPropertyHandler([](const nlohmann::json&, std::int64_t) {});

    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    EXPECT_TRUE(factory_->latest()->hasMessageHandler());
    EXPECT_TRUE(factory_->latest()->hasDesiredPropertyHandler());
}

TEST_F(ConnectionLifecycleTest, ConnectedHandlerRunsInBackground) {
    auto& lifecycle = make({kPrimary});
    std::atomic<int> connected{0};
    lifecycle.setConnectedHandler([&connected](const CancellationToken&) { ++connected; });

    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());
    lifecycle.waitForBackgroundTasks();

    EXPECT_EQ(connected.load(), 1);
}

TEST_F(ConnectionLifecycleTest, BadCredentialFallsBackThenTerminates) {
    auto& lifecycle = make({kPrimary, kSecondary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::BadCredential);
    lifecycle.waitForBackgroundTasks();

    ASSERT_EQ(factory_->createdCount(), 2u);
    EXPECT_EQ(factory_->latest()->connectionString(), kSecondary);
    EXPECT_EQ(factory_->clients().front()->closeCalls(), 1);
    EXPECT_TRUE(lifecycle.isConnected());
    EXPECT_FALSE(app_.isCancellationRequested());

    factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::BadCredential);
    lifecycle.waitForBackgroundTasks();

    EXPECT_EQ(factory_->createdCount(), 2u);
    EXPECT_TRUE(credentials_->empty());
    EXPECT_TRUE(app_.isCancellationRequested());
}

TEST_F(ConnectionLifecycleTest, EachBadCredentialConsumesOneCredential) {
    auto& lifecycle = make({kPrimary, kSecondary, kTertiary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    for (int signal = 1; signal <= 3; ++signal) {
        factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::BadCredential);
        lifecycle.waitForBackgroundTasks();
    }

    // Initial client plus one re-initialization per surviving credential
    EXPECT_EQ(factory_->createdCount(), 3u);
    EXPECT_EQ(lifecycle.initializationCount(), 3u);
    EXPECT_TRUE(app_.isCancellationRequested());
}

TEST_F(ConnectionLifecycleTest, RejectedPrimaryOnOpenUsesSecondary) {
    factory_->setConfigurator([](sim::MockDeviceClient& client) {
        if (client.connectionString() == kPrimary) {
            client.scriptOpenResults({OperationResult::fatal(ErrorCode::Unauthorized, "401")});
        }
    });
    auto& lifecycle = make({kPrimary, kSecondary});

    const OperationResult result = lifecycle.initialize(app_.token());
    lifecycle.waitForBackgroundTasks();

    EXPECT_EQ(result.code, ErrorCode::Unauthorized);
    ASSERT_EQ(factory_->createdCount(), 2u);
    EXPECT_EQ(factory_->latest()->connectionString(), kSecondary);
    EXPECT_TRUE(lifecycle.isConnected());
}

TEST_F(ConnectionLifecycleTest, DuplicateBadCredentialIsHandledOnce) {
    auto& lifecycle = make({kPrimary, kSecondary, kTertiary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    auto first = factory_->latest();
    first->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::BadCredential);
    first->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::BadCredential);
    lifecycle.waitForBackgroundTasks();

    EXPECT_EQ(factory_->createdCount(), 2u);
    EXPECT_EQ(factory_->latest()->connectionString(), kSecondary);
    EXPECT_EQ(credentials_->size(), 2u);
}

TEST_F(ConnectionLifecycleTest, SupersededClientNotificationsAreIgnored) {
    auto& lifecycle = make({kPrimary, kSecondary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());
    auto stale = factory_->latest();

    stale->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError);
    lifecycle.waitForBackgroundTasks();
    ASSERT_EQ(factory_->createdCount(), 2u);

    stale->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::BadCredential);
    stale->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::DeviceDisabled);
    lifecycle.waitForBackgroundTasks();

    EXPECT_EQ(factory_->createdCount(), 2u);
    EXPECT_EQ(credentials_->size(), 2u);
    EXPECT_FALSE(app_.isCancellationRequested());
    EXPECT_TRUE(lifecycle.isConnected());
}

TEST_F(ConnectionLifecycleTest, LateNotificationsFromOldClientNeverOverrideNewStatus) {
    auto& lifecycle = make({kPrimary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());
    auto oldest = factory_->latest();
    oldest->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError);
    lifecycle.waitForBackgroundTasks();
    ASSERT_EQ(lifecycle.generation(), 2u);

    std::atomic<bool> stop{false};
    std::thread noisy([&] {
        while (!stop) {
            oldest->emitStatus(ConnectionStatus::DisconnectedRetrying, ConnectionStatusReason::CommunicationError);
        }
    });

    for (int round = 0; round < 20; ++round) {
        factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError);
        lifecycle.waitForBackgroundTasks();
        ASSERT_TRUE(waitUntil([&lifecycle] { return lifecycle.isConnected(); }));
    }

    stop = true;
    noisy.join();

    EXPECT_EQ(factory_->createdCount(), 22u);
    EXPECT_EQ(lifecycle.generation(), 22u);
    EXPECT_TRUE(lifecycle.isConnected());
    EXPECT_EQ(lifecycle.lastStatus().status, ConnectionStatus::Connected);
}

TEST_F(ConnectionLifecycleTest, WaiterAtGateSeesExhaustedCredentials) {
    auto& lifecycle = make({kPrimary});
    factory_->holdCreation();

    std::thread first([&] { EXPECT_TRUE(lifecycle.initialize(app_.token()).ok()); });
    ASSERT_TRUE(waitUntil([this] { return factory_->creationRequests() == 1u; }));

    OperationResult waiterResult;
    std::thread waiter([&] { waiterResult = lifecycle.initialize(app_.token()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    credentials_->discardHead();
    factory_->releaseCreation();
    first.join();
    waiter.join();

    EXPECT_EQ(waiterResult.status, OperationStatus::FatalFailure);
    EXPECT_EQ(waiterResult.code, ErrorCode::Unauthorized);
    EXPECT_EQ(factory_->createdCount(), 1u);
}

TEST_F(ConnectionLifecycleTest, SoftRetryDoesNotReinitialize) {
    auto& lifecycle = make({kPrimary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());
    auto client = factory_->latest();

    client->emitStatus(ConnectionStatus::DisconnectedRetrying, ConnectionStatusReason::CommunicationError);
    lifecycle.waitForBackgroundTasks();

    EXPECT_FALSE(lifecycle.isConnected());
    EXPECT_TRUE(lifecycle.initialize(app_.token()).ok());
    EXPECT_EQ(factory_->createdCount(), 1u);
    EXPECT_EQ(client->openCalls(), 1);
    EXPECT_EQ(client->closeCalls(), 0);

    client->emitStatus(ConnectionStatus::Connected, ConnectionStatusReason::Ok);
    EXPECT_TRUE(lifecycle.isConnected());
}

TEST_F(ConnectionLifecycleTest, CommunicationErrorReinitializes) {
    auto& lifecycle = make({kPrimary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());
    auto first = factory_->latest();

    first->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError);
    lifecycle.waitForBackgroundTasks();

    ASSERT_EQ(factory_->createdCount(), 2u);
    EXPECT_EQ(first->closeCalls(), 1);
    EXPECT_EQ(factory_->latest()->connectionString(), kPrimary);
    EXPECT_EQ(lifecycle.generation(), 2u);
    EXPECT_TRUE(lifecycle.isConnected());
}

TEST_F(ConnectionLifecycleTest, RetryExpiredReinitializes) {
    auto& lifecycle = make({kPrimary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::RetryExpired);
    lifecycle.waitForBackgroundTasks();

    EXPECT_EQ(factory_->createdCount(), 2u);
    EXPECT_TRUE(lifecycle.isConnected());
}

TEST_F(ConnectionLifecycleTest, ReinitializationCanBeDisabled) {
    LifecycleOptions options;
    options.reinitializeOnCommunicationError = false;
    options.reinitializeOnRetryExpired = false;
    auto& lifecycle = make({kPrimary}, options);
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError);
    factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::RetryExpired);
    lifecycle.waitForBackgroundTasks();

    EXPECT_EQ(factory_->createdCount(), 1u);
    EXPECT_FALSE(lifecycle.isConnected());
}

TEST_F(ConnectionLifecycleTest, DeviceDisabledStopsApplication) {
    auto& lifecycle = make({kPrimary, kSecondary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::DeviceDisabled);
    lifecycle.waitForBackgroundTasks();

    EXPECT_TRUE(app_.isCancellationRequested());
    EXPECT_EQ(factory_->createdCount(), 1u);
}

TEST_F(ConnectionLifecycleTest, InFlightSendWaitsForReinitialization) {
    auto& lifecycle = make({kPrimary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());

    factory_->holdCreation();
    factory_->latest()->emitStatus(ConnectionStatus::Disconnected, ConnectionStatusReason::CommunicationError);
    ASSERT_TRUE(waitUntil([this] { return factory_->creationRequests() == 2u; }));

    TelemetryMessage message;
    message.messageId = "1";
    message.payload = "{}";

    domain::RetryReport report;
    std::thread sender([&] {
        report = executor_->run(
            "SendTelemetryMessage_1",
            [&] {
                auto client = lifecycle.currentClient();
                return client ? client->sendEvent(message, app_.token())
                              : OperationResult::transient(ErrorCode::NotConnected, "no client");
            },
            [&] { return lifecycle.isConnected(); },
            app_.token());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    factory_->releaseCreation();
    sender.join();
    lifecycle.waitForBackgroundTasks();

    EXPECT_TRUE(report.result.ok());
    EXPECT_GT(report.skipped, 0);
    EXPECT_EQ(report.attempts, 1);
    ASSERT_EQ(factory_->createdCount(), 2u);
    EXPECT_TRUE(factory_->clients().front()->sentMessages().empty());
    EXPECT_EQ(factory_->latest()->sentMessages().size(), 1u);
}

TEST_F(ConnectionLifecycleTest, ShutdownClosesClientAndStopsInitialization) {
    auto& lifecycle = make({kPrimary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());
    auto client = factory_->latest();

    EXPECT_TRUE(lifecycle.shutdown().ok());
    EXPECT_EQ(client->closeCalls(), 1);
    EXPECT_TRUE(lifecycle.shutdown().ok());
    EXPECT_EQ(client->closeCalls(), 1);

    EXPECT_TRUE(lifecycle.initialize(app_.token()).isCanceled());
    EXPECT_EQ(factory_->createdCount(), 1u);
}

TEST_F(ConnectionLifecycleTest, ShutdownAfterCancellationStillCloses) {
    auto& lifecycle = make({kPrimary});
    ASSERT_TRUE(lifecycle.initialize(app_.token()).ok());
    app_.cancel();

    EXPECT_TRUE(lifecycle.shutdown().ok());
    EXPECT_EQ(factory_->latest()->closeCalls(), 1);
}

TEST_F(ConnectionLifecycleTest, RejectsNullCollaborators) {
    auto credentials = std::make_shared<CredentialSet>(std::vector<std::string>{kPrimary});
    EXPECT_THROW(ConnectionLifecycleManager(nullptr, credentials, executor_, app_), std::invalid_argument);
    EXPECT_THROW(ConnectionLifecycleManager(factory_, nullptr, executor_, app_), std::invalid_argument);
    EXPECT_THROW(ConnectionLifecycleManager(factory_, credentials, nullptr, app_), std::invalid_argument);
}

TEST(CredentialSetTest, DropsEmptyEntriesAndRejectsEmptySet) {
    EXPECT_THROW(CredentialSet(std::vector<std::string>{}), std::invalid_argument);
    EXPECT_THROW(CredentialSet(std::vector<std::string>{"", ""}), std::invalid_argument);

    CredentialSet set(std::vector<std::string>{"", "a", "b"});
    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(*set.head(), "a");
}

TEST(CredentialSetTest, DiscardIfHeadIgnoresStaleExpectation) {
    CredentialSet set(std::vector<std::string>{"a", "b"});

    EXPECT_EQ(set.discardIfHead("b"), 2u);
    EXPECT_EQ(set.discardIfHead("a"), 1u);
    EXPECT_EQ(set.discardIfHead("a"), 1u);
    EXPECT_EQ(*set.head(), "b");
    EXPECT_EQ(set.headIndex(), 1u);
    EXPECT_EQ(set.discardHead(), 0u);
    EXPECT_FALSE(set.head().has_value());
    EXPECT_TRUE(set.empty());
}

/**
 * @file main_cli.cpp
 * @brief Command-line interface for the hublink device application
 *
 * Connects to Azure IoT Hub with one or more device connection strings,
 * sends telemetry, receives cloud-to-device messages and reconciles desired
 * properties until interrupted or until the configured run time elapses.
 * With --simulate the same application runs against an in-process hub.
 *
 * @date 2025
 * @version 1.0
 *
 * @note Includes proper signal handling for graceful shutdown
 * @note Supports configuration via TOML files, environment variables and flags
 */

#include "IClock.hpp"
#include "IRng.hpp"
#include "Logger.hpp"
#include "PahoMqttClient.hpp"
#include "TomlConfig.hpp"
#include "adapters/MqttDeviceClient.hpp"
#include "domain/DeviceApp.hpp"
#include "sim/MockDeviceClient.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace hublink;

namespace {

constexpr const char* kComponent = "Main";

/// Connection string used by --simulate when none is configured
constexpr const char* kSimulatedConnectionString =
    "HostName=simulated.azure-devices.net;DeviceId=hublink-simulated;SharedAccessKey=c2ltdWxhdGVkLWRldmljZS1rZXk=";

/// Set from the signal handler, observed by the shutdown watcher
std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted = true;
}

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>      Configuration file (default: hublink.toml)\n"
              << "  --primary <cs>       Primary device connection string\n"
              << "  --secondary <cs>     Secondary device connection string\n"
              << "  --run-time <sec>     Stop after this many seconds (0 = until Ctrl+C)\n"
              << "  --simulate           Run against the in-process simulated hub\n"
              << "  --log-level <level>  debug, info, warning or error\n"
              << "  --help               Show this help message\n"
              << "\nEnvironment:\n"
              << "  IOTHUB_DEVICE_CONNECTION_STRING, IOTHUB_DEVICE_CONNECTION_STRING_SECONDARY,\n"
              << "  HUBLINK_LOG_LEVEL, HUBLINK_RUN_TIME_SECONDS\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [device]\n"
              << "  connection_string = \"HostName=...;DeviceId=...;SharedAccessKey=...\"\n"
              << "  secondary_connection_string = \"HostName=...;DeviceId=...;SharedAccessKey=...\"\n"
              << "\n"
              << "  [application]\n"
              << "  run_time_seconds = 300\n"
              << "  receive_mode = \"callback\"\n"
              << std::endl;
}

AppConfig loadConfig(const CommandLine& cli) {
    AppConfig config = TomlConfig::loadFromFile(cli.configFile, AppConfig{}, cli.configFileExplicit);
    config = TomlConfig::applyEnvironment(std::move(config));
    config = TomlConfig::applyArguments(std::move(config), cli);
    if (config.simulate && config.connectionStrings().empty()) {
        config.primaryConnectionString = kSimulatedConnectionString;
    }
    TomlConfig::validate(config);
    return config;
}

std::shared_ptr<ports::IDeviceClientFactory> makeFactory(const AppConfig& config) {
    if (config.simulate) {
        return std::make_shared<sim::MockDeviceClientFactory>();
    }
    auto clock = std::make_shared<SystemClock>();
    return std::make_shared<adapters::MqttDeviceClientFactory>(
        [] { return std::make_shared<PahoMqttClient>(); }, clock, config.transport);
}

} // namespace

/**
 * @brief Main application entry point
 * @return Exit code (0 for success, 1 for configuration or connection errors)
 */
int main(int argc, char* argv[]) {
    CommandLine cli;
    AppConfig config;
    try {
        cli = TomlConfig::parseArguments(argc, argv);
        if (cli.help) {
            printUsage(argv[0]);
            return 0;
        }
        config = loadConfig(cli);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    Logger::setLevel(config.logLevel);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CancellationSource appCancellation = config.runTime.count() > 0
        ? CancellationSource(std::chrono::duration_cast<std::chrono::milliseconds>(config.runTime))
        : CancellationSource();

    logInfo(kComponent) << "starting hublink with " << config.connectionStrings().size()
                        << " connection string(s)"
                        << (config.simulate ? " against the simulated hub" : "");
    if (config.runTime.count() > 0) {
        logInfo(kComponent) << "running for " << config.runTime.count() << "s";
    } else {
        logInfo(kComponent) << "running until Ctrl+C";
    }

    // Signal handlers may only touch the atomic flag; this thread turns it into a cancellation.
    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        const CancellationToken token = appCancellation.token();
        while (!finished && !token.isCancellationRequested()) {
            if (g_interrupted) {
                logInfo(kComponent) << "interrupt received, shutting down";
                appCancellation.cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exitCode = 0;
    try {
        domain::DeviceApp app(makeFactory(config), std::make_shared<StandardRng>(),
                              config.toDeviceAppConfig(), appCancellation);
        const OperationResult result = app.run();
        if (!result.ok() && !result.isCanceled()) {
            logError(kComponent) << "device application stopped: " << result;
            exitCode = 1;
        }
        logInfo(kComponent) << "sent " << app.messagesSent() << " message(s), received "
                            << app.messagesReceived() << " message(s)";
    } catch (const std::exception& e) {
        logError(kComponent) << "fatal error: " << e.what();
        exitCode = 1;
    }

    finished = true;
    watcher.join();

    logInfo(kComponent) << "done";
    return exitCode;
}

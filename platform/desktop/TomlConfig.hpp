/**
 * @file TomlConfig.hpp
 * @brief TOML configuration, environment and command-line settings for hublink
 *
 * Provides a simple TOML configuration parser for the device application.
 * Settings are layered: built-in defaults, then the configuration file, then
 * environment variables, then command-line flags.
 *
 * Supported Sections:
 * - [device]: Connection strings (primary, secondary, connection_string_N)
 * - [transport]: MQTT keep-alive, timeouts and transport reconnect settings
 * - [retry]: Backoff policy limits
 * - [lifecycle]: Which disconnect reasons re-initialize the client
 * - [application]: Run time, send interval, receive mode, simulated hub
 * - [logging]: Minimum log level
 *
 * @date 2025
 * @version 1.0
 *
 * @note Simple string-based parser, no external TOML dependency
 * @note Malformed values raise std::runtime_error naming the offending key
 */

#pragma once

#include "Logger.hpp"
#include "SasToken.hpp"
#include "adapters/MqttDeviceClient.hpp"
#include "domain/DeviceApp.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <istream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace hublink {

/**
 * @brief Complete application settings after all layers are applied
 */
struct AppConfig {
    std::string primaryConnectionString;
    std::string secondaryConnectionString;
    std::map<int, std::string> extraConnectionStrings;      ///< connection_string_N keyed by N

    std::string protocol = "mqtt";
    adapters::MqttDeviceClientOptions transport;
    adapters::BackoffOptions backoff;
    domain::LifecycleOptions lifecycle;

    std::chrono::seconds runTime{0};                        ///< 0 runs until interrupted
    std::chrono::seconds sendInterval{15};
    domain::ReceiveMode receiveMode = domain::ReceiveMode::Callback;
    bool simulate = false;

    LogLevel logLevel = LogLevel::Info;

    /// Primary first, then secondary, then connection_string_N in ascending N
    std::vector<std::string> connectionStrings() const {
        std::vector<std::string> result;
        if (!primaryConnectionString.empty()) result.push_back(primaryConnectionString);
        if (!secondaryConnectionString.empty()) result.push_back(secondaryConnectionString);
        for (const auto& entry : extraConnectionStrings) {
            if (!entry.second.empty()) result.push_back(entry.second);
        }
        return result;
    }

    domain::DeviceAppConfig toDeviceAppConfig() const {
        domain::DeviceAppConfig app;
        app.connectionStrings = connectionStrings();
        app.backoff = backoff;
        app.lifecycle = lifecycle;
        app.sendInterval = sendInterval;
        app.receiveMode = receiveMode;
        return app;
    }
};

/**
 * @brief Flags given on the command line; unset flags leave the config untouched
 */
struct CommandLine {
    std::string configFile = "hublink.toml";
    bool configFileExplicit = false;
    bool help = false;
    std::optional<std::string> primary;
    std::optional<std::string> secondary;
    std::optional<std::chrono::seconds> runTime;
    bool simulate = false;
    std::optional<std::string> logLevel;
};

/**
 * @brief TOML configuration file parser and validator
 *
 * Static helpers only. Every loader takes the config built so far and
 * returns it with its own layer applied.
 */
class TomlConfig {
public:
    using EnvironmentReader = std::function<std::string(const char*)>;

    /**
     * @brief Parse command-line flags
     * @throws std::runtime_error on unknown flags or missing/invalid values
     */
    static CommandLine parseArguments(int argc, const char* const argv[]) {
        CommandLine cli;
        auto valueOf = [&](int& i, const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + flag);
            }
            return argv[++i];
        };

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                cli.help = true;
            } else if (arg == "--config") {
                cli.configFile = valueOf(i, arg);
                cli.configFileExplicit = true;
            } else if (arg == "--primary") {
                cli.primary = valueOf(i, arg);
            } else if (arg == "--secondary") {
                cli.secondary = valueOf(i, arg);
            } else if (arg == "--run-time") {
                cli.runTime = std::chrono::seconds(parseInt(arg, valueOf(i, arg), 0));
            } else if (arg == "--simulate") {
                cli.simulate = true;
            } else if (arg == "--log-level") {
                cli.logLevel = valueOf(i, arg);
            } else {
                throw std::runtime_error("Unknown option: " + arg);
            }
        }
        return cli;
    }

    /**
     * @brief Load and parse a TOML configuration file
     * @param filename Path to the configuration file
     * @param required When false a missing file leaves the config unchanged
     * @throws std::runtime_error if a required file cannot be read or a value is invalid
     */
    static AppConfig loadFromFile(const std::string& filename, AppConfig config, bool required) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            if (required) {
                throw std::runtime_error("Could not open config file: " + filename);
            }
            logDebug("Config") << "no config file at " << filename << ", using defaults";
            return config;
        }
        logDebug("Config") << "loading " << filename;
        return loadFromStream(file, std::move(config));
    }

    /// @throws std::runtime_error on unknown sections, keys or invalid values
    static AppConfig loadFromStream(std::istream& input, AppConfig config) {
        std::string currentSection;
        std::string line;
        int lineNumber = 0;
        while (std::getline(input, line)) {
            ++lineNumber;
            stripComment(line);
            trim(line);
            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() != ']') {
                    throw std::runtime_error("Malformed section header on line " + std::to_string(lineNumber));
                }
                currentSection = line.substr(1, line.length() - 2);
                trim(currentSection);
                continue;
            }

            const size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                throw std::runtime_error("Expected key = value on line " + std::to_string(lineNumber));
            }
            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            applyKey(config, currentSection, key, value);
        }
        return config;
    }

    /**
     * @brief Apply IOTHUB_DEVICE_CONNECTION_STRING(_SECONDARY), HUBLINK_LOG_LEVEL
     *        and HUBLINK_RUN_TIME_SECONDS when set
     */
    static AppConfig applyEnvironment(AppConfig config, const EnvironmentReader& getEnv = safeGetEnv) {
        const std::string primary = getEnv("IOTHUB_DEVICE_CONNECTION_STRING");
        const std::string secondary = getEnv("IOTHUB_DEVICE_CONNECTION_STRING_SECONDARY");
        const std::string logLevel = getEnv("HUBLINK_LOG_LEVEL");
        const std::string runTime = getEnv("HUBLINK_RUN_TIME_SECONDS");

        if (!primary.empty()) config.primaryConnectionString = primary;
        if (!secondary.empty()) config.secondaryConnectionString = secondary;
        if (!logLevel.empty()) config.logLevel = parseLogLevel("HUBLINK_LOG_LEVEL", logLevel);
        if (!runTime.empty()) config.runTime = std::chrono::seconds(parseInt("HUBLINK_RUN_TIME_SECONDS", runTime, 0));
        return config;
    }

    static AppConfig applyArguments(AppConfig config, const CommandLine& cli) {
        if (cli.primary) config.primaryConnectionString = *cli.primary;
        if (cli.secondary) config.secondaryConnectionString = *cli.secondary;
        if (cli.runTime) config.runTime = *cli.runTime;
        if (cli.simulate) config.simulate = true;
        if (cli.logLevel) config.logLevel = parseLogLevel("--log-level", *cli.logLevel);
        return config;
    }

    /**
     * @brief Check that at least one connection string is present and all parse
     * @throws std::runtime_error describing the first problem found
     */
    static void validate(const AppConfig& config) {
        const auto strings = config.connectionStrings();
        if (strings.empty()) {
            throw std::runtime_error("No device connection string configured "
                                     "(set [device] connection_string or IOTHUB_DEVICE_CONNECTION_STRING)");
        }
        for (const auto& text : strings) {
            ConnectionString::parse(text);
        }
    }

    /**
     * @brief Safe environment variable getter for Windows
     * @return Environment variable value or empty string if not found
     */
    static std::string safeGetEnv(const char* name) {
#ifdef _WIN32
        char* buffer = nullptr;
        size_t size = 0;
        if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
            std::string result(buffer);
            free(buffer);
            return result;
        }
        return "";
#else
        const char* value = std::getenv(name);
        return value ? std::string(value) : "";
#endif
    }

private:
    static void applyKey(AppConfig& config, const std::string& section, const std::string& key, const std::string& value) {
        const std::string name = section + "." + key;

        if (section == "device") {
            if (key == "connection_string") {
                config.primaryConnectionString = value;
            } else if (key == "secondary_connection_string") {
                config.secondaryConnectionString = value;
            } else if (key.rfind("connection_string_", 0) == 0) {
                const int index = parseInt(name, key.substr(std::string("connection_string_").size()), 0);
                config.extraConnectionStrings[index] = value;
            } else {
                unknownKey(name);
            }
        } else if (section == "transport") {
            if (key == "protocol") {
                std::string protocol = lower(value);
                if (protocol != "mqtt") {
                    throw std::runtime_error("Unsupported transport protocol '" + value + "' for " + name);
                }
                config.protocol = protocol;
            } else if (key == "keep_alive_seconds") {
                config.transport.keepAliveSeconds = parseInt(name, value, 1);
            } else if (key == "operation_timeout_seconds") {
                config.transport.operationTimeout = std::chrono::seconds(parseInt(name, value, 1));
            } else if (key == "reconnect_attempts") {
                config.transport.reconnectAttempts = parseInt(name, value, 0);
            } else if (key == "reconnect_interval_seconds") {
                config.transport.reconnectInterval = std::chrono::seconds(parseInt(name, value, 0));
            } else if (key == "ca_path") {
                config.transport.caPath = value;
            } else {
                unknownKey(name);
            }
        } else if (section == "retry") {
            if (key == "max_retries") {
                config.backoff.maxRetries = parseInt(name, value, 0);
            } else if (key == "max_exponent") {
                config.backoff.maxExponent = parseInt(name, value, 0);
            } else if (key == "max_jitter_ms") {
                config.backoff.maxJitter = std::chrono::milliseconds(parseInt(name, value, 0));
            } else {
                unknownKey(name);
            }
        } else if (section == "lifecycle") {
            if (key == "reinitialize_on_communication_error") {
                config.lifecycle.reinitializeOnCommunicationError = parseBool(name, value);
            } else if (key == "reinitialize_on_retry_expired") {
                config.lifecycle.reinitializeOnRetryExpired = parseBool(name, value);
            } else {
                unknownKey(name);
            }
        } else if (section == "application") {
            if (key == "run_time_seconds") {
                config.runTime = std::chrono::seconds(parseInt(name, value, 0));
            } else if (key == "send_interval_seconds") {
                config.sendInterval = std::chrono::seconds(parseInt(name, value, 0));
            } else if (key == "receive_mode") {
                const std::string mode = lower(value);
                if (mode == "callback") {
                    config.receiveMode = domain::ReceiveMode::Callback;
                } else if (mode == "poll") {
                    config.receiveMode = domain::ReceiveMode::Poll;
                } else {
                    throw std::runtime_error("Invalid value '" + value + "' for " + name + " (expected callback or poll)");
                }
            } else if (key == "simulate") {
                config.simulate = parseBool(name, value);
            } else {
                unknownKey(name);
            }
        } else if (section == "logging") {
            if (key == "level") {
                config.logLevel = parseLogLevel(name, value);
            } else {
                unknownKey(name);
            }
        } else {
            throw std::runtime_error("Unknown config section [" + section + "]");
        }
    }

    static int parseInt(const std::string& name, const std::string& value, int minimum) {
        size_t consumed = 0;
        long parsed = 0;
        try {
            parsed = std::stol(value, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer '" + value + "' for " + name);
        }
        if (consumed != value.size() || parsed < minimum || parsed > std::numeric_limits<int>::max()) {
            throw std::runtime_error("Invalid integer '" + value + "' for " + name);
        }
        return static_cast<int>(parsed);
    }

    static bool parseBool(const std::string& name, const std::string& value) {
        const std::string text = lower(value);
        if (text == "true" || text == "1" || text == "yes") return true;
        if (text == "false" || text == "0" || text == "no") return false;
        throw std::runtime_error("Invalid boolean '" + value + "' for " + name);
    }

    static LogLevel parseLogLevel(const std::string& name, const std::string& value) {
        const std::string text = lower(value);
        if (text != "debug" && text != "info" && text != "warning" && text != "warn" && text != "error") {
            throw std::runtime_error("Invalid log level '" + value + "' for " + name);
        }
        return Logger::parseLevel(text);
    }

    [[noreturn]] static void unknownKey(const std::string& name) {
        throw std::runtime_error("Unknown config key " + name);
    }

    static std::string lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    /**
     * @brief Remove a '#' comment that is not inside a quoted value
     */
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace hublink

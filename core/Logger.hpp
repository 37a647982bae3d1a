/**
 * @file Logger.hpp
 * @brief Thread-safe console logging with severity levels
 *
 * Keeps the "[Component] message" console style while serializing lines
 * written from MQTT callback threads, background tasks and the main loop.
 * Each line is prefixed with an ISO8601 UTC timestamp and a severity tag.
 *
 * @date 2025
 * @version 1.0
 *
 * @note Warning and Error lines go to std::cerr, everything else to std::cout
 */

#pragma once

#include <sstream>
#include <string>

namespace hublink {

/// Log severity, ordered from most to least verbose
enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

/**
 * @brief Process-wide console logger
 *
 * Static facade; all state lives in Logger.cpp behind a single mutex.
 */
class Logger {
public:
    /**
     * @brief Set the minimum level that will be written
     * @param level Lines below this level are discarded
     */
    static void setLevel(LogLevel level);

    /// @return Current minimum level
    static LogLevel level();

    /// @return true if a line at @p level would be written
    static bool isEnabled(LogLevel level);

    /**
     * @brief Write one complete line
     * @param level Severity of the line
     * @param component Short component tag printed in brackets
     * @param message Line content without trailing newline
     */
    static void write(LogLevel level, const std::string& component, const std::string& message);

    /**
     * @brief Parse a level name ("debug", "info", "warning"/"warn", "error")
     * @param name Case-insensitive level name
     * @param fallback Value returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::Info);

    static const char* toString(LogLevel level);
};

/**
 * @brief Collects one streamed log line and writes it on destruction
 */
class LogLine {
public:
    LogLine(LogLevel level, const char* component)
        : level_(level), component_(component), enabled_(Logger::isEnabled(level)) {}

    ~LogLine() {
        if (enabled_) {
            Logger::write(level_, component_, stream_.str());
        }
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    const char* component_;
    bool enabled_;
    std::ostringstream stream_;
};

/// Start a line at the given severity: logInfo("Component") << "text";
inline LogLine logDebug(const char* component) { return LogLine(LogLevel::Debug, component); }
inline LogLine logInfo(const char* component) { return LogLine(LogLevel::Info, component); }
inline LogLine logWarn(const char* component) { return LogLine(LogLevel::Warning, component); }
inline LogLine logError(const char* component) { return LogLine(LogLevel::Error, component); }

} // namespace hublink

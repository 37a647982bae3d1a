#include "Logger.hpp"
#include "IClock.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace hublink {

namespace {

std::atomic<int> g_minLevel{static_cast<int>(LogLevel::Info)};
std::mutex g_consoleMutex;

} // namespace

void Logger::setLevel(LogLevel level) {
    g_minLevel.store(static_cast<int>(level));
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(g_minLevel.load());
}

bool Logger::isEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_minLevel.load();
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    static const SystemClock clock;
    const std::string timestamp = clock.iso8601();

    std::lock_guard<std::mutex> lock(g_consoleMutex);
    std::ostream& out = (level >= LogLevel::Warning) ? std::cerr : std::cout;
    out << timestamp << ' ' << toString(level) << " [" << component << "] " << message << std::endl;
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug" || lower == "trace") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return fallback;
}

const char* Logger::toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
    }
    return "?????";
}

} // namespace hublink

#include "logging.hpp"
#include "fountain_errors.hpp"
#include <atomic>
#include <algorithm>
#include <cctype>

static std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= g_log_level.load();
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;

    throw InvalidConfiguration("unknown log level '" + name + "'");
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

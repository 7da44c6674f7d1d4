#pragma once

#include <string>

enum class LogLevel { Debug = 0, Info, Warning, Error, Critical };

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// "debug", "INFO", ... -> LogLevel. Throws InvalidConfiguration on anything else.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

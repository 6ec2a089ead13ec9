#pragma once

#include <fmt/format.h>
#include <string>
#include <utility>

namespace anvil::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Formatted logging: core::log(LogLevel::Info, "[Crafting] Started {}", name)
template<typename... Args>
void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (level < get_log_level()) return;
    log(level, fmt::format(format, std::forward<Args>(args)...).c_str());
}

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& name, LogLevel& out_level);

} // namespace anvil::core

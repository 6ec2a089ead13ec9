#include <anvil/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <algorithm>
#include <cctype>
#include <cstring>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace anvil::core {

static LogLevel s_log_level = LogLevel::Info;
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

// "[Crafting] Started Iron Sword" -> "Crafting"
static std::string extract_category(const char* message) {
    if (!message || message[0] != '[') return {};
    const char* end = std::strchr(message, ']');
    if (!end) return {};
    return std::string(message + 1, end);
}

void log(LogLevel level, const char* message) {
    if (level < s_log_level || !message) return;
#ifdef _WIN32
    OutputDebugStringA(message);
    OutputDebugStringA("\n");
#endif
    if (level >= LogLevel::Error) {
        std::fprintf(stderr, "%s\n", message);
    } else {
        std::printf("%s\n", message);
    }

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    if (s_log_sinks.empty()) return;

    std::string category = extract_category(message);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
        default:              return "unknown";
    }
}

bool parse_log_level(const std::string& name, LogLevel& out_level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const LogLevel levels[] = {
        LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
        LogLevel::Warn, LogLevel::Error, LogLevel::Fatal
    };
    for (LogLevel level : levels) {
        if (lower == log_level_name(level)) {
            out_level = level;
            return true;
        }
    }
    if (lower == "warning") {
        out_level = LogLevel::Warn;
        return true;
    }
    return false;
}

} // namespace anvil::core

#pragma once

#include <format>
#include <string>
#include <utility>

namespace arpg::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers.
// A leading "[Category] " tag is split off the message and passed separately.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Formatted logging: log(LogLevel::Warn, "[Affix] Unknown stat '{}'", key)
template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

const char* log_level_name(LogLevel level);

// Split "[Affix] text" into {"Affix", "text"}. Untagged messages get an empty category.
std::pair<std::string, std::string> split_log_category(const std::string& message);

} // namespace arpg::core

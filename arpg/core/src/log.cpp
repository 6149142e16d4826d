#include <arpg/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <algorithm>

namespace arpg::core {

static LogLevel s_log_level = LogLevel::Info;
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

std::pair<std::string, std::string> split_log_category(const std::string& message) {
    if (message.size() < 2 || message[0] != '[') {
        return {std::string(), message};
    }
    size_t close = message.find(']');
    if (close == std::string::npos) {
        return {std::string(), message};
    }

    std::string category = message.substr(1, close - 1);
    size_t body = close + 1;
    if (body < message.size() && message[body] == ' ') {
        ++body;
    }
    return {std::move(category), message.substr(body)};
}

void log(LogLevel level, const char* message) {
    if (level < s_log_level) return;

    auto [category, body] = split_log_category(message ? message : "");
    if (category.empty()) {
        std::printf("[%s] %s\n", log_level_name(level), body.c_str());
    } else {
        std::printf("[%s][%s] %s\n", log_level_name(level), category.c_str(), body.c_str());
    }

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, body);
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
    }
    return "unknown";
}

} // namespace arpg::core

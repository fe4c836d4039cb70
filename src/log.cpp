#include "mcphub/log.hpp"
#include "mcphub/error.hpp"
#include <fmt/format.h>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

namespace mcphub::log {

namespace {

std::atomic<Level> g_level{Level::Info};

std::mutex& sink_mutex() {
    static std::mutex mu;
    return mu;
}

Sink& sink() {
    static Sink s;
    return s;
}

} // anonymous namespace

std::string_view level_to_string(Level level) {
    switch (level) {
        case Level::Trace:   return "TRACE";
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error:   return "ERROR";
        case Level::Off:     return "OFF";
    }
    return "UNKNOWN";
}

Level level_from_string(std::string_view s) {
    if (s == "trace")                    return Level::Trace;
    if (s == "debug")                    return Level::Debug;
    if (s == "info")                     return Level::Info;
    if (s == "warning" || s == "warn")   return Level::Warning;
    if (s == "error")                    return Level::Error;
    if (s == "off")                      return Level::Off;
    throw McpConfigError("Unknown log level: " + std::string(s));
}

void set_level(Level level) {
    g_level = level;
}

Level level() {
    return g_level;
}

bool enabled(Level level) {
    Level current = g_level;
    return current != Level::Off && level >= current;
}

void set_sink(Sink s) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink() = std::move(s);
}

void init_from_env() {
    const char* value = std::getenv("MCPHUB_LOG_LEVEL");
    if (value == nullptr || *value == '\0') return;
    try {
        set_level(level_from_string(value));
    } catch (const McpConfigError& e) {
        warn("Ignoring MCPHUB_LOG_LEVEL: {}", e.what());
    }
}

void write(Level level, std::string_view message) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    if (sink()) {
        sink()(level, message);
        return;
    }
    fmt::print(stderr, "[mcphub] {} {}\n", level_to_string(level), message);
    std::fflush(stderr);
}

} // namespace mcphub::log

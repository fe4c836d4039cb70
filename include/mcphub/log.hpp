#pragma once
#include <fmt/format.h>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

/// Thread-safe diagnostic logging to stderr (or a replaceable sink).
namespace mcphub::log {

enum class Level {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Off
};

using Sink = std::function<void(Level, std::string_view message)>;

std::string_view level_to_string(Level level);

/// Accepts trace|debug|info|warning|warn|error|off. Throws McpConfigError otherwise.
Level level_from_string(std::string_view s);

void set_level(Level level);
[[nodiscard]] Level level();
[[nodiscard]] bool enabled(Level level);

/// Replace the stderr sink; an empty function restores it.
void set_sink(Sink sink);

/// Apply MCPHUB_LOG_LEVEL if it is set.
void init_from_env();

void write(Level level, std::string_view message);

template <typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Trace)) write(Level::Trace, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Warning)) write(Level::Warning, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace mcphub::log

#pragma once

#include <fmt/format.h>
#include <std23/move_only_function.h>

#include <string>
#include <string_view>

namespace a2s::log {

enum class Level {
    Debug, Info, Warning, Error
};

using LogFunction = std23::move_only_function<void(Level, const std::string&)>;

/// Replaces the sink that receives every formatted log line.
void setLogFunction(LogFunction func);
LogFunction& getLogFunction();

/// Messages below this level are dropped before formatting. Defaults to `Level::Info`.
/// Errors are always delivered.
void setMinLevel(Level level);
Level minLevel();

std::string_view levelToString(Level level);

inline bool enabled(Level level) {
    return level == Level::Error || static_cast<int>(level) >= static_cast<int>(minLevel());
}

template <typename... Args>
void logAt(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(level)) return;
    getLogFunction()(level, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    logAt(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> fmt, Args&&... args) {
    logAt(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    logAt(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> fmt, Args&&... args) {
    logAt(Level::Error, fmt, std::forward<Args>(args)...);
}

}

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace fsremote::log {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

/**
 * @brief Receives every message at or above the current minimum level.
 *
 * Handlers may be called from any thread (caller threads, the command worker
 * and the network thread), so they must be thread-safe themselves.
 */
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a handler; an empty handler restores the stdout/stderr sink.
void setLogHandler(LogHandler handler);
void resetLogHandler();

/// Messages below @p level are dropped before reaching the handler.
void setLogLevel(LogLevel level);
LogLevel logLevel();

const char* toString(LogLevel level);

void write(LogLevel level, std::string_view message);

inline void logDebug(std::string_view message) { write(LogLevel::Debug, message); }
inline void logInfo(std::string_view message) { write(LogLevel::Info, message); }
inline void logWarning(std::string_view message) { write(LogLevel::Warning, message); }
inline void logError(std::string_view message) { write(LogLevel::Error, message); }

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

template<typename First, typename... Rest>
using EnableIfFormatted = std::enable_if_t<(sizeof...(Rest) > 0) ||
    !IsStringViewConvertible<std::decay_t<First>>::value>;

} // namespace detail

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logDebug(First&& first, Rest&&... rest) {
    if (logLevel() > LogLevel::Debug) return; // skip formatting
    write(LogLevel::Debug,
          detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logInfo(First&& first, Rest&&... rest) {
    write(LogLevel::Info,
          detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logWarning(First&& first, Rest&&... rest) {
    write(LogLevel::Warning,
          detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

template<typename First, typename... Rest, typename = detail::EnableIfFormatted<First, Rest...>>
void logError(First&& first, Rest&&... rest) {
    write(LogLevel::Error,
          detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...));
}

} // namespace fsremote::log

namespace fsremote {
using log::LogLevel;
using log::LogHandler;
using log::setLogHandler;
using log::resetLogHandler;
using log::setLogLevel;
using log::logDebug;
using log::logInfo;
using log::logWarning;
using log::logError;
} // namespace fsremote

#include "fsremote/log/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace fsremote::log {

namespace {

LogHandler makeDefaultSink() {
    return [](LogLevel level, std::string_view message) {
        auto& stream = (level >= LogLevel::Warning) ? std::cerr : std::cout;
        stream << message;
        stream.flush();
    };
}

std::mutex sinkMutex;
LogHandler handler = makeDefaultSink();
std::atomic<LogLevel> minimumLevel{LogLevel::Info};

} // namespace

void setLogHandler(LogHandler newHandler) {
    std::lock_guard lock(sinkMutex);
    handler = newHandler ? std::move(newHandler) : makeDefaultSink();
}

void resetLogHandler() {
    std::lock_guard lock(sinkMutex);
    handler = makeDefaultSink();
}

void setLogLevel(LogLevel level) {
    minimumLevel.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() {
    return minimumLevel.load(std::memory_order_relaxed);
}

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
        case LogLevel::Off:     return "off";
    }
    return "unknown";
}

void write(LogLevel level, std::string_view message) {
    if (level == LogLevel::Off || level < logLevel()) {
        return;
    }

    LogHandler current;
    {
        std::lock_guard lock(sinkMutex);
        current = handler;
    }
    if (current) {
        current(level, message);
    }
}

} // namespace fsremote::log

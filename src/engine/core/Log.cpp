/**
 * Log.cpp
 *
 * Log sink management and message formatting
 */

#include "Log.h"
#include <cstdarg>
#include <mutex>
#include <vector>

namespace Parley {

namespace {

std::mutex& sinkMutex() {
    static std::mutex mutex;
    return mutex;
}

LogSink& activeSink() {
    static LogSink sink;
    return sink;
}

LogLevel& activeLevel() {
    static LogLevel level = LogLevel::Info;
    return level;
}

void writeToConsole(LogLevel level, const std::string& message) {
    FILE* stream = level >= LogLevel::Warning ? stderr : stdout;
    std::fprintf(stream, "[%s] %s\n", logLevelName(level), message.c_str());
}

} // namespace

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    activeSink() = std::move(sink);
}

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    activeLevel() = level;
}

LogLevel getLogLevel() {
    std::lock_guard<std::mutex> lock(sinkMutex());
    return activeLevel();
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

bool parseLogLevel(const std::string& name, LogLevel& out) {
    if (name == "trace") { out = LogLevel::Trace; return true; }
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info") { out = LogLevel::Info; return true; }
    if (name == "warn" || name == "warning") { out = LogLevel::Warning; return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

void logMessage(LogLevel level, const char* fmt, ...) {
    if (level < getLogLevel()) return;

    va_list args;
    va_start(args, fmt);
    va_list argsCopy;
    va_copy(argsCopy, args);
    int length = std::vsnprintf(nullptr, 0, fmt, argsCopy);
    va_end(argsCopy);

    std::string message;
    if (length > 0) {
        std::vector<char> buffer(static_cast<size_t>(length) + 1);
        std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        message.assign(buffer.data(), static_cast<size_t>(length));
    }
    va_end(args);

    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(sinkMutex());
        sink = activeSink();
    }

    if (sink) {
        sink(level, message);
    } else {
        writeToConsole(level, message);
    }
}

} // namespace Parley

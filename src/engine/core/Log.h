/**
 * Log.h - Logging utilities
 *
 * printf-style log macros routed through a replaceable sink. The sink doubles
 * as the diagnostic channel for the dialogue runtime (fail-closed conditions,
 * failed actions), so tools and tests can capture it.
 */
#pragma once

#include <cstdio>
#include <functional>
#include <string>

namespace Parley {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warning,
    Error
};

using LogSink = std::function<void(LogLevel, const std::string&)>;

/**
 * Replace the active sink. Passing an empty function restores the default
 * console sink.
 */
void setLogSink(LogSink sink);

/**
 * Messages below this level are dropped before formatting
 */
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

const char* logLevelName(LogLevel level);
bool parseLogLevel(const std::string& name, LogLevel& out);

void logMessage(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace Parley

#define PARLEY_LOG_TRACE(fmt, ...) ::Parley::logMessage(::Parley::LogLevel::Trace, fmt, ##__VA_ARGS__)
#define PARLEY_LOG_DEBUG(fmt, ...) ::Parley::logMessage(::Parley::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define PARLEY_LOG_INFO(fmt, ...) ::Parley::logMessage(::Parley::LogLevel::Info, fmt, ##__VA_ARGS__)
#define PARLEY_LOG_WARN(fmt, ...) ::Parley::logMessage(::Parley::LogLevel::Warning, fmt, ##__VA_ARGS__)
#define PARLEY_LOG_ERROR(fmt, ...) ::Parley::logMessage(::Parley::LogLevel::Error, fmt, ##__VA_ARGS__)

#pragma once

#include <sstream>
#include <string>

namespace edupath {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Process-wide minimum level. Messages below it are dropped.
void setLogLevel(LogLevel level);
LogLevel logLevel();
bool logEnabled(LogLevel level);

const char* logLevelName(LogLevel level);

/// Writes "[HH:MM:SS.mmm][LEVEL][component] message" to stderr.
void logMessage(LogLevel level, const char* component, const std::string& message);

} // namespace edupath

#define EDUPATH_LOG(level, component, expr)                              \
    do {                                                                 \
        if (::edupath::logEnabled(level)) {                              \
            std::ostringstream edupath_log_os_;                          \
            edupath_log_os_ << expr;                                     \
            ::edupath::logMessage(level, component, edupath_log_os_.str()); \
        }                                                                \
    } while (0)

#define EDUPATH_LOG_DEBUG(component, expr) EDUPATH_LOG(::edupath::LogLevel::Debug, component, expr)
#define EDUPATH_LOG_INFO(component, expr)  EDUPATH_LOG(::edupath::LogLevel::Info, component, expr)
#define EDUPATH_LOG_WARN(component, expr)  EDUPATH_LOG(::edupath::LogLevel::Warn, component, expr)
#define EDUPATH_LOG_ERROR(component, expr) EDUPATH_LOG(::edupath::LogLevel::Error, component, expr)

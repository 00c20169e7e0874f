#include "util/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace edupath {

namespace {
std::atomic<int> min_level{static_cast<int>(LogLevel::Info)};
std::mutex write_mutex;
}

void setLogLevel(LogLevel level) {
    min_level.store(static_cast<int>(level));
}

LogLevel logLevel() {
    return static_cast<LogLevel>(min_level.load());
}

bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= min_level.load();
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

void logMessage(LogLevel level, const char* component, const std::string& message) {
    if (!logEnabled(level)) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&now_time_t, &local_tm);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local_tm);

    std::lock_guard<std::mutex> lock(write_mutex);
    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3)
              << now_ms.count() << "][" << logLevelName(level) << "]["
              << component << "] " << message << "\n";
}

} // namespace edupath

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace liarslie {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

// Process-wide logger. Console lines go to stderr; the optional file sink appends.
// Values following key-like words are masked unless sensitive logging is allowed.
class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);

    static void log(LogLevel level, const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void onLog(std::function<void(const LogEntry&)> callback);

    static uint64_t getErrorCount();
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();

    static void setAllowSensitiveLogging(bool allow);
    static std::string redactPrivateKey(const std::string& data);
};

#define LOG_TRACE(msg) liarslie::utils::Logger::trace(msg)
#define LOG_DEBUG(msg) do { if (liarslie::utils::Logger::getLevel() <= liarslie::utils::LogLevel::DEBUG) liarslie::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) liarslie::utils::Logger::info(msg)
#define LOG_WARN(msg) liarslie::utils::Logger::warn(msg)
#define LOG_ERROR(msg) liarslie::utils::Logger::error(msg)
#define LOG_FATAL(msg) liarslie::utils::Logger::fatal(msg)

}
}

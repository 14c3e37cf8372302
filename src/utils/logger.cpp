#include "utils/logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>

namespace liarslie {
namespace utils {

namespace {

constexpr size_t MAX_RECENT_LOGS = 512;

const char* const SENSITIVE_WORDS[] = {"private_key", "privateKey", "privkey", "secret", "seed"};

struct LogState {
    std::mutex mtx;
    std::atomic<LogLevel> level{LogLevel::INFO};
    std::atomic<bool> console{true};
    std::atomic<bool> allowSensitive{false};
    std::atomic<uint64_t> errors{0};
    std::ofstream file;
    std::deque<LogEntry> recent;
    std::function<void(const LogEntry&)> callback;
};

LogState& state() {
    static LogState s;
    return s;
}

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "-----";
    }
}

bool isValueChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=' ||
           c == '-' || c == '_' || c == '.';
}

// "private_key=abc", "seed: abc", "\"secret\":\"abc\"" -> value replaced with [REDACTED].
std::string maskSensitive(std::string text) {
    for (const char* word : SENSITIVE_WORDS) {
        const std::string key(word);
        size_t from = 0;
        while ((from = text.find(key, from)) != std::string::npos) {
            size_t start = text.find_first_not_of(" \"':=", from + key.size());
            if (start == std::string::npos || start == from + key.size()) {
                from += key.size();
                continue;
            }
            size_t stop = start;
            while (stop < text.size() && isValueChar(text[stop])) stop++;
            if (stop == start) {
                from += key.size();
                continue;
            }
            text.replace(start, stop - start, "[REDACTED]");
            from = start + 10;
        }
    }
    return text;
}

std::string timestampText(time_t now) {
    char buf[32];
    struct tm local;
    localtime_r(&now, &local);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

void emit(LogLevel level, const std::string& category, const std::string& msg) {
    LogState& s = state();
    if (level < s.level.load() || level == LogLevel::OFF) return;

    time_t now = std::time(nullptr);
    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = s.allowSensitive ? msg : maskSensitive(msg);
    entry.timestamp = static_cast<uint64_t>(now);
    entry.threadId = std::hash<std::thread::id>()(std::this_thread::get_id());

    std::string line = timestampText(now) + " [" + levelTag(level) + "] ";
    if (!category.empty()) line += "[" + category + "] ";
    line += entry.message + "\n";

    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.console) std::cerr << line;
    if (s.file.is_open()) s.file << line << std::flush;
    if (level >= LogLevel::ERROR) s.errors++;

    s.recent.push_back(entry);
    if (s.recent.size() > MAX_RECENT_LOGS) s.recent.pop_front();
    if (s.callback) s.callback(entry);
}

}

void Logger::init(const std::string& path) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.close();
    if (!path.empty()) {
        std::filesystem::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
        s.file.open(path, std::ios::app);
        if (!s.file.is_open()) std::cerr << "cannot open log file " << path << "\n";
    }
    const char* env = std::getenv("LIARSLIE_ALLOW_SENSITIVE_LOGS");
    if (env) {
        std::string v(env);
        if (v == "1" || v == "true") s.allowSensitive = true;
    }
}

void Logger::shutdown() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) {
        s.file.flush();
        s.file.close();
    }
}

void Logger::setLevel(LogLevel level) { state().level = level; }

LogLevel Logger::getLevel() { return state().level; }

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return std::tolower(c); });
    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG}, {"info", LogLevel::INFO},
        {"warn", LogLevel::WARN}, {"warning", LogLevel::WARN}, {"error", LogLevel::ERROR},
        {"fatal", LogLevel::FATAL}, {"off", LogLevel::OFF},
    };
    for (const auto& entry : names) {
        if (n == entry.first) {
            out = entry.second;
            return true;
        }
    }
    return false;
}

void Logger::enableConsole(bool enable) { state().console = enable; }

void Logger::trace(const std::string& msg) { emit(LogLevel::TRACE, "", msg); }
void Logger::debug(const std::string& msg) { emit(LogLevel::DEBUG, "", msg); }
void Logger::info(const std::string& msg) { emit(LogLevel::INFO, "", msg); }
void Logger::warn(const std::string& msg) { emit(LogLevel::WARN, "", msg); }
void Logger::error(const std::string& msg) { emit(LogLevel::ERROR, "", msg); }
void Logger::fatal(const std::string& msg) { emit(LogLevel::FATAL, "", msg); }

void Logger::log(LogLevel level, const std::string& msg) { emit(level, "", msg); }

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    emit(level, category, msg);
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.callback = std::move(callback);
}

uint64_t Logger::getErrorCount() { return state().errors; }

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    size_t skip = s.recent.size() > count ? s.recent.size() - count : 0;
    return std::vector<LogEntry>(s.recent.begin() + static_cast<std::ptrdiff_t>(skip), s.recent.end());
}

void Logger::clearLogs() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.recent.clear();
    s.errors = 0;
}

void Logger::setAllowSensitiveLogging(bool allow) { state().allowSensitive = allow; }

std::string Logger::redactPrivateKey(const std::string& data) {
    return state().allowSensitive ? data : "[REDACTED_KEY]";
}

}
}

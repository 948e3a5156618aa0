#pragma once
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace kc {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline LogLevel parseLogLevel(const std::string &val) {
    if (val == "DEBUG")
        return LogLevel::Debug;
    if (val == "INFO")
        return LogLevel::Info;
    if (val == "WARN")
        return LogLevel::Warn;
    if (val == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

inline LogLevel &globalLogLevel() {
    static LogLevel level = [] {
        const char *env = std::getenv("KC_LOG_LEVEL");
        if (!env)
            return LogLevel::Info;
        return parseLogLevel(env);
    }();
    return level;
}

inline void setLogLevel(LogLevel level) { globalLogLevel() = level; }

inline const char *levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

inline std::string currentTime() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%F %T");
    return ss.str();
}

// Recognition replies are logged from dispatcher threads.
inline std::mutex &logMutex() {
    static std::mutex m;
    return m;
}

inline void log(LogLevel level, const std::string &msg,
                const char *file = nullptr, int line = 0) {
    if (static_cast<int>(level) < static_cast<int>(globalLogLevel()))
        return;
    std::ostringstream entry;
    entry << '[' << levelTag(level) << "] " << currentTime();
    if (file)
        entry << ' ' << file << ':' << line;
    entry << ' ' << msg;
    std::lock_guard<std::mutex> lock(logMutex());
    std::ostream &out = (level == LogLevel::Error ? std::cerr : std::cout);
    out << entry.str() << std::endl;
}

} // namespace kc

#define KC_LOG(level, msg) ::kc::log(level, msg, __FILE__, __LINE__)

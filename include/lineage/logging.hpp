// =============================================================================
// logging.hpp - Process-wide run log
// =============================================================================
// One line per event:
//   [2024-05-01 09:12:44.031] WARN path_enumerator.cpp:97 walk() - Cycle ...
// Lines are assembled by the calling thread and written under a single lock,
// so output from parallel indexing and enumeration never interleaves. Below-
// threshold calls return before formatting anything.
// =============================================================================

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace lineage {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

// debug / info / warn / warning / error / off, any case
inline std::optional<LogLevel> parse_log_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "warning") return LogLevel::WARN;
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR, LogLevel::OFF}) {
        std::string candidate = log_level_name(level);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == candidate) return level;
    }
    return std::nullopt;
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) { level_.store(static_cast<int>(level), std::memory_order_relaxed); }

    LogLevel level() const { return static_cast<LogLevel>(level_.load(std::memory_order_relaxed)); }

    bool enabled(LogLevel level) const {
        return level != LogLevel::OFF && static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        if (!enabled(level)) return;

        std::ostringstream message;
        (message << ... << std::forward<Args>(args));
        std::string text = format_line(level, file, line, func, message.str());

        std::lock_guard<std::mutex> lock(mutex_);
        *output_ << text << '\n';
        if (level >= LogLevel::WARN) output_->flush();
    }

    static std::string format_line(LogLevel level, const char* file, int line, const char* func,
                                   const std::string& message) {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local{};
#if defined(_WIN32)
        localtime_s(&local, &seconds);
#else
        localtime_r(&seconds, &local);
#endif

        const char* base = std::strrchr(file, '/');
        if (!base) base = std::strrchr(file, '\\');
        base = base ? base + 1 : file;

        std::ostringstream out;
        out << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count() << "] "
            << log_level_name(level) << ' ' << base << ':' << line << ' ' << func << "() - "
            << message;
        return out.str();
    }

private:
    Logger() : level_(static_cast<int>(LogLevel::INFO)), output_(&std::cerr) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<int> level_;
    std::ostream* output_;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) lineage::Logger::getInstance().log(lineage::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  lineage::Logger::getInstance().log(lineage::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  lineage::Logger::getInstance().log(lineage::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) lineage::Logger::getInstance().log(lineage::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

} // namespace lineage

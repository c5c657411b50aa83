#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace lb {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide line logger shared by the acceptor and every I/O thread.
// Each line is "[time] [LEVEL] [file:line] message"; colored on a tty.
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    bool Enabled(LogLevel level) const { return level >= GetLevel(); }

    // Case-insensitive ("info", "WARN"). Returns false and leaves *out
    // untouched for an unknown name.
    static bool ParseLevel(const std::string& name, LogLevel* out);

    // DEBUG..WARN go to stdout, ERROR and FATAL to stderr.
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    bool colorOut_ = false;
    bool colorErr_ = false;
    std::mutex mutex_;
};

// Collects one message and hands it to the Logger when the statement ends.
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream ss_;
};

} // namespace common
} // namespace lb

// Arguments are not evaluated when the level is filtered out.
#define LB_LOG(level) \
    if (lb::common::Logger::Instance().Enabled(level)) \
    lb::common::LogStream(level, __FILE__, __LINE__)

#define LOG_DEBUG LB_LOG(lb::common::LogLevel::DEBUG)
#define LOG_INFO LB_LOG(lb::common::LogLevel::INFO)
#define LOG_WARN LB_LOG(lb::common::LogLevel::WARN)
#define LOG_ERROR LB_LOG(lb::common::LogLevel::ERROR)
#define LOG_FATAL LB_LOG(lb::common::LogLevel::FATAL)

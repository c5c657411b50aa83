#include "lb/common/Logger.h"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace lb {
namespace common {

namespace {

std::string CurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm tmBuf;
    ::localtime_r(&in_time_t, &tmBuf);

    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m"; // Cyan
        case LogLevel::INFO:  return "\033[32m"; // Green
        case LogLevel::WARN:  return "\033[33m"; // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        case LogLevel::FATAL: return "\033[35m"; // Magenta
        default: return "\033[0m";
    }
}

const char* Basename(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : colorOut_(::isatty(STDOUT_FILENO) == 1),
      colorErr_(::isatty(STDERR_FILENO) == 1) {
}

bool Logger::ParseLevel(const std::string& name, LogLevel* out) {
    std::string levelStr(name);
    std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (levelStr == "DEBUG") *out = LogLevel::DEBUG;
    else if (levelStr == "INFO") *out = LogLevel::INFO;
    else if (levelStr == "WARN") *out = LogLevel::WARN;
    else if (levelStr == "ERROR") *out = LogLevel::ERROR;
    else if (levelStr == "FATAL") *out = LogLevel::FATAL;
    else return false;
    return true;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const bool toErr = level >= LogLevel::ERROR;
    std::ostream& os = toErr ? std::cerr : std::cout;
    const bool color = toErr ? colorErr_ : colorOut_;

    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [Time] [Level] [File:Line] Message
    if (color) os << LevelToColor(level);
    os << "[" << CurrentTime() << "] "
       << "[" << LevelToString(level) << "] "
       << "[" << Basename(file) << ":" << line << "] "
       << msg;
    if (color) os << "\033[0m";
    os << std::endl;
}

} // namespace common
} // namespace lb

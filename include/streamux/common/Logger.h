#pragma once

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace streamux {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_; }
    LogLevel ParseLevel(const std::string& levelStr) const;

    // Redirect output to an append-only file. Empty path restores stdout.
    bool SetOutputFile(const std::string& path);

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::INFO;
    std::mutex mutex_;
    std::ofstream file_;
};

// Collects one record and hands it to the Logger on destruction:
//   LOG_INFO << "accepted " << peer;
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
    std::stringstream ss_;
};

} // namespace common
} // namespace streamux

#define LOG_DEBUG \
    if (streamux::common::LogLevel::DEBUG >= streamux::common::Logger::Instance().GetLevel()) \
    streamux::common::LogStream(streamux::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (streamux::common::LogLevel::INFO >= streamux::common::Logger::Instance().GetLevel()) \
    streamux::common::LogStream(streamux::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (streamux::common::LogLevel::WARN >= streamux::common::Logger::Instance().GetLevel()) \
    streamux::common::LogStream(streamux::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (streamux::common::LogLevel::ERROR >= streamux::common::Logger::Instance().GetLevel()) \
    streamux::common::LogStream(streamux::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (streamux::common::LogLevel::FATAL >= streamux::common::Logger::Instance().GetLevel()) \
    streamux::common::LogStream(streamux::common::LogLevel::FATAL, __FILE__, __LINE__)

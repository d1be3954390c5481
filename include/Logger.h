#pragma once

#include <atomic>
#include <string>
#include <fstream>
#include <mutex>
#include <sstream>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERR = 4,     // ERROR collides with system macros
    NONE = 5     // No logging
};

// Map a config string ("trace", "debug", "info", "warning", "error", "none")
// to a level. Unknown strings map to INFO.
LogLevel parseLogLevel(const std::string& name);

// Process-wide log sink shared by all worker threads. Lines are
// "<UTC timestamp> [LEVEL] message", written to stdout and, when a path is
// configured, appended to a log file.
class Logger {
public:
    static Logger& getInstance();

    // An empty path disables the file sink
    void init(LogLevel level = LogLevel::INFO, bool enableConsoleLogging = true, const std::string& logFilePath = "");

    void setLogLevel(LogLevel level);

    LogLevel getLogLevel() const {
        return logLevel.load();
    }

    bool isEnabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    // Close log file if open
    void close();

    ~Logger();

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static const char* levelName(LogLevel level);

    // UTC wall clock with millisecond precision
    static std::string timestamp();

    std::atomic<LogLevel> logLevel;
    bool logToConsole;
    std::ofstream logFile;
    std::mutex mutex;
};

#define LOG_TRACE(message) Logger::getInstance().log(LogLevel::TRACE, message)
#define LOG_DEBUG(message) Logger::getInstance().log(LogLevel::DEBUG, message)
#define LOG_INFO(message) Logger::getInstance().log(LogLevel::INFO, message)
#define LOG_WARNING(message) Logger::getInstance().log(LogLevel::WARNING, message)
#define LOG_ERROR(message) Logger::getInstance().log(LogLevel::ERR, message)

// Stream-style variants; the message expression is only evaluated when the level is enabled
#define LINKGUARD_LOG_STREAM(level, message) \
    do { \
        if (Logger::getInstance().isEnabled(level)) { \
            std::ostringstream logStream_; \
            logStream_ << message; \
            Logger::getInstance().log(level, logStream_.str()); \
        } \
    } while (0)

#define LOG_TRACE_STREAM(message) LINKGUARD_LOG_STREAM(LogLevel::TRACE, message)
#define LOG_DEBUG_STREAM(message) LINKGUARD_LOG_STREAM(LogLevel::DEBUG, message)
#define LOG_INFO_STREAM(message) LINKGUARD_LOG_STREAM(LogLevel::INFO, message)
#define LOG_WARNING_STREAM(message) LINKGUARD_LOG_STREAM(LogLevel::WARNING, message)
#define LOG_ERROR_STREAM(message) LINKGUARD_LOG_STREAM(LogLevel::ERR, message)

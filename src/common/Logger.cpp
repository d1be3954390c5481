#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error" || lower == "err") return LogLevel::ERR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : logLevel(LogLevel::INFO), logToConsole(true) {
}

Logger::~Logger() {
    close();
}

void Logger::init(LogLevel level, bool enableConsoleLogging, const std::string& logFilePath) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
    logToConsole = enableConsoleLogging;

    if (logFile.is_open()) {
        logFile.close();
    }
    if (logFilePath.empty()) {
        return;
    }

    logFile.open(logFilePath, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "[WARN] Could not open log file: " << logFilePath << std::endl;
    }
}

void Logger::setLogLevel(LogLevel level) {
    logLevel = level;
}

bool Logger::isEnabled(LogLevel level) const {
    return level != LogLevel::NONE && level >= logLevel.load();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    std::string line = timestamp() + " [" + levelName(level) + "] " + message;

    std::lock_guard<std::mutex> lock(mutex);
    if (logToConsole) {
        std::cout << line << std::endl;
    }
    if (logFile.is_open()) {
        logFile << line << std::endl;
    }
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&nowTimeT, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return ss.str();
}

#include "viewfinder/core/Logger.hpp"
#include "viewfinder/core/exception.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace viewfinder {
namespace core {

namespace {

std::string currentTimestamp(const char* format, bool withMillis) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, format);
    if (withMillis) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
}

} // namespace

LogLevel parseLogLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;

    VIEWFINDER_THROW(ConfigurationException, "Unknown log level '" + name + "'");
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logFile_.is_open()) {
        logFile_.close();
    }
    logFile_.open(filename, std::ios::app);
    currentLogFile_ = logFile_.is_open() ? filename : std::string();
    return logFile_.is_open();
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    minLevel_ = level;

    std::error_code ec;
    std::filesystem::create_directories(logDirectory, ec);
    if (ec || !std::filesystem::is_directory(logDirectory)) {
        std::cerr << "[Logger] Could not create log directory " << logDirectory
                  << ", file logging disabled" << std::endl;
        return false;
    }

    std::filesystem::path path(logDirectory);
    path /= "viewfinder_" + currentTimestamp("%Y-%m-%d_%H-%M-%S", false) + ".log";

    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    logFile_.open(path.string(), std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Failed to open log file " << path.string() << std::endl;
        currentLogFile_.clear();
        return false;
    }
    currentLogFile_ = path.string();

    logFile_ << "viewfinder log started " << currentTimestamp("%Y-%m-%d %H:%M:%S", true)
             << " (level " << logLevelToString(level) << ")" << std::endl;
    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        std::cout.flush();
        std::cerr.flush();
    }
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line) {
    if (level < minLevel_) {
        return;
    }

    std::string formatted = formatMessage(level, message, file, line);

    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }
    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
    }
}

void Logger::logComponent(LogLevel level, const std::string& component,
                          const std::string& message) {
    if (component.empty()) {
        log(level, message);
    } else {
        log(level, "[" + component + "] " + message);
    }
}

std::string Logger::formatMessage(LogLevel level, const std::string& message,
                                  const std::string& file, int line) const {
    std::ostringstream oss;
    oss << "[" << currentTimestamp("%Y-%m-%d %H:%M:%S", true) << "] ["
        << logLevelToString(level) << "] " << message;

    if (!file.empty() && line > 0) {
        size_t pos = file.find_last_of("/\\");
        oss << " (" << (pos != std::string::npos ? file.substr(pos + 1) : file)
            << ":" << line << ")";
    }
    return oss.str();
}

} // namespace core
} // namespace viewfinder

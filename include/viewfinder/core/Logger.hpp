#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace viewfinder {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name ("trace", "debug", "info", "warning", "error",
 * "critical"), case-insensitive.
 * @throws ConfigurationException on an unknown name
 */
LogLevel parseLogLevel(const std::string& name);

/**
 * Process-wide thread-safe logger writing to the console and an optional file
 */
class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }
    LogLevel getLevel() const { return minLevel_; }

    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Append log lines to the given file
     * @return false if the file cannot be opened
     */
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    /**
     * Open a timestamped log file inside logDirectory, creating the
     * directory (and parents) when needed
     * @return false if file logging could not be enabled; console output
     *         stays active in that case
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    /**
     * Path of the file opened by initializeWithTimestamp or setLogFile,
     * empty when logging to console only
     */
    std::string getCurrentLogFile() const;

    void flush();

    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    /**
     * Log on behalf of a named component: the message is prefixed with
     * "[component] "
     */
    void logComponent(LogLevel level, const std::string& component,
                      const std::string& message);

    void trace(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::TRACE, msg, file, line);
    }
    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, msg, file, line);
    }
    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, msg, file, line);
    }
    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, msg, file, line);
    }
    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, msg, file, line);
    }
    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, msg, file, line);
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;

    std::atomic<LogLevel> minLevel_{LogLevel::INFO};
    std::atomic<bool> consoleOutput_{true};
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

/**
 * Upper-case level name as printed in log lines
 */
const char* logLevelToString(LogLevel level);

#define LOG_TRACE(msg) viewfinder::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) viewfinder::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) viewfinder::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) viewfinder::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) viewfinder::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) viewfinder::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging: the line is emitted when the temporary is destroyed
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        Logger::getInstance().logComponent(level_, component_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define VIEWFINDER_LOG_DEBUG(component) \
    viewfinder::core::LogStream(viewfinder::core::LogLevel::DEBUG, component)

#define VIEWFINDER_LOG_INFO(component) \
    viewfinder::core::LogStream(viewfinder::core::LogLevel::INFO, component)

#define VIEWFINDER_LOG_WARNING(component) \
    viewfinder::core::LogStream(viewfinder::core::LogLevel::WARNING, component)

#define VIEWFINDER_LOG_ERROR(component) \
    viewfinder::core::LogStream(viewfinder::core::LogLevel::ERROR, component)

#define VIEWFINDER_LOG_CRITICAL(component) \
    viewfinder::core::LogStream(viewfinder::core::LogLevel::CRITICAL, component)

} // namespace core
} // namespace viewfinder

#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <fstream>
#include <cstddef>

namespace backscan {
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
 * Parse a level name ("trace", "DEBUG", "warn", ...).
 * Throws ConfigException on an unknown name.
 */
LogLevel logLevelFromString(const std::string& name);

/**
 * Simple thread-safe logger
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    /**
     * Set minimum log level
     */
    void setLevel(LogLevel level) { minLevel_ = level; }

    /**
     * Get current log level
     */
    LogLevel getLevel() const { return minLevel_; }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Set log file (appends)
     */
    bool setLogFile(const std::string& filename);

    /**
     * Close log file
     */
    void closeLogFile();

    /**
     * Initialize logger with automatic timestamped log file
     * Creates log directory if needed, generates filename with timestamp
     * @param logDirectory Directory for log files
     * @param level Minimum log level to capture
     * @return true if file logging is active, false if console only
     */
    bool initializeWithTimestamp(const std::string& logDirectory = "logs",
                                 LogLevel level = LogLevel::INFO);

    /**
     * Get current log file path
     * @return Path to current log file, empty string if no file logging
     */
    std::string getCurrentLogFile() const;

    /**
     * Number of messages that passed the level filter since startup
     */
    size_t getMessageCount() const;

    /**
     * Flush all pending log messages
     */
    void flush();

    /**
     * Log message
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    // Convenience methods
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

    static std::string levelToString(LogLevel level);

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;
    std::string generateTimestampedFilename(const std::string& directory) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;
    size_t messageCount_ = 0;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_TRACE(msg) backscan::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) backscan::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) backscan::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) backscan::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) backscan::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) backscan::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging, prefixed with a component tag
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level) {
        if (!component.empty()) {
            stream_ << "[" << component << "] ";
        }
    }

    ~LogStream() {
        Logger::getInstance().log(level_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
};

#define BACKSCAN_LOG_DEBUG(component) \
    backscan::core::LogStream(backscan::core::LogLevel::DEBUG, component)

#define BACKSCAN_LOG_INFO(component) \
    backscan::core::LogStream(backscan::core::LogLevel::INFO, component)

#define BACKSCAN_LOG_WARNING(component) \
    backscan::core::LogStream(backscan::core::LogLevel::WARNING, component)

#define BACKSCAN_LOG_ERROR(component) \
    backscan::core::LogStream(backscan::core::LogLevel::ERROR, component)

} // namespace core
} // namespace backscan

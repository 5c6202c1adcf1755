#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <fstream>

namespace facecue {
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
 * Parse a level name ("debug", "INFO", ...). Returns false on unknown names.
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

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
    void setLevel(LogLevel level);

    /**
     * Get current log level
     */
    LogLevel getLevel() const;

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable);

    /**
     * Initialize logger with configuration
     */
    bool initialize(LogLevel level, bool consoleOutput, bool fileOutput, const std::string& filename = "");

    /**
     * Initialize logger with automatic timestamped log file
     * Creates log directory if needed, generates filename with timestamp
     * @param logDirectory Directory for log files
     * @param level Minimum log level to capture
     * @return true if the log file was opened, false if running console-only
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    /**
     * Get current log file path, empty string if no file logging
     */
    std::string getCurrentLogFile() const;

    /**
     * Close log file
     */
    void closeLogFile();

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

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string levelToString(LogLevel level) const;
    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;
    std::string generateTimestampedFilename(const std::string& directory) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_TRACE(msg) facecue::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) facecue::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) facecue::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) facecue::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) facecue::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) facecue::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging support
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        std::string text = component_.empty()
            ? stream_.str()
            : "[" + component_ + "] " + stream_.str();
        Logger::getInstance().log(level_, text);
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

#define FACECUE_LOG_DEBUG(component) \
    facecue::core::LogStream(facecue::core::LogLevel::DEBUG, component)

#define FACECUE_LOG_INFO(component) \
    facecue::core::LogStream(facecue::core::LogLevel::INFO, component)

#define FACECUE_LOG_WARNING(component) \
    facecue::core::LogStream(facecue::core::LogLevel::WARNING, component)

#define FACECUE_LOG_ERROR(component) \
    facecue::core::LogStream(facecue::core::LogLevel::ERROR, component)

#define FACECUE_LOG_CRITICAL(component) \
    facecue::core::LogStream(facecue::core::LogLevel::CRITICAL, component)

} // namespace core
} // namespace facecue

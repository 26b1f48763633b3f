#ifndef PIIGUARD_UTIL_LOGGER_HPP
#define PIIGUARD_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <stdexcept>

/**
 * @file logger.hpp
 * @brief Thread-safe logging utility shared by the piiguard engine and service.
 *
 * The logger is the only process-wide object in piiguard. Engine components,
 * recognizers and the HTTP front all write through it, so every method takes
 * the internal mutex.
 *
 * Usage:
 *   - logger::info("SpanResolver: kept 3 of 5 spans");
 *   - logger::setLogLevel(logger::parseLogLevel("debug"));
 *   - logger::enableFileOutput("piiguard.log", true);
 */

namespace piiguard {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Parse a level name ("debug", "INFO", "warning", ...) case-insensitively.
 * @throw std::runtime_error on an unknown name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical" || lower == "fatal") return LogLevel::CRITICAL;
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

inline const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Process-wide logger. Lines look like "[2024-05-01 12:00:00][WARN] msg";
 * the file sink, when enabled, receives every line the console does.
 */
class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Enable output to a file in addition to the console.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     * @return false if the file could not be opened (console logging continues).
     */
    bool enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    void debug(const std::string &msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string &msg) { log(LogLevel::INFO, msg); }
    void warn(const std::string &msg) { log(LogLevel::WARN, msg); }
    void error(const std::string &msg) { log(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { log(LogLevel::CRITICAL, msg); }

private:
    Logger()
        : logLevel_(LogLevel::INFO)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Core logging function that writes to console and optionally to a file.
     */
    void log(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream line;
        line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "]["
             << levelName(level) << "] " << msg << "\n";

        // WARN and above go to stderr.
        std::ostream &console = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        console << line.str();
        console.flush();

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// Shortcuts on the global instance.
inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }
inline LogLevel getLogLevel() { return Logger::getInstance().getLogLevel(); }
inline bool enableFileOutput(const std::string &filename, bool append = false)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}
inline void disableFileOutput() { Logger::getInstance().disableFileOutput(); }

inline void debug(const std::string &msg) { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg) { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg) { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg) { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_LOGGER_HPP

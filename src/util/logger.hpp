#ifndef CHUNKWORKER_UTIL_LOGGER_HPP
#define CHUNKWORKER_UTIL_LOGGER_HPP

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * @file logger.hpp
 * @brief Process-wide logger shared by the catalogue, the transfer pool and main.
 *
 * Usage:
 *   - logger::configure("DEBUG", "worker.log");
 *   - logger::info("[DataCatalogue] ...");
 *   - Logger::getInstance().setConsoleOutput(false);
 *
 * Line format:  [2024-05-01 12:00:00.123][INFO][T3] message
 * T<n> numbers threads in the order they first log, so the lines of one
 * transfer can be followed across a busy pool. Lines are written whole under
 * one mutex.
 */

namespace chunkworker {
namespace util {
namespace logger {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

inline const char* levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::DEBUG:    return "DEBUG";
    case LogLevel::INFO:     return "INFO";
    case LogLevel::WARN:     return "WARN";
    case LogLevel::ERROR:    return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "?";
}

/**
 * @brief Parse a level name as written in the worker config.
 * @throw std::runtime_error for unknown names.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                           LogLevel::ERROR, LogLevel::CRITICAL}) {
        if (name == levelName(level)) {
            return level;
        }
    }
    throw std::runtime_error("logger: unknown log level '" + name + "'");
}

/**
 * @brief Small per-thread number used as the [T<n>] tag.
 */
inline unsigned threadTag()
{
    static std::atomic<unsigned> next{1};
    thread_local unsigned tag = next.fetch_add(1);
    return tag;
}

class Logger {
public:
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threshold_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return threshold_;
    }

    /**
     * @brief Mirror every line into a file as well.
     * @return false if the file cannot be opened; console logging is unaffected.
     */
    bool enableFileOutput(const std::string &filename, bool append = true)
    {
        auto mode = std::ios::out | (append ? std::ios::app : std::ios::trunc);
        auto stream = std::make_unique<std::ofstream>(filename, mode);
        if (!stream->is_open()) {
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        file_ = std::move(stream);
        return true;
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.reset();
    }

    /// Console output is on by default.
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        console_ = enabled;
    }

    void write(LogLevel level, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < threshold_) {
            return;
        }
        const std::string line = formatLine(level, msg);

        if (console_) {
            // stdout is reserved for command output below WARN
            std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
            out << line << std::flush;
        }
        if (file_) {
            *file_ << line << std::flush;
        }
    }

    void debug(const std::string &msg) { write(LogLevel::DEBUG, msg); }
    void info(const std::string &msg) { write(LogLevel::INFO, msg); }
    void warn(const std::string &msg) { write(LogLevel::WARN, msg); }
    void error(const std::string &msg) { write(LogLevel::ERROR, msg); }
    void critical(const std::string &msg) { write(LogLevel::CRITICAL, msg); }

    static std::string formatLine(LogLevel level, const std::string &msg)
    {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const std::time_t seconds = system_clock::to_time_t(now);
        const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream line;
        line << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setw(3) << std::setfill('0') << millis << ']'
             << '[' << levelName(level) << "][T" << threadTag() << "] " << msg << '\n';
        return line.str();
    }

private:
    Logger() : threshold_(LogLevel::INFO), console_(true) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    LogLevel threshold_;
    bool console_;
    std::unique_ptr<std::ofstream> file_;
};

// ----------------------------------------------------------------------------
//  Shortcuts
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level) { Logger::getInstance().setLogLevel(level); }

inline bool enableFileOutput(const std::string &filename, bool append = true)
{
    return Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput() { Logger::getInstance().disableFileOutput(); }

/**
 * @brief Apply the logLevel / logFile settings of the worker config.
 * @return false if logFile is set but cannot be opened.
 * @throw std::runtime_error on an unknown level name.
 */
inline bool configure(const std::string &level, const std::string &logFile)
{
    setLogLevel(parseLogLevel(level));
    if (logFile.empty()) {
        disableFileOutput();
        return true;
    }
    return enableFileOutput(logFile);
}

inline void debug(const std::string &msg) { Logger::getInstance().debug(msg); }
inline void info(const std::string &msg) { Logger::getInstance().info(msg); }
inline void warn(const std::string &msg) { Logger::getInstance().warn(msg); }
inline void error(const std::string &msg) { Logger::getInstance().error(msg); }
inline void critical(const std::string &msg) { Logger::getInstance().critical(msg); }

} // namespace logger
} // namespace util
} // namespace chunkworker

#endif // CHUNKWORKER_UTIL_LOGGER_HPP

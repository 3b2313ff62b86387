#pragma once

#include <string>
#include <string_view>
#include <sstream>
#include <fstream>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

namespace dbutils::core {

/**
 * @brief Log levels
 */
enum class LogLevel {
    TRACE,   // Every ODBC call and bound value
    DEBUG,   // Generated SQL, session lifecycle
    INFO,    // Configuration, connection targets
    WARN,    // Rollbacks, recoverable problems
    ERROR,   // Failed rollbacks, failed runs
    FATAL
};

/**
 * @brief Thread-safe process-wide logger
 *
 * Messages go to the console (stderr for ERROR and above), to an optional
 * log file opened in append mode, and to an optional sink callback.
 *
 * Usage:
 *   Logger::instance().set_level(LogLevel::DEBUG);
 *   Logger::instance().set_output("dbutils.log");
 *
 *   LOG_DEBUG("UPDATE Driver SET Name = @Name WHERE Id = @Id");
 *   LOG_IF(use_transactions, "Running inside a transaction", "Running in autocommit mode");
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const noexcept { return min_level_; }

    /**
     * @brief Set output file (empty closes the file)
     */
    void set_output(std::string_view filename);

    void set_console_enabled(bool enabled);

    /**
     * @brief Receive every formatted line that passes the level filter
     */
    void set_sink(Sink sink);

    void log(LogLevel level, std::string_view file, int line,
             std::string_view function, std::string_view message);

    /**
     * @brief Log which side of a condition was taken (DEBUG)
     */
    void log_branch(bool condition, std::string_view file, int line,
                    std::string_view function,
                    std::string_view true_msg,
                    std::string_view false_msg = "");

    static std::string level_to_string(LogLevel level);

private:
    Logger();
    ~Logger();

    LogLevel min_level_ = LogLevel::INFO;
    bool console_enabled_ = true;
    std::ofstream file_stream_;
    Sink sink_;
    std::mutex mutex_;

    std::string timestamp();
};

// Parse "trace", "debug", "info", "warn", "error", "fatal" (case-insensitive)
std::optional<LogLevel> parse_log_level(std::string_view text);

} // namespace dbutils::core

#define LOG_TRACE(msg) \
    dbutils::core::Logger::instance().log( \
        dbutils::core::LogLevel::TRACE, __FILE__, __LINE__, __func__, msg)

#define LOG_DEBUG(msg) \
    dbutils::core::Logger::instance().log( \
        dbutils::core::LogLevel::DEBUG, __FILE__, __LINE__, __func__, msg)

#define LOG_INFO(msg) \
    dbutils::core::Logger::instance().log( \
        dbutils::core::LogLevel::INFO, __FILE__, __LINE__, __func__, msg)

#define LOG_WARN(msg) \
    dbutils::core::Logger::instance().log( \
        dbutils::core::LogLevel::WARN, __FILE__, __LINE__, __func__, msg)

#define LOG_ERROR(msg) \
    dbutils::core::Logger::instance().log( \
        dbutils::core::LogLevel::ERROR, __FILE__, __LINE__, __func__, msg)

#define LOG_FATAL(msg) \
    dbutils::core::Logger::instance().log( \
        dbutils::core::LogLevel::FATAL, __FILE__, __LINE__, __func__, msg)

#define LOG_IF(condition, true_msg, ...) \
    dbutils::core::Logger::instance().log_branch( \
        (condition), __FILE__, __LINE__, __func__, \
        true_msg, ##__VA_ARGS__)

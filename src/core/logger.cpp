#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <ctime>

namespace dbutils::core {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::set_output(std::string_view filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_stream_.is_open()) {
        file_stream_.close();
    }

    if (!filename.empty()) {
        file_stream_.open(std::string(filename), std::ios::app);
    }
}

void Logger::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(LogLevel level, std::string_view file, int line,
                 std::string_view function, std::string_view message) {
    if (level < min_level_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // Only the file name, the full build path adds nothing
    auto slash = file.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        file.remove_prefix(slash + 1);
    }

    // [TIMESTAMP] [LEVEL] [file:line] [function] message
    std::ostringstream oss;
    oss << "[" << timestamp() << "] "
        << "[" << std::setw(5) << level_to_string(level) << "] "
        << "[" << file << ":" << line << "] "
        << "[" << function << "] "
        << message;

    std::string formatted = oss.str();

    if (console_enabled_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::clog << formatted << std::endl;
        }
    }

    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::endl;
        file_stream_.flush();
    }

    if (sink_) {
        sink_(level, formatted);
    }
}

void Logger::log_branch(bool condition, std::string_view file, int line,
                        std::string_view function,
                        std::string_view true_msg,
                        std::string_view false_msg) {
    if (LogLevel::DEBUG < min_level_) {
        return;
    }

    std::ostringstream oss;
    oss << "BRANCH: " << (condition ? "TRUE" : "FALSE") << " - ";

    if (condition) {
        oss << true_msg;
    } else if (!false_msg.empty()) {
        oss << false_msg;
    } else {
        oss << "condition false";
    }

    log(LogLevel::DEBUG, file, line, function, oss.str());
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t_now), "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

} // namespace dbutils::core

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <sys/syscall.h>
#include <unistd.h>


Logger* Logger::instance_ = nullptr;
std::mutex Logger::instance_mtx_;

Logger::Logger()
    : current_level_(Level::INFO),
      log_to_console_(true),
      color_stderr_(isatty(STDERR_FILENO) != 0)
{
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

Logger* Logger::get_instance() {
    std::lock_guard<std::mutex> lock(instance_mtx_);
    if (instance_ == nullptr) {
        instance_ = new Logger();
    }
    return instance_;
}

void Logger::set_log_level(Level level) {
    std::lock_guard<std::mutex> lock(mtx_);
    current_level_ = level;
}

Logger::Level Logger::log_level() {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_level_;
}

bool Logger::is_enabled(Level level) {
    std::lock_guard<std::mutex> lock(mtx_);
    return level >= current_level_;
}

void Logger::set_log_to_console(bool enable) {
    std::lock_guard<std::mutex> lock(mtx_);
    log_to_console_ = enable;
}

bool Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (log_file_.is_open()) {
        log_file_.close();
    }
    if (filename.empty()) {
        return true;
    }

    log_file_.open(filename, std::ios::app);

    if (!log_file_.is_open()) {
        std::cerr << "Warning: Could not open log file: " << filename << std::endl;
        return false;
    }
    return true;
}

Logger::Level Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")                       return Level::DEBUG;
    if (lower == "info")                        return Level::INFO;
    if (lower == "warning" || lower == "warn")  return Level::WARNING;
    if (lower == "error")                       return Level::ERROR;
    if (lower == "critical")                    return Level::CRITICAL;

    throw std::invalid_argument("unknown log level: " + name);
}

std::string Logger::get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&now_c, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

std::string Logger::level_to_string(Level level) {
    switch (level) {
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO";
        case Level::WARNING:  return "WARNING";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRITICAL";
        default:              return "UNKNOWN";
    }
}

std::string Logger::format_entry(Level level, const std::string& message,
                                 const std::string& file, int line) {
    std::ostringstream ss;
    ss << get_current_timestamp()
       << " [" << std::left << std::setw(8) << level_to_string(level) << "]"
       << " [tid " << static_cast<long>(syscall(SYS_gettid)) << "] ";

    if (!file.empty()) {
        size_t pos = file.find_last_of('/');
        ss << "[" << (pos == std::string::npos ? file : file.substr(pos + 1))
           << ":" << line << "] ";
    }

    ss << message;
    return ss.str();
}

void Logger::log(Level level, const std::string& message,
                 const std::string& file, int line) {
    if (!is_enabled(level)) {
        return;
    }

    // Format before locking; only the writes are serialized
    const std::string entry = format_entry(level, message, file, line);
    const bool to_stderr = level >= Level::WARNING;
    const char* color = level == Level::WARNING ? "\033[1;33m" : "\033[1;31m";

    std::lock_guard<std::mutex> lock(mtx_);

    if (log_to_console_) {
        if (!to_stderr) {
            std::cout << entry << std::endl;
        } else if (color_stderr_) {
            std::cerr << color << entry << "\033[0m" << std::endl;
        } else {
            std::cerr << entry << std::endl;
        }
    }

    if (log_file_.is_open()) {
        log_file_ << entry << '\n';
        log_file_.flush();
    }
}


void Logger::debug(const std::string& message,
                   const std::string& file, int line) {
    log(Level::DEBUG, message, file, line);
}

void Logger::info(const std::string& message,
                  const std::string& file, int line) {
    log(Level::INFO, message, file, line);
}

void Logger::warning(const std::string& message,
                     const std::string& file, int line) {
    log(Level::WARNING, message, file, line);
}

void Logger::error(const std::string& message,
                   const std::string& file, int line) {
    log(Level::ERROR, message, file, line);
}

void Logger::critical(const std::string& message,
                      const std::string& file, int line) {
    log(Level::CRITICAL, message, file, line);
}

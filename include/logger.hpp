#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <mutex>
#include <fstream>
#include <memory>

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    // Process-wide instance
    static Logger* get_instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void debug(const std::string& message,
               const std::string& file = "", int line = 0);
    void info(const std::string& message,
              const std::string& file = "", int line = 0);
    void warning(const std::string& message,
                 const std::string& file = "", int line = 0);
    void error(const std::string& message,
               const std::string& file = "", int line = 0);
    void critical(const std::string& message,
                  const std::string& file = "", int line = 0);

    void set_log_level(Level level);
    Level log_level();
    bool is_enabled(Level level);
    void set_log_to_console(bool enable);

    /**
     * @brief Append log entries to @p filename as well as the console
     * @return false if the file could not be opened
     */
    bool set_log_file(const std::string& filename);

    /**
     * @brief Parse "debug", "info", "warning"/"warn", "error", "critical"
     * @throw std::invalid_argument for anything else
     */
    static Level parse_level(const std::string& name);
    static std::string level_to_string(Level level);

private:
    Logger();
    ~Logger();

    void log(Level level, const std::string& message,
             const std::string& file = "", int line = 0);

    std::string get_current_timestamp();
    std::string format_entry(Level level, const std::string& message,
                             const std::string& file, int line);

    static Logger* instance_;
    static std::mutex instance_mtx_;

    std::mutex mtx_;
    std::ofstream log_file_;
    Level current_level_;
    bool log_to_console_;
    bool color_stderr_;   // ANSI colors only on a terminal
};

#define LOG_DEBUG(msg) Logger::get_instance()->debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) Logger::get_instance()->info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) Logger::get_instance()->warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) Logger::get_instance()->error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) Logger::get_instance()->critical(msg, __FILE__, __LINE__)

#endif // LOGGER_H

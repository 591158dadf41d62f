#ifndef KEYPROBE_LOGGING_HPP
#define KEYPROBE_LOGGING_HPP

#include <functional>
#include <memory>
#include <string>

namespace keyprobe {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

// Accepts "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
// in any case. Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;

    // Replaces the file sink. An empty filename disables file output.
    // A file that cannot be opened leaves console-only logging in place,
    // logs a warning and returns false.
    bool set_output_file(const std::string& filename);

    // Called before every message that passes the level filter, so an
    // in-place progress line can be ended first. Empty to remove.
    void set_console_interrupt(std::function<void()> hook);

    void flush();

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Convenience macros
#define LOG_TRACE(msg) keyprobe::Logger::getInstance().trace(msg)
#define LOG_DEBUG(msg) keyprobe::Logger::getInstance().debug(msg)
#define LOG_INFO(msg) keyprobe::Logger::getInstance().info(msg)
#define LOG_WARNING(msg) keyprobe::Logger::getInstance().warning(msg)
#define LOG_ERROR(msg) keyprobe::Logger::getInstance().error(msg)
#define LOG_CRITICAL(msg) keyprobe::Logger::getInstance().critical(msg)

} // namespace keyprobe

#endif // KEYPROBE_LOGGING_HPP

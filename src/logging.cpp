#include "keyprobe/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace keyprobe {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARNING: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    if (lowered == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    std::function<void()> console_interrupt;
    LogLevel level = LogLevel::INFO;
    std::mutex mutex;

    Impl() {
        // Diagnostics go to stderr so the progress line on stdout stays intact
        console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);
        rebuild();
    }

    void rebuild() {
        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (file_sink) {
            sinks.push_back(file_sink);
        }

        logger = std::make_shared<spdlog::logger>("keyprobe", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
    }

    void log(spdlog::level::level_enum lvl, const std::string& message) {
        if (!logger->should_log(lvl)) {
            return;
        }
        if (console_interrupt) {
            console_interrupt();
        }
        logger->log(lvl, message);
    }

    void set_level(LogLevel new_level) {
        std::lock_guard<std::mutex> lock(mutex);
        level = new_level;
        logger->set_level(to_spdlog(level));
    }

    // Returns the error text when the file could not be opened
    std::string set_output_file(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex);
        if (logger) {
            logger->flush();
        }

        std::string failure;
        file_sink.reset();
        if (!filename.empty()) {
            try {
                // Appends; a run never truncates the previous run's log
                file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
                file_sink->set_level(spdlog::level::trace);
            } catch (const spdlog::spdlog_ex& e) {
                failure = e.what();
            }
        }
        rebuild();
        return failure;
    }
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) {
    pImpl->log(spdlog::level::trace, message);
}

void Logger::debug(const std::string& message) {
    pImpl->log(spdlog::level::debug, message);
}

void Logger::info(const std::string& message) {
    pImpl->log(spdlog::level::info, message);
}

void Logger::warning(const std::string& message) {
    pImpl->log(spdlog::level::warn, message);
}

void Logger::error(const std::string& message) {
    pImpl->log(spdlog::level::err, message);
}

void Logger::critical(const std::string& message) {
    pImpl->log(spdlog::level::critical, message);
}

void Logger::set_level(LogLevel level) {
    pImpl->set_level(level);
}

LogLevel Logger::level() const {
    return pImpl->level;
}

bool Logger::set_output_file(const std::string& filename) {
    std::string failure = pImpl->set_output_file(filename);
    if (!failure.empty()) {
        warning("Logging to console only, cannot open log file " + filename + ": " + failure);
        return false;
    }
    return true;
}

void Logger::set_console_interrupt(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->console_interrupt = std::move(hook);
}

void Logger::flush() {
    pImpl->logger->flush();
}

} // namespace keyprobe

#ifndef LANSHARE_BASE_LOGGER_H
#define LANSHARE_BASE_LOGGER_H

#include <elio/log/logger.hpp>
#include <fmt/format.h>
#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace lanshare {

// Alias for Elio's log level
using LogLevel = elio::log::level;

enum class LogOutput {
    Stdout,
    Stderr,
    File
};

LogLevel parse_log_level(const std::string& level);

class Logger {
public:
    ~Logger();

    static Logger& instance();

    // Level control
    void set_level(LogLevel level);
    LogLevel get_level() const;
    bool enabled(LogLevel level) const {
        return static_cast<int>(level) >= static_cast<int>(level_.load());
    }

    // Output configuration
    void set_output(LogOutput output);
    bool set_file_output(const std::string& path);
    void close_file_output();

    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(level)) return;
        if (output_.load() == LogOutput::File) {
            write_file(level, fmt::format(fmt_str, std::forward<Args>(args)...));
            return;
        }
        logger_.log(level, "", 0, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::debug, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::info, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::warning, fmt_str, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(elio::log::level::error, fmt_str, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write_file(LogLevel level, const std::string& message);

    elio::log::logger& logger_ = elio::log::logger::instance();
    std::atomic<LogLevel> level_{elio::log::level::info};
    std::atomic<LogOutput> output_{LogOutput::Stderr};
    std::mutex file_mutex_;
    std::unique_ptr<std::ofstream> file_stream_;
};

} // namespace lanshare

#endif // LANSHARE_BASE_LOGGER_H

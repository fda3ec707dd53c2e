#include "lanshare/base/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lanshare {

namespace {

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info: return "INFO";
        case LogLevel::warning: return "WARN";
        case LogLevel::error: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug" || level == "DEBUG") return elio::log::level::debug;
    if (level == "info" || level == "INFO") return elio::log::level::info;
    if (level == "warning" || level == "WARNING" || level == "warn") return elio::log::level::warning;
    if (level == "error" || level == "ERROR") return elio::log::level::error;
    return elio::log::level::info;
}

Logger::~Logger() {
    close_file_output();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_.load();
}

void Logger::set_output(LogOutput output) {
    // File output is only selected through set_file_output()
    if (output == LogOutput::File) return;
    output_ = output;
}

bool Logger::set_file_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_ = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        file_stream_.reset();
        return false;
    }
    output_ = LogOutput::File;
    return true;
}

void Logger::close_file_output() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();
    if (output_.load() == LogOutput::File) {
        output_ = LogOutput::Stderr;
    }
}

void Logger::write_file(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (!file_stream_ || !file_stream_->is_open()) {
        return;
    }
    *file_stream_ << "[" << get_timestamp() << "] [" << level_to_string(level) << "] "
                  << message << '\n';
    file_stream_->flush();
}

} // namespace lanshare

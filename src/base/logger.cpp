#include "bulkxfer/base/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace bulkxfer {

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

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug") return LogLevel::debug;
    if (level == "info") return LogLevel::info;
    if (level == "warning" || level == "warn") return LogLevel::warning;
    if (level == "error") return LogLevel::error;
    return LogLevel::info;
}

Logger::~Logger() {
    close_file_output();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

LogLevel Logger::get_level() const {
    return level_.load();
}

void Logger::set_output(LogOutput output) {
    output_.store(output);
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
    output_.store(LogOutput::File);
    return true;
}

void Logger::close_file_output() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
    file_stream_.reset();
    output_.store(LogOutput::Console);
}

void Logger::log(LogLevel level, const std::string& message) {
    log(level, "{}", message);
}

void Logger::write_file(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (!file_stream_ || !file_stream_->is_open()) {
        return;
    }
    *file_stream_ << "[" << get_timestamp() << "] [" << level_to_string(level) << "] "
                  << message << std::endl;
}

void Logger::debug(const std::string& message) {
    log(LogLevel::debug, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::info, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::warning, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::error, message);
}

} // namespace bulkxfer

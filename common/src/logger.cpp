#include "logger.hpp"
#include <fmt/chrono.h>
#include <iostream>
#include <ctime>

namespace mailhub {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(LogLevel level, bool console, const std::filesystem::path& file,
                  size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);

    level_ = level;
    console_ = console;
    max_file_size_ = max_file_size;
    max_files_ = max_files;

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    log_file_.clear();
    current_size_ = 0;

    if (file.empty()) {
        return;
    }

    std::error_code ec;
    if (auto parent = file.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    file_stream_.open(file, std::ios::app);
    if (!file_stream_.is_open()) {
        // Console output still works; report once there.
        std::cerr << "Cannot open log file " << file.string() << "\n";
        return;
    }

    log_file_ = file;
    auto size = std::filesystem::file_size(file, ec);
    current_size_ = ec ? 0 : static_cast<size_t>(size);
}

void Logger::trace(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Trace >= level_) {
        write(LogLevel::Trace, loc, std::string(msg));
    }
}

void Logger::debug(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Debug >= level_) {
        write(LogLevel::Debug, loc, std::string(msg));
    }
}

void Logger::info(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Info >= level_) {
        write(LogLevel::Info, loc, std::string(msg));
    }
}

void Logger::warning(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Warning >= level_) {
        write(LogLevel::Warning, loc, std::string(msg));
    }
}

void Logger::error(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Error >= level_) {
        write(LogLevel::Error, loc, std::string(msg));
    }
}

void Logger::fatal(std::string_view msg, const std::source_location& loc) {
    if (LogLevel::Fatal >= level_) {
        write(LogLevel::Fatal, loc, std::string(msg));
    }
}

void Logger::write(LogLevel level, const std::source_location& loc, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string filename = std::filesystem::path(loc.file_name()).filename().string();
    std::string formatted = fmt::format("[{}] [{}] [{}:{}] {}",
                                        get_timestamp(), level_to_string(level),
                                        filename, loc.line(), message);

    if (console_) {
        const char* color = "";
        const char* reset = "\033[0m";

        switch (level) {
            case LogLevel::Trace:   color = "\033[90m"; break;
            case LogLevel::Debug:   color = "\033[36m"; break;
            case LogLevel::Info:    color = "\033[32m"; break;
            case LogLevel::Warning: color = "\033[33m"; break;
            case LogLevel::Error:   color = "\033[31m"; break;
            case LogLevel::Fatal:   color = "\033[35m"; break;
        }

        std::cerr << color << formatted << reset << "\n";
    }

    if (file_stream_.is_open()) {
        rotate_if_needed();
        file_stream_ << formatted << "\n";
        file_stream_.flush();
        current_size_ += formatted.length() + 1;
    }
}

void Logger::rotate_if_needed() {
    if (current_size_ < max_file_size_ || max_files_ == 0) return;

    file_stream_.close();

    std::error_code ec;
    // Shift log.N -> log.N+1, dropping the oldest generation.
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::filesystem::path older = log_file_;
        older += "." + std::to_string(i);
        if (!std::filesystem::exists(older, ec)) continue;

        if (i + 1 >= max_files_) {
            std::filesystem::remove(older, ec);
        } else {
            std::filesystem::path newer = log_file_;
            newer += "." + std::to_string(i + 1);
            std::filesystem::rename(older, newer, ec);
        }
    }

    std::filesystem::path rotated = log_file_;
    rotated += ".1";
    std::filesystem::rename(log_file_, rotated, ec);

    file_stream_.open(log_file_, std::ios::app);
    current_size_ = 0;
}

std::string Logger::level_to_string(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", tm_now, ms.count());
}

}  // namespace mailhub

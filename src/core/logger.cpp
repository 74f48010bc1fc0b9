/**
 * @file logger.cpp
 * @brief Implementation of the themed Logger.
 */

#include "core/logger.hpp"
#include "core/escape_decoder.hpp"
#include "core/theme.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>

namespace tether::core {

    namespace {
        std::string timestamp_now() {
            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local{};
            localtime_r(&now, &local);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
            return buf;
        }

        const std::string& color_for(LogLevel level) {
            switch (level) {
                case LogLevel::Warning: return Theme::WARNING;
                case LogLevel::Error:   return Theme::ERROR;
                default:                return Theme::NOTICE;
            }
        }
    }

    LogLevel parse_log_level(std::string_view name) {
        std::string upper(name);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper == "DEBUG") return LogLevel::Debug;
        if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
        if (upper == "ERROR") return LogLevel::Error;
        return LogLevel::Info;
    }

    const char* to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARNING";
            case LogLevel::Error:   return "ERROR";
        }
        return "INFO";
    }

    Logger::Logger(std::string name, LogLevel level)
        : Logger(std::move(name), level, std::cerr) {}

    Logger::Logger(std::string name, LogLevel level, std::ostream& out)
        : name_(std::move(name)), level_(level), out_(&out) {}

    bool Logger::open_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void Logger::set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel Logger::level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void Logger::log(LogLevel level, std::string_view message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;

        *out_ << "[" << color_for(level) << "-" << Theme::RESET << "] "
              << name_ << ": " << message << "\n" << std::flush;

        if (file_.is_open()) {
            file_ << std::format("{} - {} - {} - {}\n", timestamp_now(), name_, to_string(level),
                                 strip_escapes(message))
                  << std::flush;
        }
    }

}

/**
 * @file logger.hpp
 * @brief Thread-safe named logger with themed console output and an optional file sink.
 *
 * Loggers are created by the application and injected into the components
 * that need them (ShellSession, OutputPump). There is no process-wide instance.
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace tether::core {

    enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

    /** @brief Parses "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" (any case). Unknown names map to Info. */
    LogLevel parse_log_level(std::string_view name);

    const char* to_string(LogLevel level);

    class Logger {
    public:
        /**
         * @param name  Component name printed with every line (e.g. "shell_session").
         * @param level Minimum level that is emitted.
         * @param out   Console stream. Defaults to std::cerr so stdout stays free for shell output.
         */
        explicit Logger(std::string name, LogLevel level = LogLevel::Info);
        Logger(std::string name, LogLevel level, std::ostream& out);

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief Appends every emitted line to a file, in plain text without colors.
         * @return false if the file could not be opened (console logging continues).
         */
        bool open_file(const std::filesystem::path& path);

        void set_level(LogLevel level);
        LogLevel level() const;
        const std::string& name() const { return name_; }

        void log(LogLevel level, std::string_view message);
        void debug(std::string_view message) { log(LogLevel::Debug, message); }
        void info(std::string_view message)  { log(LogLevel::Info, message); }
        void warn(std::string_view message)  { log(LogLevel::Warning, message); }
        void error(std::string_view message) { log(LogLevel::Error, message); }

    private:
        std::string name_;
        LogLevel level_;
        std::ostream* out_;
        std::ofstream file_;
        mutable std::mutex mutex_;
    };

}

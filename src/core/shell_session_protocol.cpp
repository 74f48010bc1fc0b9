/**
 * @file shell_session_protocol.cpp
 * @brief Command protocol of a ShellSession: input injection, scoped execution
 *        and working directory tracking.
 */

#include "core/shell_session.hpp"
#include "core/directory_probe.hpp"
#include <filesystem>
#include <format>
#include <thread>

namespace tether::core {

    // ==================================================================================
    // INPUT
    // ==================================================================================

    bool ShellSession::send_input(std::string_view text, bool append_newline) {
        if (!is_alive()) {
            fail(SessionError::NotRunning, "cannot send input: shell is not running");
            return false;
        }

        auto process = current_process();
        if (!process || !process->input_open()) {
            fail(SessionError::WriteFailed, "cannot send input: stdin is closed");
            return false;
        }

        std::string payload(text);
        if (append_newline) payload += '\n';

        if (!process->write_input(payload, std::chrono::milliseconds(config_.write_timeout_ms))) {
            fail(SessionError::WriteFailed, "write to shell stdin failed or timed out");
            // A broken pipe usually means the shell is gone; let the state catch up.
            is_alive();
            return false;
        }

        logger_->debug(std::format("sent {} bytes{}", payload.size(), append_newline ? " (executed)" : ""));
        return true;
    }

    std::string ShellSession::change_directory_directive(std::string_view path) {
        std::string out = "Set-Location \"";
        for (char c : path) {
            if (c == '`' || c == '"' || c == '$') out += '`';
            out += c;
        }
        out += '"';
        return out;
    }

    bool ShellSession::execute_command(const std::string& command,
                                       const std::optional<std::string>& working_dir,
                                       bool immediate) {
        std::string line = command;

        if (working_dir) {
            auto dir = resolve_directory(*working_dir);
            if (!dir) {
                fail(SessionError::PathInvalid,
                     std::format("cannot run command: directory '{}' does not exist", *working_dir));
                return false;
            }
            line = change_directory_directive(*dir) + "; " + command;
        }

        if (!send_input(line, immediate)) return false;

        logger_->info(std::format("command: {}", line));
        return true;
    }

    // ==================================================================================
    // DIRECTORY TRACKING
    // ==================================================================================

    bool ShellSession::change_directory(const std::string& path) {
        auto dir = resolve_directory(path);
        if (!dir) {
            fail(SessionError::PathInvalid, std::format("cannot change directory: '{}' does not exist", path));
            return false;
        }

        if (!send_input(change_directory_directive(*dir), true)) return false;

        set_working_directory(*dir);
        logger_->info(std::format("directory changed to {}", *dir));
        return true;
    }

    std::string ShellSession::get_current_directory() {
        return get_current_directory(std::chrono::milliseconds(config_.query_timeout_ms));
    }

    /**
     * @brief Round trip: discard stale output, ask, let the shell settle, collect, filter.
     *
     * Interleaving with other output is tolerated: whatever the drain window
     * captures is run through the directory probe and anything that is not a
     * path is ignored.
     */
    std::string ShellSession::get_current_directory(std::chrono::milliseconds query_timeout) {
        try {
            if (!is_alive()) return fallback_directory();

            // 1. Stale lines would otherwise be mistaken for the answer.
            pump_.drain(std::chrono::milliseconds(0));

            // 2. Ask
            if (!send_input(QUERY_DIRECTIVE, true)) return fallback_directory();

            // 3. Settle and collect
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.query_settle_ms));
            std::vector<OutputLine> lines = pump_.drain(query_timeout);

            // 4. Filter
            if (auto found = extract_directory(lines, config_.shell_prompts)) {
                std::string dir = normalize_directory(*found);
                set_working_directory(dir);
                logger_->debug(std::format("directory query answered: {}", dir));
                return dir;
            }

            fail(SessionError::DirectoryQueryInconclusive,
                 std::format("directory query inconclusive ({} lines captured)", lines.size()));
        } catch (const std::exception& e) {
            logger_->error(std::format("directory query failed: {}", e.what()));
        }
        return fallback_directory();
    }

    std::string ShellSession::working_directory() const {
        std::lock_guard<std::mutex> lock(directory_mutex_);
        return working_directory_;
    }

    void ShellSession::set_working_directory(std::string dir) {
        std::lock_guard<std::mutex> lock(directory_mutex_);
        working_directory_ = std::move(dir);
    }

    std::string ShellSession::fallback_directory() const {
        std::string known = working_directory();
        if (!known.empty()) return known;

        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        return ec ? std::string(".") : normalize_directory(cwd.string());
    }

    /**
     * @brief Absolute, normalized form of `path` if it names an existing directory.
     * Relative paths are taken relative to the best-known shell directory.
     */
    std::optional<std::string> ShellSession::resolve_directory(const std::string& path) const {
        namespace fs = std::filesystem;
        if (path.empty()) return std::nullopt;

        fs::path target(path);
        if (target.is_relative()) target = fs::path(fallback_directory()) / target;

        std::error_code ec;
        target = fs::absolute(target, ec);
        if (ec || !fs::is_directory(target, ec)) return std::nullopt;

        return normalize_directory(target.string());
    }

}

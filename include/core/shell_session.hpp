/**
 * @file shell_session.hpp
 * @brief Controller for one long-lived interactive shell child process.
 *
 * Lifecycle (start / is_alive / stop) lives in shell_session.cpp, the
 * command protocol (input injection, directory tracking) in
 * shell_session_protocol.cpp.
 */

#pragma once
#include "core/child_process.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/output_pump.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::core {

    enum class RunState { Stopped, Running };

    enum class SessionError {
        None,
        LaunchFailed,               ///< Executable missing or could not be spawned.
        AlreadyRunning,             ///< start() while a process is alive.
        NotRunning,                 ///< Input or navigation without a live process.
        PathInvalid,                ///< Target directory of cd / scoped execution does not exist.
        WorkingDirectoryInvalid,    ///< Configured launch directory does not exist.
        WriteFailed,                ///< stdin pipe closed, broken or stalled.
        DirectoryQueryInconclusive  ///< No acceptable reply; last known directory returned.
    };

    const char* to_string(SessionError error);

    class ShellSession {
    public:
        // --- Protocol directives ---
        static constexpr std::string_view EXIT_DIRECTIVE = "exit";
        static constexpr std::string_view QUERY_DIRECTIVE = "(Get-Location).Path";

        ShellSession(Config config, std::shared_ptr<Logger> logger);
        ~ShellSession();

        ShellSession(const ShellSession&) = delete;
        ShellSession& operator=(const ShellSession&) = delete;

        // ==================================================================================
        // LIFECYCLE
        // ==================================================================================

        /** @brief Spawns the shell and its reader loops. False if already alive or the launch fails. */
        bool start();

        /** @brief Runs start() on a background task. */
        std::future<bool> start_async();

        /** @brief Running and the process has not exited. Never blocks on I/O. */
        bool is_alive();

        /**
         * @brief Graduated, bounded teardown: `exit`, wait, SIGTERM, wait, SIGKILL.
         * Idempotent. Always returns true; the observable result is "not running".
         */
        bool stop();

        RunState state() const { return state_.load(); }
        pid_t pid() const;

        // ==================================================================================
        // OUTPUT
        // ==================================================================================

        OutputPump::SubscriberId register_subscriber(OutputPump::Subscriber subscriber);
        bool unregister_subscriber(OutputPump::SubscriberId id);

        /** @brief Best-effort pull of queued output (see OutputPump::drain). */
        std::vector<OutputLine> drain(std::chrono::milliseconds timeout);

        // ==================================================================================
        // COMMAND PROTOCOL
        // ==================================================================================

        /**
         * @brief Writes text to the shell's stdin. Nothing is executed unless
         * `append_newline` is set, so callers can stage input before committing it.
         */
        bool send_input(std::string_view text, bool append_newline = false);

        /**
         * @brief Sends a command, optionally scoped to `working_dir` for this one line.
         * The session's tracked directory is not changed by a scoped execution.
         */
        bool execute_command(const std::string& command,
                             const std::optional<std::string>& working_dir = std::nullopt,
                             bool immediate = true);

        /** @brief `Set-Location` to an existing directory and record it as the current one. */
        bool change_directory(const std::string& path);

        /**
         * @brief Asks the shell where it is. Falls back to the last known directory
         * when the shell is not alive or the reply cannot be recognized.
         */
        std::string get_current_directory();
        std::string get_current_directory(std::chrono::milliseconds query_timeout);

        /** @brief Last known directory without any I/O. */
        std::string working_directory() const;

        SessionError last_error() const { return last_error_.load(); }
        const Config& config() const { return config_; }

        /** @brief `Set-Location "<path>"` with PowerShell double-quote escaping. */
        static std::string change_directory_directive(std::string_view path);

    private:
        void fail(SessionError error, std::string_view message);
        void set_working_directory(std::string dir);
        std::string fallback_directory() const;
        std::optional<std::string> resolve_directory(const std::string& path) const;
        std::shared_ptr<ChildProcess> current_process() const;

        /** @brief Tears down a handle whose process already exited on its own. */
        void reclaim_exited_locked();
        void teardown(ChildProcess& process);

        Config config_;
        std::shared_ptr<Logger> logger_;

        // Single writer (start/stop); readers copy the pointer under the lock
        // (is_alive, send_input) so a bounded write never holds it.
        std::mutex lifecycle_mutex_;
        mutable std::mutex process_mutex_;
        std::shared_ptr<ChildProcess> process_;
        std::atomic<RunState> state_{RunState::Stopped};

        OutputPump pump_;

        mutable std::mutex directory_mutex_;
        std::string working_directory_;

        std::atomic<SessionError> last_error_{SessionError::None};
    };

}

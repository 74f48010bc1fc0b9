/**
 * @file shell_session.cpp
 * @brief Process lifecycle of a ShellSession.
 *
 * This file contains:
 * 1. Launching the shell with three pipes and starting the output reader loops.
 * 2. Lazy liveness detection (a child that exits on its own is noticed on the next probe).
 * 3. Graduated, bounded teardown: exit directive, SIGTERM, SIGKILL.
 */

#include "core/shell_session.hpp"
#include "core/directory_probe.hpp"
#include <csignal>
#include <filesystem>
#include <format>

namespace tether::core {

    namespace {
        constexpr auto EXIT_WRITE_TIMEOUT = std::chrono::milliseconds(200);
        constexpr const char* DEFAULT_SHELLS[] = {"pwsh", "powershell"};
    }

    const char* to_string(SessionError error) {
        switch (error) {
            case SessionError::None:                       return "None";
            case SessionError::LaunchFailed:               return "LaunchFailed";
            case SessionError::AlreadyRunning:             return "AlreadyRunning";
            case SessionError::NotRunning:                 return "NotRunning";
            case SessionError::PathInvalid:                return "PathInvalid";
            case SessionError::WorkingDirectoryInvalid:    return "WorkingDirectoryInvalid";
            case SessionError::WriteFailed:                return "WriteFailed";
            case SessionError::DirectoryQueryInconclusive: return "DirectoryQueryInconclusive";
        }
        return "Unknown";
    }

    ShellSession::ShellSession(Config config, std::shared_ptr<Logger> logger)
        : config_(std::move(config)),
          logger_(logger ? std::move(logger) : std::make_shared<Logger>("shell_session")),
          pump_(logger_, config_.max_queued_lines) {
        if (!config_.working_directory.empty()) {
            std::error_code ec;
            auto abs = std::filesystem::absolute(config_.working_directory, ec);
            working_directory_ = normalize_directory(ec ? config_.working_directory : abs.string());
        }
    }

    // Never leave a shell behind when the controller goes away.
    ShellSession::~ShellSession() { stop(); }

    void ShellSession::fail(SessionError error, std::string_view message) {
        last_error_ = error;
        switch (error) {
            case SessionError::LaunchFailed:
            case SessionError::WorkingDirectoryInvalid:
            case SessionError::WriteFailed:
                logger_->error(message);
                break;
            case SessionError::DirectoryQueryInconclusive:
                logger_->debug(message);
                break;
            default:
                logger_->warn(message);
                break;
        }
    }

    std::shared_ptr<ChildProcess> ShellSession::current_process() const {
        std::lock_guard<std::mutex> lock(process_mutex_);
        return process_;
    }

    pid_t ShellSession::pid() const {
        auto process = current_process();
        return process ? process->pid() : -1;
    }

    // ==================================================================================
    // START
    // ==================================================================================

    bool ShellSession::start() {
        namespace fs = std::filesystem;
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);

        if (is_alive()) {
            fail(SessionError::AlreadyRunning, "shell is already running");
            return false;
        }

        // A previous shell may have exited by itself; its pump and handle are still around.
        reclaim_exited_locked();

        // 1. Working directory
        fs::path cwd;
        if (!config_.working_directory.empty()) {
            std::error_code ec;
            if (!fs::is_directory(config_.working_directory, ec)) {
                fail(SessionError::WorkingDirectoryInvalid,
                     std::format("working directory '{}' does not exist", config_.working_directory));
                return false;
            }
            cwd = config_.working_directory;
        }

        // 2. Shell executable
        std::optional<fs::path> exe;
        if (!config_.shell_path.empty()) {
            exe = find_executable(config_.shell_path);
        } else {
            for (const char* name : DEFAULT_SHELLS) {
                if ((exe = find_executable(name))) break;
            }
        }
        if (!exe) {
            fail(SessionError::LaunchFailed,
                 std::format("shell executable '{}' not found",
                             config_.shell_path.empty() ? "pwsh" : config_.shell_path));
            return false;
        }

        // 3. Spawn
        std::string error;
        std::shared_ptr<ChildProcess> child = ChildProcess::spawn({*exe, config_.shell_args, cwd}, error);
        if (!child) {
            fail(SessionError::LaunchFailed, error);
            return false;
        }

        UniqueFd out = child->take_stdout();
        UniqueFd err = child->take_stderr();
        {
            std::lock_guard<std::mutex> plock(process_mutex_);
            process_ = child;
        }
        state_ = RunState::Running;

        if (!config_.working_directory.empty()) {
            set_working_directory(normalize_directory(fs::absolute(cwd).string()));
        }

        // 4. Reader loops
        pump_.start(std::move(out), std::move(err));

        last_error_ = SessionError::None;
        logger_->info(std::format("shell started: {} (pid {})", exe->string(), child->pid()));
        return true;
    }

    std::future<bool> ShellSession::start_async() {
        return std::async(std::launch::async, [this] { return start(); });
    }

    // ==================================================================================
    // LIVENESS
    // ==================================================================================

    bool ShellSession::is_alive() {
        if (state_ != RunState::Running) return false;

        auto process = current_process();
        if (!process) return false;

        if (process->has_exited()) {
            RunState expected = RunState::Running;
            if (state_.compare_exchange_strong(expected, RunState::Stopped)) {
                auto status = process->exit_status();
                logger_->warn(std::format("shell (pid {}) exited on its own (status {})",
                                          process->pid(), status ? *status : -1));
            }
            return false;
        }
        return true;
    }

    void ShellSession::reclaim_exited_locked() {
        std::shared_ptr<ChildProcess> old;
        {
            std::lock_guard<std::mutex> plock(process_mutex_);
            old = std::move(process_);
        }
        pump_.request_stop();
        pump_.join(std::chrono::milliseconds(config_.reader_join_ms));
        if (old) old->close_input();
    }

    // ==================================================================================
    // STOP
    // ==================================================================================

    bool ShellSession::stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);

        // Readers observe the flags at their next poll tick and wind down on their own.
        state_ = RunState::Stopped;
        pump_.request_stop();

        std::shared_ptr<ChildProcess> process;
        {
            std::lock_guard<std::mutex> plock(process_mutex_);
            process = std::move(process_);
        }

        if (process) {
            try {
                teardown(*process);
            } catch (const std::exception& e) {
                logger_->error(std::format("error while stopping shell: {}", e.what()));
            }
        }

        if (!pump_.join(std::chrono::milliseconds(config_.reader_join_ms))) {
            logger_->warn("output readers were detached");
        }

        if (process) logger_->info(std::format("shell (pid {}) stopped", process->pid()));
        return true;
    }

    /**
     * @brief Escalates until the child is gone: exit directive, SIGTERM, SIGKILL.
     * Each step is bounded by its own grace period from the config.
     */
    void ShellSession::teardown(ChildProcess& process) {
        if (!process.has_exited()) {
            // 1. Ask politely
            std::string directive = std::string(EXIT_DIRECTIVE) + "\n";
            if (!process.write_input(directive, EXIT_WRITE_TIMEOUT)) {
                logger_->debug("could not deliver exit directive");
            }

            // 2. Natural exit
            if (!process.wait_for(std::chrono::milliseconds(config_.exit_grace_ms))) {
                logger_->warn(std::format("shell (pid {}) ignored exit, sending SIGTERM", process.pid()));

                // 3. Graceful terminate
                process.send_signal(SIGTERM);
                if (!process.wait_for(std::chrono::milliseconds(config_.terminate_grace_ms))) {
                    logger_->warn(std::format("shell (pid {}) ignored SIGTERM, sending SIGKILL", process.pid()));

                    // 4. Force
                    process.send_signal(SIGKILL);
                    if (!process.wait_for(std::chrono::milliseconds(config_.kill_grace_ms))) {
                        logger_->error(std::format("shell (pid {}) could not be reaped", process.pid()));
                    }
                }
            }
        }
        process.close_input();
    }

    // ==================================================================================
    // OUTPUT
    // ==================================================================================

    OutputPump::SubscriberId ShellSession::register_subscriber(OutputPump::Subscriber subscriber) {
        return pump_.register_subscriber(std::move(subscriber));
    }

    bool ShellSession::unregister_subscriber(OutputPump::SubscriberId id) {
        return pump_.unregister_subscriber(id);
    }

    std::vector<OutputLine> ShellSession::drain(std::chrono::milliseconds timeout) {
        return pump_.drain(timeout);
    }

}

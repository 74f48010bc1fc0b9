/**
 * @file child_process.hpp
 * @brief A spawned child process wired to three pipes (stdin, stdout, stderr).
 *
 * Owns the pid and the parent-side pipe ends. The read ends can be handed
 * over to an OutputPump; the write end stays here for input injection.
 */

#pragma once
#include "core/unique_fd.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace tether::core {

    struct LaunchSpec {
        std::filesystem::path executable;       ///< Absolute path, already resolved.
        std::vector<std::string> arguments;     ///< argv[1..]
        std::filesystem::path working_directory; ///< Empty = inherit.
    };

    /**
     * @brief Resolves a program name against PATH (or validates an explicit path).
     * @return The executable path, or std::nullopt if nothing executable was found.
     */
    std::optional<std::filesystem::path> find_executable(const std::string& program);

    class ChildProcess {
        struct SpawnKey {
            explicit SpawnKey() = default;
        };

    public:
        /** @brief Only reachable through spawn(). */
        explicit ChildProcess(SpawnKey) {}

        /**
         * @brief Forks and execs the program described by `spec`.
         *
         * Exec failures in the child are reported back over a close-on-exec pipe,
         * so a missing or non-executable binary fails here rather than as an
         * early exit later.
         *
         * @param spec  What to run and where.
         * @param error Receives a human readable reason on failure.
         * @return The running child, or nullptr.
         */
        static std::unique_ptr<ChildProcess> spawn(const LaunchSpec& spec, std::string& error);

        ~ChildProcess();

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

        pid_t pid() const { return pid_; }

        /** @brief Non-blocking liveness probe. Reaps the child once it has exited. */
        bool has_exited();

        /** @brief Exit status as reported by waitpid, once the child has been reaped. */
        std::optional<int> exit_status();

        /** @brief Polls for exit until `timeout` elapses. */
        bool wait_for(std::chrono::milliseconds timeout);

        /** @brief Sends a signal; returns false if the child is gone or kill() failed. */
        bool send_signal(int signal);

        /**
         * @brief Writes all of `data` to the child's stdin.
         * Gives up (returns false) if the pipe is closed/broken or the child does not
         * drain it within `timeout`.
         */
        bool write_input(std::string_view data, std::chrono::milliseconds timeout);

        bool input_open() const;
        void close_input();

        UniqueFd take_stdout() { return std::move(stdout_); }
        UniqueFd take_stderr() { return std::move(stderr_); }

    private:
        bool has_exited_locked();

        pid_t pid_ = -1;
        bool reaped_ = false;
        int status_ = 0;
        mutable std::mutex state_mutex_;

        UniqueFd stdin_;
        UniqueFd stdout_;
        UniqueFd stderr_;
        mutable std::mutex input_mutex_;
    };

}

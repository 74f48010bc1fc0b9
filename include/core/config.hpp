/**
 * @file config.hpp
 * @brief Runtime configuration of a shell session.
 *
 * Populated from config.py by ConfigLoader, then handed to ShellSession by
 * value. The session never reads configuration from anywhere else.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace tether::core {

    struct Config {
        // --- Launch ---
        std::string working_directory;          ///< Empty = inherit the controller's cwd.
        std::string shell_path;                 ///< Empty = search PATH for pwsh, then powershell.
        std::vector<std::string> shell_args = {"-NoLogo", "-NoExit", "-Command", "-"};

        // --- Graduated shutdown (milliseconds) ---
        int exit_grace_ms = 2000;      ///< After writing `exit`.
        int terminate_grace_ms = 1000; ///< After SIGTERM.
        int kill_grace_ms = 1000;      ///< After SIGKILL, waiting to reap.
        int reader_join_ms = 500;      ///< Joining the reader loops.

        // --- Directory query ---
        int query_settle_ms = 300;
        int query_timeout_ms = 1500;

        // --- I/O ---
        int write_timeout_ms = 2000;
        size_t max_queued_lines = 10000;

        /// Prompt suffixes treated as noise when scraping output (in addition to `PS ...>`).
        std::vector<std::string> shell_prompts = {">"};

        // --- Logging ---
        std::string log_level = "INFO";
        std::string log_file;          ///< Empty = console only. Relative paths resolve against the config directory.
    };

}

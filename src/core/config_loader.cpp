/**
 * @file config_loader.cpp
 * @brief Implementation of the ConfigLoader with DRY property loading.
 */

#include "core/config_loader.hpp"
#include "core/config.hpp"
#include "core/theme.hpp"
#include <pybind11/embed.h>
#include <pybind11/stl.h> // For casting vector/map
#include <iostream>
#include <filesystem>
#include <optional>

namespace py = pybind11;

namespace tether::core {

    namespace {
        // --- DRY Helper Templates ---

        void warn(const std::string& msg) {
            std::cerr << "[" << Theme::WARNING << "WARN" << Theme::RESET << "] " << msg << "\n";
        }

        /**
         * @brief Safely loads a simple property (int, bool, string, list) from a python module.
         */
        template <typename T>
        void load_prop(const py::module_& m, const char* name, T& target) {
            if (py::hasattr(m, name)) {
                try {
                    target = m.attr(name).cast<T>();
                } catch (const std::exception& e) {
                    warn(std::string("Config Type Mismatch for '") + name + "': " + e.what());
                }
            }
        }

        /**
         * @brief Loads a dictionary item into a specific target reference.
         */
        template <typename T>
        void load_dict_item(const py::dict& d, const char* key, T& target) {
            if (d.contains(key)) {
                try {
                    target = d[key].cast<T>();
                } catch (const std::exception& e) {
                    warn(std::string("Config Type Mismatch for key '") + key + "': " + e.what());
                }
            }
        }

        /** @brief Fetches a module-level dict, or nothing if absent / not a dict. */
        std::optional<py::dict> load_dict(const py::module_& m, const char* name) {
            if (!py::hasattr(m, name)) return std::nullopt;
            py::object obj = m.attr(name);
            if (!py::isinstance<py::dict>(obj)) {
                warn(std::string("Config '") + name + "' is not a dict, ignored");
                return std::nullopt;
            }
            return obj.cast<py::dict>();
        }
    }

    bool ConfigLoader::load(Config& config, const std::string& path) {
        namespace fs = std::filesystem;
        fs::path p(path);

        if (!fs::exists(p / "config.py")) {
            std::cout << "[" << Theme::ERROR << "-" << Theme::RESET
                      << "] No config.py found in '" << path << "'. Using defaults.\n";
            return false;
        }

        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("insert")(0, fs::absolute(p).string());

            // Drop a previously imported config (another directory, or an edited file).
            py::dict modules = sys.attr("modules").cast<py::dict>();
            if (modules.contains("config")) modules.attr("pop")("config");

            py::module_ conf_module = py::module_::import("config");

            // 1. Launch
            load_prop(conf_module, "WORKING_DIRECTORY", config.working_directory);
            load_prop(conf_module, "SHELL_PATH", config.shell_path);
            load_prop(conf_module, "SHELL_ARGS", config.shell_args);

            // 2. Shutdown timings
            if (auto timeouts = load_dict(conf_module, "STOP_TIMEOUTS")) {
                load_dict_item(*timeouts, "exit", config.exit_grace_ms);
                load_dict_item(*timeouts, "terminate", config.terminate_grace_ms);
                load_dict_item(*timeouts, "kill", config.kill_grace_ms);
                load_dict_item(*timeouts, "join", config.reader_join_ms);
            }

            // 3. Directory query
            if (auto query = load_dict(conf_module, "DIRECTORY_QUERY")) {
                load_dict_item(*query, "settle", config.query_settle_ms);
                load_dict_item(*query, "timeout", config.query_timeout_ms);
            }

            // 4. I/O
            load_prop(conf_module, "WRITE_TIMEOUT_MS", config.write_timeout_ms);
            load_prop(conf_module, "MAX_QUEUED_LINES", config.max_queued_lines);
            load_prop(conf_module, "SHELL_PROMPTS", config.shell_prompts);

            // 5. Logging
            if (auto log = load_dict(conf_module, "LOG")) {
                load_dict_item(*log, "level", config.log_level);
                load_dict_item(*log, "file", config.log_file);
                if (!config.log_file.empty() && fs::path(config.log_file).is_relative()) {
                    config.log_file = (fs::absolute(p) / config.log_file).string();
                }
            }

            // 6. Theme
            if (auto theme = load_dict(conf_module, "THEME")) {
                load_dict_item(*theme, "RESET", Theme::RESET);
                load_dict_item(*theme, "SUCCESS", Theme::SUCCESS);
                load_dict_item(*theme, "WARNING", Theme::WARNING);
                load_dict_item(*theme, "ERROR", Theme::ERROR);
                load_dict_item(*theme, "NOTICE", Theme::NOTICE);
                load_dict_item(*theme, "PROMPT", Theme::PROMPT);
                load_dict_item(*theme, "STDERR", Theme::STDERR);
            }

            std::cout << "[" << Theme::NOTICE << "-" << Theme::RESET
                      << "] Config loaded successfully.\n";
            return true;

        } catch (const std::exception& e) {
            std::cout << "[" << Theme::ERROR << "-" << Theme::RESET
                      << "] Error reading config.py (" << e.what() << "). Using defaults.\n";
            return false;
        }
    }

} // namespace tether::core

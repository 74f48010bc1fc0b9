/**
 * @file plugin_host.hpp
 * @brief Loads Python extensions and dispatches session events to them.
 *
 * Extensions are plain `.py` modules. Any of these functions, if defined,
 * is called with string arguments:
 *   on_output(stream, text)   - every line the shell prints
 *   on_command(command)       - every command the user executes
 *   on_directory(path)        - whenever the tracked directory changes
 *
 * Extensions can talk back through the embedded `tether` module
 * (`tether.log(msg)`).
 */

#pragma once
#include "core/logger.hpp"
#include <memory>
#include <pybind11/embed.h>
#include <string>
#include <vector>

namespace py = pybind11;

namespace tether::core {

    class PluginHost {
    public:
        /** @brief Requires a live interpreter (py::scoped_interpreter owned by the caller). */
        explicit PluginHost(std::shared_ptr<Logger> logger);

        /**
         * @brief Scans a directory for Python scripts and imports them as modules.
         * Skips `__init__` and `config`. Returns the number of modules loaded.
         */
        size_t load_extensions(const std::string& path);

        /**
         * @brief Calls `hook_name(args...)` in every loaded plugin that defines it.
         * Safe to call from any thread: the GIL is acquired for the duration of the dispatch.
         * Exceptions raised by a plugin are logged and do not stop the others.
         */
        void trigger(const std::string& hook_name, const std::vector<std::string>& args);

        size_t plugin_count() const { return plugins_.size(); }

        /** @brief Releases the modules while the GIL is held. Must run before the interpreter goes away. */
        void clear();

    private:
        std::shared_ptr<Logger> logger_;
        std::vector<py::module_> plugins_;
    };

}

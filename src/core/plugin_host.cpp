/**
 * @file plugin_host.cpp
 * @brief Python extension loading and hook dispatch.
 */

#include "core/plugin_host.hpp"
#include "core/theme.hpp"
#include <filesystem>
#include <format>
#include <iostream>

// ==================================================================================
// EMBEDDED MODULE DEFINITION
// ==================================================================================
/**
 * @brief Defines the 'tether' Python module available to scripts.
 * Allows Python extensions to communicate back to the C++ core.
 */
PYBIND11_EMBEDDED_MODULE(tether, m) {
    m.def("log", [](std::string msg) {
        std::cout << "["
                  << tether::core::Theme::SUCCESS << "-"
                  << tether::core::Theme::RESET << "] "
                  << msg << "\n" << std::flush;
    });
}

namespace tether::core {

    PluginHost::PluginHost(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

    size_t PluginHost::load_extensions(const std::string& path) {
        namespace fs = std::filesystem;
        fs::path p(path);

        // Validation
        std::error_code ec;
        if (path.empty() || !fs::is_directory(p, ec)) {
            logger_->warn(std::format("plugin path '{}' invalid, skipping Python extensions", path));
            return 0;
        }

        py::gil_scoped_acquire gil;
        size_t loaded = 0;
        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("append")(fs::absolute(p).string());

            for (const auto& entry : fs::directory_iterator(p)) {
                if (entry.path().extension() != ".py") continue;

                std::string module_name = entry.path().stem().string();
                if (module_name == "__init__" || module_name == "config") continue;

                // One broken script must not keep the others from loading.
                try {
                    plugins_.push_back(py::module_::import(module_name.c_str()));
                    ++loaded;
                    std::cout << "[" << Theme::NOTICE << "-" << Theme::RESET
                              << "] Loaded .py extension: " << module_name << "\n";
                } catch (const std::exception& e) {
                    logger_->error(std::format("failed to load extension '{}': {}", module_name, e.what()));
                }
            }
        } catch (const std::exception& e) {
            logger_->error(std::format("failed to load extensions: {}", e.what()));
        }
        return loaded;
    }

    void PluginHost::trigger(const std::string& hook_name, const std::vector<std::string>& args) {
        if (plugins_.empty()) return;

        py::gil_scoped_acquire gil;
        py::tuple py_args(args.size());
        for (size_t i = 0; i < args.size(); ++i) py_args[i] = py::str(args[i]);

        for (auto& plugin : plugins_) {
            try {
                if (!py::hasattr(plugin, hook_name.c_str())) continue;
                plugin.attr(hook_name.c_str())(*py_args);
            } catch (const std::exception& e) {
                logger_->error(std::format("error in plugin hook {}: {}", hook_name, e.what()));
            }
        }
    }

    void PluginHost::clear() {
        py::gil_scoped_acquire gil;
        plugins_.clear();
    }

}

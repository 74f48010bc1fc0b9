/**
 * @file config_loader.hpp
 * @brief Definition of the ConfigLoader class.
 *
 * Provides a static mechanism to load user configuration from a standard
 * Python file (`config.py`). Settings stay scriptable (computed paths,
 * environment lookups) without a configuration parser in C++.
 */

#pragma once
#include <string>

namespace tether::core {
    struct Config;

    /**
     * @class ConfigLoader
     * @brief Static helper to bridge C++ configuration with Python scripts.
     */
    class ConfigLoader {
    public:
        /**
         * @brief Loads runtime configuration from a config.py file into the Config struct.
         *
         * Requires a live embedded interpreter (py::scoped_interpreter owned by the caller).
         * Adds the target directory to sys.path, imports the `config` module and
         * reflects its variables into the C++ Config struct and the Theme.
         * Missing variables keep their defaults; a type mismatch warns and keeps the default.
         *
         * @param config The configuration object to populate.
         * @param path Directory containing config.py.
         * @return false if no config.py could be imported (all defaults kept).
         */
        static bool load(Config& config, const std::string& path);
    };
}

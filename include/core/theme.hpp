/**
 * @file theme.hpp
 * @brief Console color theme shared by the logger and the terminal front end.
 *
 * Values are raw ANSI sequences. They can be overridden from the THEME
 * dictionary in config.py (see ConfigLoader).
 */

#pragma once
#include <string>

namespace tether::core {

    struct Theme {
        static inline std::string RESET   = "\x1b[0m";
        static inline std::string SUCCESS = "\x1b[92m";  // Bright Green
        static inline std::string WARNING = "\x1b[93m";  // Bright Yellow
        static inline std::string ERROR   = "\x1b[91m";  // Bright Red
        static inline std::string NOTICE  = "\x1b[94m";  // Bright Blue
        static inline std::string PROMPT  = "\x1b[96m";  // Bright Cyan
        static inline std::string STDERR  = "\x1b[31m";  // Red
    };

}

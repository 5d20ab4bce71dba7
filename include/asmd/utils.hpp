/**
 * @file utils.hpp
 * @brief Path helpers shared by the config store and the loggers
 *
 * - Expanding tilde (~) to the user's home directory
 * - Locating the AsDaemon state directory (~/.audioshare)
 * - Locating the XDG config directory
 */

#pragma once

#include <string>
#include <filesystem>
#include <cstdlib>
#include <iostream>

namespace asmd {

    /**
     * @brief Expands a leading tilde (~) to the user's home directory
     *
     * Examples:
     *   "~/.audioshare"  → "/home/username/.audioshare"
     *   "/absolute/path" → "/absolute/path" (unchanged)
     *
     * @note If HOME is not set, returns the original path
     */
    inline std::filesystem::path expand_tilde(const std::string& path) {
        if (path.empty() || path[0] != '~') {
            return path;
        }

        const char* home = std::getenv("HOME");
        if (!home) {
            std::cerr << "HOME environment variable not set" << std::endl;
            return path;
        }

        // Skip "~/" to avoid treating the rest as an absolute path
        std::string rest = path.substr(1);
        if (!rest.empty() && rest[0] == '/') {
            rest = rest.substr(1);
        }

        return std::filesystem::path(home) / rest;
    }

    /**
     * @brief Gets the AsDaemon state directory
     *
     * Returns ~/.audioshare, used for the audit log and worker session logs.
     */
    inline std::filesystem::path get_state_dir() {
        return expand_tilde("~/.audioshare");
    }

    /**
     * @brief Gets the configuration directory
     *
     * $XDG_CONFIG_HOME/audioshare if set, otherwise ~/.config/audioshare
     */
    inline std::filesystem::path get_config_dir() {
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg && *xdg) {
            return std::filesystem::path(xdg) / "audioshare";
        }
        return expand_tilde("~/.config/audioshare");
    }

} // namespace asmd

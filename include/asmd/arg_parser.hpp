/**
 * @file arg_parser.hpp
 * @brief Command-line argument parser for AsDaemon
 *
 * Run modes:
 * - (default): run the supervisor daemon with its localhost control port
 * - --probe:   run one firewall probe on the configured address and exit
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace asmd {

    /**
     * @brief Run modes for AsDaemon
     */
    enum class RunMode {
        DAEMON,  // Supervise the audio server, serve control commands
        PROBE    // One-shot firewall probe
    };

    /**
     * @brief Parsed command-line arguments
     */
    struct ParsedArgs {
        RunMode mode = RunMode::DAEMON;
        std::string config_path;                       // Empty: default location
        std::string worker_binary = "/app/bin/as-cmd";
        uint16_t control_port = 23889;
        bool firewall_check = true;
        bool show_help = false;
        bool show_version = false;
        std::vector<std::string> errors;               // Unusable options, reported by main
    };

    /**
     * @brief Command-line argument parser
     *
     * Supports:
     *   -c, --config <path>    Config file
     *   -w, --worker <path>    as-cmd binary
     *   -p, --port <port>      Control port (default: 23889)
     *   --no-firewall-check    Skip firewall rule inspection before start
     *   --probe                Run the firewall probe and exit
     *   -h, --help             Show help
     *   -v, --version          Show version
     */
    class ArgParser {
    public:
        static ParsedArgs parse(int argc, char* argv[]);

        static std::string get_help_message();

        static std::string get_version_string();
    };

} // namespace asmd

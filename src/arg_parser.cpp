//
// Created by opencode on 14/09/2026.
//

#include "asmd/arg_parser.hpp"
#include <stdexcept>

namespace asmd {

    ParsedArgs ArgParser::parse(int argc, char* argv[]) {
        ParsedArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto take_value = [&](std::string& out) {
                if (i + 1 < argc) {
                    out = argv[++i];
                    return true;
                }
                args.errors.push_back("Missing value for " + arg);
                return false;
            };

            if (arg == "--help" || arg == "-h") {
                args.show_help = true;
            } else if (arg == "--version" || arg == "-v") {
                args.show_version = true;
            } else if (arg == "--config" || arg == "-c") {
                take_value(args.config_path);
            } else if (arg == "--worker" || arg == "-w") {
                take_value(args.worker_binary);
            } else if (arg == "--port" || arg == "-p") {
                std::string value;
                if (take_value(value)) {
                    try {
                        int port = std::stoi(value);
                        if (port <= 0 || port > 65535) {
                            throw std::out_of_range(value);
                        }
                        args.control_port = static_cast<uint16_t>(port);
                    } catch (const std::exception&) {
                        args.errors.push_back("Invalid port number: " + value);
                    }
                }
            } else if (arg == "--no-firewall-check") {
                args.firewall_check = false;
            } else if (arg == "--probe") {
                args.mode = RunMode::PROBE;
            } else {
                args.errors.push_back("Unknown option: " + arg);
            }
        }

        return args;
    }

    std::string ArgParser::get_help_message() {
        return R"(AudioShare Daemon (AsDaemon)

Usage: asdaemon [OPTIONS]

Options:
  -c, --config <path>    Config file (default: ~/.config/audioshare/config.json)
  -w, --worker <path>    as-cmd binary (default: /app/bin/as-cmd)
  -p, --port <port>      Control port on 127.0.0.1 (default: 23889)
  --no-firewall-check    Do not inspect firewalld/ufw rules before starting
  --probe                Test inbound reachability of the configured address and exit
  -h, --help             Show this help message
  -v, --version          Show version information

Control commands (CMD:ARGS\n on the control port):
  start:[ip,port,endpoint,encoding]   Start the audio server
  stop:                               Stop the audio server
  reset:                              Reset the server and reload the selection
  reset-server:                       Reset the running server without saving parameters
  select:endpoint,encoding            Change the audio endpoint/encoding
  probe:[ip,port]                     Run the firewall probe
  probe-stop:                         Cancel a running firewall probe
  state:                              Show state
  whoami:                             Show version
  logs:[n]                            Show last n lines of the audit log (default: 50)

Examples:
  asdaemon                        # Run the daemon
  asdaemon --probe                # Check that the phone can reach this host
  asdaemon -w ./as-cmd -p 24000   # Custom worker and control port
)";
    }

    std::string ArgParser::get_version_string() {
        return std::string("AsDaemon version ") + ASMD_VERSION + " (C++)";
    }

} // namespace asmd

/**
 * @file command_handler.hpp
 * @brief Handles control-surface commands for the AudioShare daemon
 *
 * Commands:
 *
 * 1. start:[ip,port,endpoint,encoding] - Start the server (config values if no args)
 * 2. stop:                             - Stop the server (clean operator stop)
 * 3. reset:                            - Reset the server, reload selection from config
 * 4. select:endpoint,encoding          - Change the audio selection (restarts if running)
 * 5. reset-server:                     - Reset the running server without saving parameters
 * 6. probe:[ip,port]                   - Run the firewall probe
 * 7. probe-stop:                       - Cancel a running probe, no result is reported
 * 8. state:                            - Controller/server/probe state
 * 9. whoami:                           - Daemon version
 * 10. logs:[n]                         - Last n audit log lines (default 50)
 *
 * Protocol format:
 *   Request:  CMD:ARG1,ARG2,ARG3...\n
 *   Response: {"CMD": "cmd", "result": {...}, "error": null}\n
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace asmd {

    class LifecycleController;
    class AuditLogger;
    enum class ControllerError;

    /**
     * @brief A request split into command name and comma separated arguments
     */
    struct ParsedCommand {
        std::string name;
        std::vector<std::string> args;
    };

    /**
     * @brief Turns control commands into controller intents and JSON responses
     *
     * Thread safety:
     * - execute() is synchronized via mutex; the controller has its own lock
     */
    class CommandHandler {
    public:
        /**
         * @param controller Lifecycle controller receiving the intents
         * @param audit_logger Source for logs:, may be nullptr
         */
        explicit CommandHandler(LifecycleController& controller, AuditLogger* audit_logger = nullptr);

        /**
         * @brief Executes a command and returns a JSON response
         *
         * @param command Full command string (e.g., "start:\n")
         * @return nlohmann::json
         *
         * Response format:
         * {
         *   "CMD": "echo of command name",
         *   "result": { ... } | null,
         *   "error": null | "error message"
         * }
         */
        nlohmann::json execute(const std::string& command);

        /**
         * @brief Splits "CMD:A,B,C\n" into name and trimmed, non-empty args
         *
         * @return std::nullopt if the colon separator is missing
         */
        static std::optional<ParsedCommand> parse(const std::string& command);

    private:
        LifecycleController& controller_;
        AuditLogger* audit_logger_;
        mutable std::mutex mutex_;

        nlohmann::json handle_start(const std::vector<std::string>& args);
        nlohmann::json handle_stop();
        nlohmann::json handle_reset();
        nlohmann::json handle_reset_server();
        nlohmann::json handle_select(const std::vector<std::string>& args);
        nlohmann::json handle_probe(const std::vector<std::string>& args);
        nlohmann::json handle_probe_stop();
        nlohmann::json handle_state();
        nlohmann::json handle_whoami();
        nlohmann::json handle_logs(const std::vector<std::string>& args);

        /**
         * @brief {"CMD": cmd, "result": result, "error": null} or the error form
         */
        static nlohmann::json respond(const std::string& cmd, ControllerError error, nlohmann::json result);
        static nlohmann::json error_response(const std::string& cmd, const std::string& message);

        /**
         * @brief Parses a port argument
         *
         * @throws std::invalid_argument if not a number in 1..65535
         */
        static uint16_t parse_port(const std::string& value);

        /**
         * @throws std::invalid_argument if not a number in 0..4294967295
         */
        static uint32_t parse_endpoint_id(const std::string& value);
    };

} // namespace asmd

//
// Created by opencode on 16/09/2026.
//

#include "asmd/command_handler.hpp"
#include "asmd/lifecycle_controller.hpp"
#include "asmd/audit_logger.hpp"
#include <sstream>
#include <stdexcept>

namespace asmd {

    namespace {

        /**
         * @brief Whole-string decimal parse into [min, max]
         */
        long long parse_ranged(const std::string& value, long long min, long long max, const char* what) {
            size_t consumed = 0;
            long long number = 0;
            try {
                number = std::stoll(value, &consumed);
            } catch (const std::logic_error&) {
                throw std::invalid_argument(std::string("Invalid ") + what + ": " + value);
            }
            if (consumed != value.size() || number < min || number > max) {
                throw std::invalid_argument(std::string("Invalid ") + what + ": " + value);
            }
            return number;
        }

        nlohmann::json request_to_json(const ServerEndpointRequest& request) {
            return {
                {"ip", request.bind_address},
                {"port", request.bind_port},
                {"endpoint", request.endpoint_id},
                {"encoding", request.encoding_key}
            };
        }

    } // namespace

    CommandHandler::CommandHandler(LifecycleController& controller, AuditLogger* audit_logger)
        : controller_(controller)
        , audit_logger_(audit_logger) {}

    std::optional<ParsedCommand> CommandHandler::parse(const std::string& command) {
        size_t colon_pos = command.find(':');
        if (colon_pos == std::string::npos) {
            return std::nullopt;
        }

        ParsedCommand parsed;
        parsed.name = command.substr(0, colon_pos);

        std::string args_str = command.substr(colon_pos + 1);
        while (!args_str.empty() && (args_str.back() == '\n' || args_str.back() == '\r')) {
            args_str.pop_back();
        }

        std::stringstream ss(args_str);
        std::string arg;
        while (std::getline(ss, arg, ',')) {
            arg.erase(0, arg.find_first_not_of(" \t"));
            arg.erase(arg.find_last_not_of(" \t") + 1);
            if (!arg.empty()) {
                parsed.args.push_back(arg);
            }
        }
        return parsed;
    }

    nlohmann::json CommandHandler::execute(const std::string& command) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto parsed = parse(command);
        if (!parsed) {
            return error_response("unknown", "Parsing error: colon not found");
        }

        const std::string& cmd = parsed->name;
        try {
            if (cmd == "start") {
                return handle_start(parsed->args);
            } else if (cmd == "stop") {
                return handle_stop();
            } else if (cmd == "reset") {
                return handle_reset();
            } else if (cmd == "reset-server") {
                return handle_reset_server();
            } else if (cmd == "select") {
                return handle_select(parsed->args);
            } else if (cmd == "probe") {
                return handle_probe(parsed->args);
            } else if (cmd == "probe-stop") {
                return handle_probe_stop();
            } else if (cmd == "state") {
                return handle_state();
            } else if (cmd == "whoami") {
                return handle_whoami();
            } else if (cmd == "logs") {
                return handle_logs(parsed->args);
            } else {
                return error_response(cmd, "Unknown command: " + cmd);
            }
        } catch (const std::exception& e) {
            if (audit_logger_) {
                audit_logger_->log_error(e.what(), cmd);
            }
            return error_response(cmd, e.what());
        }
    }

    nlohmann::json CommandHandler::handle_start(const std::vector<std::string>& args) {
        ControllerError error;
        if (args.empty()) {
            error = controller_.start_server();
        } else {
            if (args.size() < 4) {
                return error_response("start", "Not enough args: start requires ip,port,endpoint,encoding");
            }
            ServerEndpointRequest request;
            request.bind_address = args[0];
            request.bind_port = parse_port(args[1]);
            request.endpoint_id = parse_endpoint_id(args[2]);
            request.encoding_key = args[3];
            error = controller_.start_server(request);
        }

        nlohmann::json result = nullptr;
        if (auto active = controller_.get_active_request()) {
            result = {{"status", "running"}, {"request", request_to_json(*active)}};
        }
        return respond("start", error, result);
    }

    nlohmann::json CommandHandler::handle_stop() {
        return respond("stop", controller_.stop_server(), {{"status", "stopping"}});
    }

    nlohmann::json CommandHandler::handle_reset() {
        bool was_running = controller_.is_server_running();
        controller_.reset_settings();

        AudioSelection selection = controller_.get_selection();
        return respond("reset", ControllerError::NONE, {
            {"server_reset", was_running},
            {"endpoint", selection.endpoint_id},
            {"encoding", selection.encoding_key}
        });
    }

    nlohmann::json CommandHandler::handle_reset_server() {
        return respond("reset-server", controller_.reset_server(), {{"status", "resetting"}});
    }

    nlohmann::json CommandHandler::handle_select(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            return error_response("select", "Not enough args: select requires endpoint,encoding");
        }

        uint32_t endpoint_id = parse_endpoint_id(args[0]);
        ControllerError error = controller_.update_selection(endpoint_id, args[1]);
        return respond("select", error, {
            {"endpoint", endpoint_id},
            {"encoding", args[1]},
            {"restarted", error == ControllerError::NONE && controller_.is_server_running()}
        });
    }

    nlohmann::json CommandHandler::handle_probe(const std::vector<std::string>& args) {
        ControllerError error;
        if (args.empty()) {
            error = controller_.run_probe();
        } else if (args.size() >= 2) {
            error = controller_.run_probe(args[0], parse_port(args[1]));
        } else {
            return error_response("probe", "Not enough args: probe requires ip,port");
        }
        return respond("probe", error, {{"status", "probing"}});
    }

    nlohmann::json CommandHandler::handle_probe_stop() {
        return respond("probe-stop", controller_.stop_probe(), {{"status", "cancelled"}});
    }

    nlohmann::json CommandHandler::handle_state() {
        nlohmann::json active = nullptr;
        if (auto request = controller_.get_active_request()) {
            active = request_to_json(*request);
        }

        AudioSelection selection = controller_.get_selection();
        return respond("state", ControllerError::NONE, {
            {"state", state_to_string(controller_.get_state())},
            {"running", controller_.is_server_running()},
            {"probe_running", controller_.is_probe_running()},
            {"request", active},
            {"selection", {
                {"endpoint", selection.endpoint_id},
                {"encoding", selection.encoding_key}
            }}
        });
    }

    nlohmann::json CommandHandler::handle_whoami() {
        return respond("whoami", ControllerError::NONE, {
            {"version", ASMD_VERSION},
            {"implementation", "C++"}
        });
    }

    nlohmann::json CommandHandler::handle_logs(const std::vector<std::string>& args) {
        if (!audit_logger_) {
            return error_response("logs", "Audit log is disabled");
        }

        size_t n = 50;
        if (!args.empty()) {
            n = static_cast<size_t>(parse_ranged(args[0], 1, 100000, "line count"));
        }
        return respond("logs", ControllerError::NONE, {
            {"path", audit_logger_->get_log_path().string()},
            {"lines", audit_logger_->get_last_lines(n)}
        });
    }

    nlohmann::json CommandHandler::respond(const std::string& cmd, ControllerError error, nlohmann::json result) {
        if (error != ControllerError::NONE) {
            return error_response(cmd, controller_error_to_string(error));
        }
        return {
            {"CMD", cmd},
            {"result", std::move(result)},
            {"error", nullptr}
        };
    }

    nlohmann::json CommandHandler::error_response(const std::string& cmd, const std::string& message) {
        return {
            {"CMD", cmd},
            {"result", nullptr},
            {"error", message}
        };
    }

    uint16_t CommandHandler::parse_port(const std::string& value) {
        return static_cast<uint16_t>(parse_ranged(value, 1, 65535, "port"));
    }

    uint32_t CommandHandler::parse_endpoint_id(const std::string& value) {
        return static_cast<uint32_t>(parse_ranged(value, 0, 4294967295LL, "endpoint"));
    }

} // namespace asmd

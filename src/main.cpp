/**
 * @file main.cpp
 * @brief Entry point for the AudioShare daemon
 *
 * Modes:
 * - Daemon (default): supervise as-cmd, serve control commands on localhost
 * - Probe (--probe):  one firewall probe on the configured address, then exit
 *
 * Components:
 * - AuditLogger: Tracks all daemon actions
 * - ConfigStore: Persistent settings (JSON)
 * - FirewallRulePolicy: firewalld/ufw pre-check before a start
 * - ServerSupervisor: Owns the as-cmd subprocess
 * - FirewallProbe: Inbound reachability self-test
 * - LifecycleController: Intents, state, event routing
 * - CommandHandler / TCPServer: Control surface
 *
 * The main thread pumps controller events until SIGINT/SIGTERM, then
 * reconciles through on_shutdown().
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "asmd/arg_parser.hpp"
#include "asmd/audit_logger.hpp"
#include "asmd/command_handler.hpp"
#include "asmd/config_store.hpp"
#include "asmd/firewall_probe.hpp"
#include "asmd/lifecycle_controller.hpp"
#include "asmd/network_policy.hpp"
#include "asmd/presenter.hpp"
#include "asmd/server_supervisor.hpp"
#include "asmd/tcp_server.hpp"
#include "asmd/utils.hpp"

using namespace asmd;

/**
 * @brief Set by SIGINT/SIGTERM, polled by the pump loop
 */
static std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

static ConfigStore make_config_store(const ParsedArgs& args) {
    if (args.config_path.empty()) {
        return ConfigStore();
    }
    return ConfigStore(expand_tilde(args.config_path));
}

/**
 * @brief Run daemon mode
 *
 * @return int Exit code (0 for success)
 */
int run_daemon_mode(const ParsedArgs& args) {
    // Ignore SIGPIPE to prevent crashes when clients disconnect
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "========================================" << std::endl;
    std::cout << "AudioShare Daemon (AsDaemon)" << std::endl;
    std::cout << "========================================" << std::endl;

    try {
        AuditLogger audit_logger(AuditLogger::default_logs_dir());
        audit_logger.log_info("Starting daemon mode");

        ConfigStore config_store = make_config_store(args);
        std::cout << "Config: " << config_store.get_config_path() << std::endl;

        std::filesystem::path worker = expand_tilde(args.worker_binary);
        std::error_code ec;
        if (!std::filesystem::exists(worker, ec)) {
            std::cerr << "[AsDaemon] WARNING: worker binary not found at " << worker
                      << "; start requests will fail" << std::endl;
            audit_logger.log_error("Worker binary not found", worker.string());
        }

        std::shared_ptr<NetworkPolicy> policy;
        if (args.firewall_check) {
            policy = std::make_shared<FirewallRulePolicy>();
        } else {
            audit_logger.log_info("Firewall rule check disabled");
        }

        ServerSupervisor supervisor(worker, policy, AuditLogger::default_logs_dir());
        FirewallProbe probe;
        ConsolePresenter presenter(std::cout);
        LifecycleController controller(supervisor, probe, config_store, presenter, &audit_logger);
        CommandHandler command_handler(controller, &audit_logger);

        TCPServer server([&command_handler](const std::string& cmd) {
            return command_handler.execute(cmd);
        }, args.control_port);

        std::atomic<bool> server_failed{false};
        std::thread server_thread([&server, &server_failed]() {
            if (!server.start()) {
                server_failed = true;
                g_shutdown_requested = true;
            }
        });

        std::cout << "Daemon initialized successfully" << std::endl;
        std::cout << "========================================" << std::endl;
        audit_logger.log_info("Daemon initialized");

        controller.on_startup();

        while (!g_shutdown_requested) {
            controller.process_events(std::chrono::milliseconds(100));
        }

        std::cout << "\nShutting down..." << std::endl;

        // No client command may reach the controller once it has settled
        server.stop();
        server_thread.join();
        controller.on_shutdown();

        audit_logger.log_info("Daemon stopped");
        return server_failed ? 1 : 0;

    } catch (const std::exception& e) {
        std::cerr << "FATAL ERROR: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief One probe run on the configured address
 *
 * @return int 0 if reachable, 2 if not
 */
int run_probe_mode(const ParsedArgs& args) {
    ConfigStore config_store = make_config_store(args);
    AppConfig config = config_store.load();

    std::cout << "Waiting up to " << FirewallProbe::DEFAULT_TIMEOUT.count() << " ms for a connection on "
              << config.server_ip << ":" << config.server_port << " ..." << std::endl;

    FirewallProbe probe;
    auto result_rx = probe.subscribe_result_event();
    probe.start(config.server_ip, config.server_port);

    auto reachable = result_rx.recv(FirewallProbe::DEFAULT_TIMEOUT + std::chrono::seconds(1));

    ConsolePresenter presenter(std::cout);
    presenter.show_probe_result(reachable.value_or(false));
    return reachable.value_or(false) ? 0 : 2;
}

int main(int argc, char* argv[]) {
    ParsedArgs args = ArgParser::parse(argc, argv);

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cerr << "Use --help for usage." << std::endl;
        return 1;
    }

    if (args.show_help) {
        std::cout << ArgParser::get_help_message() << std::endl;
        return 0;
    }

    if (args.show_version) {
        std::cout << ArgParser::get_version_string() << std::endl;
        return 0;
    }

    switch (args.mode) {
        case RunMode::PROBE:
            return run_probe_mode(args);

        case RunMode::DAEMON:
        default:
            return run_daemon_mode(args);
    }
}

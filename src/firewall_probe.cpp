//
// Created by Sal Faris on 05/09/2026.
//

#include "asmd/firewall_probe.hpp"
#include <sockpp/inet_address.h>
#include <sockpp/tcp_socket.h>
#include <iostream>
#include <system_error>

namespace asmd {

    FirewallProbe::FirewallProbe(std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds poll_interval)
        : timeout_(timeout)
        , poll_interval_(poll_interval)
        , result_channel_(RESULT_EVENT_CAPACITY) {}

    FirewallProbe::~FirewallProbe() {
        stop();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void FirewallProbe::start(const std::string& address, uint16_t port) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_) {
                std::cout << "[AsDaemon] Warning: firewall probe already running" << std::endl;
                return;
            }
        }

        // The previous run was stopped or finished; its thread exits within one poll interval
        if (worker_.joinable()) {
            worker_.join();
        }

        uint64_t run_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_) {
                std::cout << "[AsDaemon] Warning: firewall probe already running" << std::endl;
                return;
            }
            running_ = true;
            run_id = ++run_id_;
        }

        std::cout << "[AsDaemon] Starting firewall probe on " << address << ":" << port << std::endl;

        try {
            worker_ = std::thread(&FirewallProbe::run_probe, this, address, port, run_id);
        } catch (const std::system_error& e) {
            std::cerr << "[AsDaemon] Failed to start probe thread: " << e.what() << std::endl;
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
    }

    void FirewallProbe::stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            std::cout << "[AsDaemon] Stopping firewall probe" << std::endl;
        }
        running_ = false;
        listener_.reset();
    }

    bool FirewallProbe::is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    FirewallProbe::ResultReceiver FirewallProbe::subscribe_result_event() {
        return result_channel_.subscribe();
    }

    void FirewallProbe::run_probe(std::string address, uint16_t port, uint64_t run_id) {
        auto acceptor = std::make_unique<sockpp::tcp_acceptor>();
        bool bound = false;

        try {
            sockpp::inet_address addr(address, port);

            auto open_result = acceptor->open(addr, 4, 0);
            if (!open_result.is_ok()) {
                std::cerr << "[AsDaemon] Probe failed to bind " << address << ":" << port
                          << ": " << open_result.error_message() << std::endl;
            } else {
                auto nb_result = acceptor->set_non_blocking(true);
                if (!nb_result.is_ok()) {
                    std::cerr << "[AsDaemon] Probe failed to set non-blocking mode: "
                              << nb_result.error_message() << std::endl;
                } else {
                    bound = true;
                }
            }
        } catch (const std::exception& e) {
            // inet_address throws when the host cannot be resolved
            std::cerr << "[AsDaemon] Probe address " << address << " is invalid: " << e.what() << std::endl;
        }

        if (!bound) {
            finish(run_id, false);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_current_locked(run_id)) {
                std::cout << "[AsDaemon] Firewall probe cancelled before listening" << std::endl;
                return;
            }
            if (listener_) {
                std::cout << "[AsDaemon] Warning: firewall probe already listening" << std::endl;
                return;
            }
            listener_ = std::move(acceptor);
        }

        std::cout << "[AsDaemon] Probe listening on " << address << ":" << port
                  << " for " << timeout_.count() << " ms" << std::endl;

        auto started = std::chrono::steady_clock::now();
        bool reachable = false;

        while (std::chrono::steady_clock::now() - started < timeout_) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!is_current_locked(run_id) || !listener_) {
                    std::cout << "[AsDaemon] Firewall probe stopped, no result published" << std::endl;
                    return;
                }

                auto client = listener_->accept();
                if (client.is_ok()) {
                    // Peer identity and data are irrelevant; the socket closes here
                    reachable = true;
                    break;
                }
            }
            std::this_thread::sleep_for(poll_interval_);
        }

        finish(run_id, reachable);
    }

    void FirewallProbe::finish(uint64_t run_id, bool reachable) {
        bool publish = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (is_current_locked(run_id)) {
                running_ = false;
                listener_.reset();
                publish = true;
            }
        }

        if (!publish) {
            std::cout << "[AsDaemon] Firewall probe cancelled, no result published" << std::endl;
            return;
        }

        std::cout << "[AsDaemon] Firewall probe result: "
                  << (reachable ? "reachable" : "not reachable") << std::endl;
        result_channel_.send(reachable);
    }

} // namespace asmd

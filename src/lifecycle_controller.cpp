//
// Created by opencode on 11/09/2026.
//

#include "asmd/lifecycle_controller.hpp"
#include "asmd/audit_logger.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace asmd {

    LifecycleController::LifecycleController(ServerSupervisor& supervisor,
                                             FirewallProbe& probe,
                                             ConfigRepository& config_repository,
                                             Presenter& presenter,
                                             AuditLogger* audit_logger)
        : supervisor_(supervisor)
        , probe_(probe)
        , config_repository_(config_repository)
        , presenter_(presenter)
        , audit_logger_(audit_logger)
        , state_machine_([this](State from, State to) { audit_state(from, to); })
        , config_(config_repository.load())
        , selection_{config_.audio_endpoint, config_.audio_encoding}
        , stop_rx_(supervisor.subscribe_stop_event())
        , device_rx_(supervisor.subscribe_device_event())
        , probe_rx_(probe.subscribe_result_event()) {}

    ControllerError LifecycleController::start_server() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audit_logger_) {
            audit_logger_->log_command("start", "config");
        }
        return start_locked(request_from_config_locked());
    }

    ControllerError LifecycleController::start_server(const ServerEndpointRequest& request) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audit_logger_) {
            audit_logger_->log_command("start", request.bind_address + ":" + std::to_string(request.bind_port));
        }
        return start_locked(request);
    }

    ControllerError LifecycleController::stop_server() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audit_logger_) {
            audit_logger_->log_command("stop", "");
        }
        return stop_locked(false);
    }

    ControllerError LifecycleController::reset_server() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audit_logger_) {
            audit_logger_->log_command("reset", "");
        }
        return stop_locked(true);
    }

    ControllerError LifecycleController::run_probe() {
        std::string address;
        uint16_t port;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            address = config_.server_ip;
            port = config_.server_port;
        }
        return run_probe(address, port);
    }

    ControllerError LifecycleController::run_probe(const std::string& address, uint16_t port) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audit_logger_) {
            audit_logger_->log_command("probe", address + ":" + std::to_string(port));
        }

        if (state_machine_.get_state() != State::IDLE || supervisor_.is_running()) {
            return ControllerError::SERVER_RUNNING;
        }
        if (probe_.is_running()) {
            return ControllerError::ALREADY_RUNNING;
        }
        if (address.empty() || port == 0) {
            return ControllerError::INVALID_REQUEST;
        }

        probe_.start(address, port);
        if (audit_logger_) {
            audit_logger_->log_action("Firewall probe started", address + ":" + std::to_string(port));
        }
        return ControllerError::NONE;
    }

    ControllerError LifecycleController::stop_probe() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!probe_.is_running()) {
            return ControllerError::NOT_RUNNING;
        }

        probe_.stop();
        if (audit_logger_) {
            audit_logger_->log_action("Firewall probe cancelled");
        }
        return ControllerError::NONE;
    }

    ControllerError LifecycleController::update_selection(uint32_t endpoint_id, const std::string& encoding_key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audit_logger_) {
            audit_logger_->log_command("select", std::to_string(endpoint_id) + "/" + encoding_key);
        }

        selection_ = AudioSelection{endpoint_id, encoding_key};

        if (state_machine_.get_state() != State::RUNNING || !supervisor_.is_running()) {
            return ControllerError::NONE;
        }

        // Restart with the new selection; the old run's reason is dropped
        ServerEndpointRequest request = active_request_.value_or(request_from_config_locked());
        request.endpoint_id = endpoint_id;
        request.encoding_key = encoding_key;

        std::cout << "[AsDaemon] Restarting server with endpoint " << endpoint_id
                  << " encoding " << encoding_key << std::endl;

        state_machine_.transition_to(State::STOPPING);
        supervisor_.stop();
        awaiting_stop_reason_ = false;
        stop_requested_ = false;
        reset_requested_ = false;
        state_machine_.transition_to(State::IDLE);

        return start_locked(request);
    }

    void LifecycleController::reset_settings() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audit_logger_) {
            audit_logger_->log_command("reset-settings", "");
        }

        if (supervisor_.is_running()) {
            stop_locked(true);
        }

        config_ = config_repository_.load();
        selection_ = AudioSelection{config_.audio_endpoint, config_.audio_encoding};
    }

    void LifecycleController::on_startup() {
        bool should_start;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            should_start = config_.auto_start_server || (config_.keep_last_state && config_.last_server_state);
        }

        if (!should_start) {
            return;
        }

        std::cout << "[AsDaemon] Auto-starting server" << std::endl;
        ControllerError result = start_server();
        if (result != ControllerError::NONE) {
            std::cerr << "[AsDaemon] Auto-start failed: " << controller_error_to_string(result) << std::endl;
            if (audit_logger_) {
                audit_logger_->log_error(controller_error_to_string(result), "auto-start");
            }
        }
    }

    void LifecycleController::on_shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (audit_logger_) {
            audit_logger_->log_command("shutdown", "");
        }

        config_.last_server_state = supervisor_.is_running();
        if (!config_repository_.save(config_)) {
            std::cerr << "[AsDaemon] Failed to save config on shutdown" << std::endl;
        }

        if (supervisor_.is_running()) {
            // Nothing pumps after shutdown, so the run is settled here
            state_machine_.transition_to(State::STOPPING);
            supervisor_.stop();
            awaiting_stop_reason_ = false;
            stop_requested_ = false;
            reset_requested_ = false;
        }
        state_machine_.force_idle();
        active_request_.reset();

        if (probe_.is_running()) {
            probe_.stop();
        }
    }

    size_t LifecycleController::process_events(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                size_t dispatched = drain_locked();
                if (dispatched > 0) {
                    return dispatched;
                }
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return 0;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(PUMP_SLICE, remaining));
        }
    }

    State LifecycleController::get_state() const {
        return state_machine_.get_state();
    }

    bool LifecycleController::is_server_running() const {
        return supervisor_.is_running();
    }

    bool LifecycleController::is_probe_running() const {
        return probe_.is_running();
    }

    AppConfig LifecycleController::get_config() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    AudioSelection LifecycleController::get_selection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return selection_;
    }

    std::optional<ServerEndpointRequest> LifecycleController::get_active_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_request_;
    }

    ServerEndpointRequest LifecycleController::request_from_config_locked() const {
        ServerEndpointRequest request;
        request.bind_address = config_.server_ip;
        request.bind_port = config_.server_port;
        request.endpoint_id = selection_.endpoint_id;
        request.encoding_key = selection_.encoding_key;
        return request;
    }

    ControllerError LifecycleController::start_locked(const ServerEndpointRequest& request) {
        if (probe_.is_running()) {
            return ControllerError::PROBE_RUNNING;
        }

        State current = state_machine_.get_state();
        if (current == State::STARTING || current == State::STOPPING) {
            return ControllerError::BUSY;
        }
        if (current == State::RUNNING || supervisor_.is_running()) {
            return ControllerError::ALREADY_RUNNING;
        }
        if (request.bind_address.empty() || request.bind_port == 0) {
            return ControllerError::INVALID_REQUEST;
        }

        state_machine_.transition_to(State::STARTING);
        awaiting_stop_reason_ = true;
        stop_requested_ = false;
        reset_requested_ = false;

        StartOutcome outcome = supervisor_.start(request);
        if (audit_logger_) {
            audit_logger_->log_action("Supervisor start", start_outcome_to_string(outcome));
        }
        switch (outcome) {
            case StartOutcome::STARTED:
                active_request_ = request;
                state_machine_.transition_to(State::RUNNING);
                if (audit_logger_) {
                    audit_logger_->log_success("Server started",
                                               request.bind_address + ":" + std::to_string(request.bind_port));
                }
                return ControllerError::NONE;

            case StartOutcome::ALREADY_RUNNING:
                active_request_ = supervisor_.current_request();
                state_machine_.transition_to(State::RUNNING);
                return ControllerError::ALREADY_RUNNING;

            case StartOutcome::FIREWALL_BLOCKED:
                // FirewallBlocked is on the stop channel; the pump presents it
                state_machine_.transition_to(State::IDLE);
                if (audit_logger_) {
                    audit_logger_->log_error("Start blocked by firewall",
                                             request.bind_address + ":" + std::to_string(request.bind_port));
                }
                return ControllerError::FIREWALL_BLOCKED;

            case StartOutcome::SPAWN_FAILED:
            default:
                awaiting_stop_reason_ = false;
                state_machine_.transition_to(State::IDLE);
                if (audit_logger_) {
                    audit_logger_->log_error("Failed to spawn server", supervisor_.get_worker_binary().string());
                }
                return ControllerError::SPAWN_FAILED;
        }
    }

    ControllerError LifecycleController::stop_locked(bool reset) {
        State current = state_machine_.get_state();
        if (current == State::STOPPING) {
            return ControllerError::BUSY;
        }
        if (current != State::RUNNING && !supervisor_.is_running()) {
            return ControllerError::NOT_RUNNING;
        }

        stop_requested_ = true;
        reset_requested_ = reset;
        state_machine_.transition_to(State::STOPPING);

        if (reset) {
            supervisor_.reset();
        } else {
            supervisor_.stop();
        }

        if (audit_logger_) {
            audit_logger_->log_action(reset ? "Server reset requested" : "Server stop requested");
        }
        return ControllerError::NONE;
    }

    size_t LifecycleController::drain_locked() {
        size_t dispatched = 0;

        while (auto event = device_rx_.try_recv()) {
            handle_device_event(*event);
            ++dispatched;
        }

        if (stop_rx_.has_changed()) {
            std::optional<ProcessStopReason> reason = stop_rx_.borrow_and_update();
            if (reason) {
                handle_stop_reason(*reason);
                ++dispatched;
            }
        }

        while (auto result = probe_rx_.try_recv()) {
            handle_probe_result(*result);
            ++dispatched;
        }

        return dispatched;
    }

    void LifecycleController::handle_stop_reason(const ProcessStopReason& reason) {
        std::cout << "[AsDaemon] Server stopped: " << reason.to_string() << std::endl;

        if (!awaiting_stop_reason_) {
            if (audit_logger_) {
                audit_logger_->log_info("Ignoring stop reason " + reason.to_string() + " (run already settled)");
            }
            return;
        }

        awaiting_stop_reason_ = false;
        bool was_stop = stop_requested_;
        bool was_reset = reset_requested_;
        stop_requested_ = false;
        reset_requested_ = false;
        state_machine_.force_idle();

        if (was_reset || reason.kind() == ProcessStopReason::Kind::RESETTING) {
            active_request_.reset();
            if (audit_logger_) {
                audit_logger_->log_success("Server reset");
            }
            return;
        }

        if (reason.kind() == ProcessStopReason::Kind::EXITED_SUCCESSFULLY) {
            if (was_stop) {
                persist_runtime_parameters();
            } else if (audit_logger_) {
                audit_logger_->log_info("Server exited on its own");
            }
            active_request_.reset();
            return;
        }

        active_request_.reset();
        if (audit_logger_) {
            audit_logger_->log_error(reason.to_string(), "server");
        }
        if (config_.notification_error) {
            presenter_.show_error(reason);
        }
    }

    void LifecycleController::handle_device_event(const DeviceConnectionEvent& event) {
        if (audit_logger_) {
            audit_logger_->log_info(std::string(event.connected ? "Device connected: " : "Device disconnected: ")
                                    + event.peer_address);
        }

        bool enabled = event.connected ? config_.notification_device_connect
                                       : config_.notification_device_disconnect;
        if (enabled) {
            presenter_.show_connection(event);
        }
    }

    void LifecycleController::handle_probe_result(bool reachable) {
        if (audit_logger_) {
            audit_logger_->log_action("Firewall probe finished", reachable ? "reachable" : "unreachable");
        }
        presenter_.show_probe_result(reachable);
    }

    void LifecycleController::persist_runtime_parameters() {
        if (!active_request_) {
            return;
        }

        config_.server_ip = active_request_->bind_address;
        config_.server_port = active_request_->bind_port;
        config_.audio_endpoint = active_request_->endpoint_id;
        config_.audio_encoding = active_request_->encoding_key;

        if (config_repository_.save(config_)) {
            if (audit_logger_) {
                audit_logger_->log_success("Runtime parameters saved",
                                           config_.server_ip + ":" + std::to_string(config_.server_port));
            }
        } else {
            std::cerr << "[AsDaemon] Failed to save runtime parameters" << std::endl;
            if (audit_logger_) {
                audit_logger_->log_error("Failed to save runtime parameters", "config");
            }
        }
    }

    void LifecycleController::audit_state(State from, State to) {
        if (audit_logger_) {
            audit_logger_->log_state_transition(state_to_string(from), state_to_string(to));
        }
    }

} // namespace asmd

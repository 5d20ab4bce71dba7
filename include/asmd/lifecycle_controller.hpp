/**
 * @file lifecycle_controller.hpp
 * @brief Intent handling and event routing for the audio server
 *
 * The controller sits between the operator (TCP control surface, startup
 * reconciliation) and the two resource owners, ServerSupervisor and
 * FirewallProbe. It:
 * - Rejects a probe while the server runs and a start while the probe runs
 * - Tracks IDLE/STARTING/RUNNING/STOPPING in a StateMachine
 * - Pumps the stop-reason, device and probe channels in process_events()
 * - Persists the runtime parameters after a clean operator stop
 * - Routes faults, connections and probe results to the Presenter
 *
 * It owns no process or socket resources itself.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "asmd/config_store.hpp"
#include "asmd/firewall_probe.hpp"
#include "asmd/presenter.hpp"
#include "asmd/process_stop_reason.hpp"
#include "asmd/server_supervisor.hpp"
#include "asmd/state_machine.hpp"

namespace asmd {

    class AuditLogger;

    /**
     * @brief Result of an operator intent
     *
     * Rejections are returned to the caller; nothing is queued for later.
     */
    enum class ControllerError {
        NONE,               ///< Intent accepted
        PROBE_RUNNING,      ///< Start refused, a probe is active
        SERVER_RUNNING,     ///< Probe refused, the server is not idle
        ALREADY_RUNNING,    ///< Start/probe refused, it is already active
        NOT_RUNNING,        ///< Stop/reset with nothing to stop
        BUSY,               ///< A start or stop is still settling
        INVALID_REQUEST,    ///< Empty address or zero port
        FIREWALL_BLOCKED,   ///< Network policy refused the start
        SPAWN_FAILED        ///< The worker could not be spawned
    };

    inline std::string controller_error_to_string(ControllerError error) {
        switch (error) {
            case ControllerError::NONE:             return "OK";
            case ControllerError::PROBE_RUNNING:    return "Firewall probe is running";
            case ControllerError::SERVER_RUNNING:   return "Server is running";
            case ControllerError::ALREADY_RUNNING:  return "Already running";
            case ControllerError::NOT_RUNNING:      return "Not running";
            case ControllerError::BUSY:             return "Server is starting or stopping";
            case ControllerError::INVALID_REQUEST:  return "Invalid address or port";
            case ControllerError::FIREWALL_BLOCKED: return "Blocked by firewall";
            case ControllerError::SPAWN_FAILED:     return "Failed to spawn the server";
            default:                                return "Unknown error";
        }
    }

    /**
     * @brief Audio endpoint and encoding the next start will use
     */
    struct AudioSelection {
        uint32_t endpoint_id = 0;
        std::string encoding_key;
    };

    /**
     * @brief Coordinates server and probe on behalf of the operator
     *
     * Thread safety:
     * - Every public method takes the controller mutex, so intents from the
     *   control-surface thread and the pump in the main thread serialize
     * - Presenter and config callbacks run with that mutex held; they must
     *   not call back into the controller
     *
     * Example:
     *   LifecycleController controller(supervisor, probe, store, presenter, &audit);
     *   controller.on_startup();
     *   while (!stop_flag) {
     *       controller.process_events(std::chrono::milliseconds(100));
     *   }
     *   controller.on_shutdown();
     */
    class LifecycleController {
    public:
        LifecycleController(ServerSupervisor& supervisor,
                            FirewallProbe& probe,
                            ConfigRepository& config_repository,
                            Presenter& presenter,
                            AuditLogger* audit_logger = nullptr);

        LifecycleController(const LifecycleController&) = delete;
        LifecycleController& operator=(const LifecycleController&) = delete;

        /**
         * @brief Starts the server on the configured address with the current selection
         */
        ControllerError start_server();

        /**
         * @brief Starts the server for an explicit request
         *
         * The request becomes the active runtime parameters; they are
         * written back to the config only after a clean operator stop.
         */
        ControllerError start_server(const ServerEndpointRequest& request);

        /**
         * @brief Operator stop; the worker is killed synchronously
         *
         * The run is settled when process_events() observes its stop reason.
         */
        ControllerError stop_server();

        /**
         * @brief Stops the server as part of a settings reset
         *
         * The Resetting reason it causes is a control signal, never an error.
         */
        ControllerError reset_server();

        /**
         * @brief Probes the configured server address/port
         */
        ControllerError run_probe();
        ControllerError run_probe(const std::string& address, uint16_t port);
        ControllerError stop_probe();

        /**
         * @brief Changes the selection; restarts a running server with it
         *
         * The restart is a plain stop followed by a start and persists nothing.
         */
        ControllerError update_selection(uint32_t endpoint_id, const std::string& encoding_key);

        /**
         * @brief Resets a running server and reloads the selection from config
         */
        void reset_settings();

        /**
         * @brief Auto-start according to auto_start_server / keep_last_state
         */
        void on_startup();

        /**
         * @brief Records last_server_state, saves the config, stops server and probe
         */
        void on_shutdown();

        /**
         * @brief Dispatches pending channel events
         *
         * Waits up to `timeout` for at least one event, then drains whatever
         * is pending: device events, the latest stop reason, probe results.
         *
         * @return Number of events dispatched
         */
        size_t process_events(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

        State get_state() const;
        bool is_server_running() const;
        bool is_probe_running() const;
        AppConfig get_config() const;
        AudioSelection get_selection() const;
        std::optional<ServerEndpointRequest> get_active_request() const;

    private:
        static constexpr std::chrono::milliseconds PUMP_SLICE{10};

        ServerSupervisor& supervisor_;
        FirewallProbe& probe_;
        ConfigRepository& config_repository_;
        Presenter& presenter_;
        AuditLogger* audit_logger_;

        mutable std::mutex mutex_;
        StateMachine state_machine_;
        AppConfig config_;
        AudioSelection selection_;
        std::optional<ServerEndpointRequest> active_request_;

        ServerSupervisor::StopReceiver stop_rx_;
        ServerSupervisor::DeviceReceiver device_rx_;
        FirewallProbe::ResultReceiver probe_rx_;

        bool awaiting_stop_reason_ = false;  ///< First reason of the current run not seen yet
        bool stop_requested_ = false;
        bool reset_requested_ = false;

        ServerEndpointRequest request_from_config_locked() const;
        ControllerError start_locked(const ServerEndpointRequest& request);
        ControllerError stop_locked(bool reset);
        size_t drain_locked();

        void handle_stop_reason(const ProcessStopReason& reason);
        void handle_device_event(const DeviceConnectionEvent& event);
        void handle_probe_result(bool reachable);
        void persist_runtime_parameters();
        void audit_state(State from, State to);
    };

} // namespace asmd

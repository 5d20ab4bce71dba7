/**
 * @file server_supervisor.hpp
 * @brief Manages the as-cmd worker subprocess lifecycle
 *
 * This header provides functionality to:
 * - Spawn the worker with a bind address, endpoint id and encoding key
 * - Read its stdout/stderr on two background threads
 * - Turn "[info] accept/close" lines into DeviceConnectionEvents
 * - Turn fatal stderr lines into a ProcessStopReason
 * - Kill and reap the worker on stop, reset or fault
 *
 * Process lifecycle:
 * 1. start()  - fork/exec the worker in its own process group
 * 2. stdout reader - publishes device events, clears the running flag at EOF
 * 3. stderr reader - classifies faults, then kills/reaps the worker and
 *    publishes the stop reason (it always runs to a terminal publish)
 * 4. stop()/reset() - SIGKILL the process group, reap, reset to idle
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "asmd/event_channel.hpp"
#include "asmd/process_stop_reason.hpp"

namespace asmd {

    class NetworkPolicy;
    class SessionLog;

    /**
     * @brief Synchronous result of ServerSupervisor::start()
     *
     * SPAWN_FAILED is only reported here; unlike every other way a run
     * can end, it is never published on the stop-reason channel.
     */
    enum class StartOutcome {
        STARTED,           ///< Worker spawned, reader threads running
        ALREADY_RUNNING,   ///< A worker is live; the call was a no-op
        FIREWALL_BLOCKED,  ///< Network policy refused; FirewallBlocked published
        SPAWN_FAILED       ///< fork/exec failed; nothing published
    };

    inline std::string start_outcome_to_string(StartOutcome outcome) {
        switch (outcome) {
            case StartOutcome::STARTED:          return "STARTED";
            case StartOutcome::ALREADY_RUNNING:  return "ALREADY_RUNNING";
            case StartOutcome::FIREWALL_BLOCKED: return "FIREWALL_BLOCKED";
            case StartOutcome::SPAWN_FAILED:     return "SPAWN_FAILED";
            default:                             return "UNKNOWN";
        }
    }

    /**
     * @brief Owns zero or one live worker subprocess
     *
     * Thread safety:
     * - All public methods may be called from any thread
     * - The child handle and the running flag are one unit under run_mutex_
     *
     * Example:
     *   ServerSupervisor supervisor("/app/bin/as-cmd");
     *   auto stop_rx = supervisor.subscribe_stop_event();
     *   supervisor.start({"192.168.1.10", 65530, 1, "opus"});
     *   ...
     *   supervisor.stop();
     */
    class ServerSupervisor {
    public:
        static constexpr size_t DEVICE_EVENT_CAPACITY = 16;

        using StopReasonChannel = WatchChannel<std::optional<ProcessStopReason>>;
        using StopReceiver = StopReasonChannel::Receiver;
        using DeviceReceiver = BroadcastChannel<DeviceConnectionEvent>::Receiver;

        /**
         * @param worker_binary Path to the as-cmd executable
         * @param policy Optional reachability pre-check, nullptr allows everything
         * @param session_logs_dir Directory for per-run logs, empty disables them
         */
        explicit ServerSupervisor(std::filesystem::path worker_binary,
                                  std::shared_ptr<NetworkPolicy> policy = nullptr,
                                  std::filesystem::path session_logs_dir = {});

        /**
         * @brief Kills any live worker and joins the reader threads
         */
        ~ServerSupervisor();

        ServerSupervisor(const ServerSupervisor&) = delete;
        ServerSupervisor& operator=(const ServerSupervisor&) = delete;

        /**
         * @brief Spawns the worker for `request`
         *
         * The run-state lock is held for the whole decision, so concurrent
         * starts leave exactly one live worker.
         */
        StartOutcome start(const ServerEndpointRequest& request);

        /**
         * @brief Kills the live worker (if any) and resets to idle
         *
         * Publishes nothing; the stderr reader observes the stream end and
         * publishes the stop reason afterwards.
         */
        void stop();

        /**
         * @brief Same as stop(), then publishes Resetting
         */
        void reset();

        bool is_running() const;

        /**
         * @brief Process id of the live worker, if any
         */
        std::optional<pid_t> get_pid() const;

        /**
         * @brief Request of the live worker, if any
         */
        std::optional<ServerEndpointRequest> current_request() const;

        StopReceiver subscribe_stop_event() const;
        DeviceReceiver subscribe_device_event();

        /**
         * @brief Worker command line (without argv[0]) for a request
         *
         * --bind=<ip>:<port> -e <endpoint_id> --encoding <encoding_key>
         */
        static std::vector<std::string> build_arguments(const ServerEndpointRequest& request);

        [[nodiscard]] const std::filesystem::path& get_worker_binary() const { return worker_binary_; }

    private:
        struct ChildProcess {
            pid_t pid = -1;
            uint64_t run_id = 0;
            ServerEndpointRequest request;
        };

        struct RunState {
            std::optional<ChildProcess> child;  ///< Present while a worker is live
            bool running = false;               ///< Updated together with child
            uint64_t run_id = 0;                ///< Id of the most recent spawned run
        };

        struct ReaderThread {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        std::filesystem::path worker_binary_;
        std::shared_ptr<NetworkPolicy> policy_;
        std::filesystem::path session_logs_dir_;

        mutable std::mutex run_mutex_;
        RunState state_;

        StopReasonChannel stop_channel_;
        BroadcastChannel<DeviceConnectionEvent> device_channel_;

        std::mutex readers_mutex_;
        std::vector<ReaderThread> readers_;

        /**
         * @brief fork/exec the worker with piped stdout/stderr
         *
         * Exec failures are reported back through a close-on-exec pipe, so
         * a missing or non-executable binary is a synchronous failure.
         *
         * @return false on failure (error describes why)
         */
        bool spawn_worker(const ServerEndpointRequest& request,
                          pid_t& pid, int& stdout_fd, int& stderr_fd, std::string& error);

        /**
         * @brief SIGKILL the worker's process group and reap it
         *
         * Must be called with run_mutex_ held. ESRCH is tolerated; any other
         * kill failure is logged only.
         */
        void terminate_locked(const char* context);

        void clear_locked();

        void read_stdout(int fd, uint64_t run_id, std::shared_ptr<SessionLog> session);
        void read_stderr(int fd, uint64_t run_id, std::shared_ptr<SessionLog> session);

        void launch_reader(void (ServerSupervisor::*reader)(int, uint64_t, std::shared_ptr<SessionLog>),
                           int fd, uint64_t run_id, std::shared_ptr<SessionLog> session);

        /**
         * @brief Joins reader threads of earlier runs that have finished
         */
        void reap_finished_readers();
    };

} // namespace asmd

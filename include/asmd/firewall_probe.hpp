/**
 * @file firewall_probe.hpp
 * @brief Time-boxed inbound reachability self-test
 *
 * The probe binds a listening TCP socket on the server address/port and
 * waits for any client (e.g. the phone app) to connect. No client is driven
 * from here; the result only says whether an inbound connection arrived
 * within the window.
 *
 * Results (one bool per run) go out on a fan-out channel:
 * - true:  a connection was accepted before the timeout
 * - false: bind failed, or nothing connected before the timeout
 * - nothing at all if stop() cancelled the run
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <sockpp/tcp_acceptor.h>

#include "asmd/event_channel.hpp"

namespace asmd {

    /**
     * @brief Owns at most one listening socket at a time
     *
     * start()/stop() are meant to be called from the controlling thread;
     * the accept-wait runs on a background thread. The running flag and
     * listener form one unit under mutex_.
     */
    class FirewallProbe {
    public:
        static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};
        static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{50};
        static constexpr size_t RESULT_EVENT_CAPACITY = 16;

        using ResultReceiver = BroadcastChannel<bool>::Receiver;

        explicit FirewallProbe(std::chrono::milliseconds timeout = DEFAULT_TIMEOUT,
                               std::chrono::milliseconds poll_interval = DEFAULT_POLL_INTERVAL);

        /**
         * @brief Cancels any active run and joins the worker thread
         */
        ~FirewallProbe();

        FirewallProbe(const FirewallProbe&) = delete;
        FirewallProbe& operator=(const FirewallProbe&) = delete;

        /**
         * @brief Starts a probe run on address:port
         *
         * No-op with a warning if a probe is already active. The bind happens
         * on the background thread and is re-validated under the lock.
         */
        void start(const std::string& address, uint16_t port);

        /**
         * @brief Cancels the active run
         *
         * Clears the running flag before dropping the listener so the poll
         * loop sees the cancellation first. A cancelled run publishes nothing.
         */
        void stop();

        bool is_running() const;

        ResultReceiver subscribe_result_event();

    private:
        std::chrono::milliseconds timeout_;
        std::chrono::milliseconds poll_interval_;

        mutable std::mutex mutex_;
        bool running_ = false;
        uint64_t run_id_ = 0;
        std::unique_ptr<sockpp::tcp_acceptor> listener_;

        std::thread worker_;
        BroadcastChannel<bool> result_channel_;

        void run_probe(std::string address, uint16_t port, uint64_t run_id);

        /**
         * @brief Ends run `run_id`, publishing `reachable` unless it was cancelled
         */
        void finish(uint64_t run_id, bool reachable);

        bool is_current_locked(uint64_t run_id) const { return running_ && run_id_ == run_id; }
    };

} // namespace asmd

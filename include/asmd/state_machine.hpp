/**
 * @file state_machine.hpp
 * @brief Lifecycle states of the supervised audio server
 *
 * IDLE → STARTING → RUNNING → STOPPING → IDLE
 *   ↑        |          |
 *   └────────┴──────────┘ (spawn failure, firewall block, worker fault)
 *
 * The state machine only tracks what the controller has decided; the
 * supervisor's running flag remains the ground truth for the process.
 */

#pragma once

#include <mutex>
#include <atomic>
#include <functional>
#include <string>

namespace asmd {

    enum class State {
        IDLE,       ///< No worker, ready to start
        STARTING,   ///< start() issued, outcome not known yet
        RUNNING,    ///< Worker spawned and not yet stopped
        STOPPING    ///< stop()/reset() issued, waiting for the stop reason
    };

    inline std::string state_to_string(State state) {
        switch (state) {
            case State::IDLE:     return "IDLE";
            case State::STARTING: return "STARTING";
            case State::RUNNING:  return "RUNNING";
            case State::STOPPING: return "STOPPING";
            default:              return "UNKNOWN";
        }
    }

    /**
     * @brief Thread-safe state holder with validated transitions
     *
     * Usage:
     *   StateMachine sm([](State from, State to) { ... });
     *   sm.transition_to(State::STARTING);  // From IDLE only
     *   auto current = sm.get_state();
     */
    class StateMachine {
    public:
        /**
         * @brief Called after every successful transition, outside the lock
         */
        using Observer = std::function<void(State from, State to)>;

        explicit StateMachine(Observer observer = nullptr)
            : current_state_(State::IDLE)
            , observer_(std::move(observer)) {}

        State get_state() const {
            return current_state_.load();
        }

        /**
         * @brief Attempts to transition to a new state
         *
         * Valid transitions:
         * - IDLE → STARTING (start intent)
         * - STARTING → RUNNING (worker spawned)
         * - STARTING → IDLE (spawn failure, firewall blocked, already running elsewhere)
         * - RUNNING → STOPPING (stop/reset intent)
         * - RUNNING → IDLE (worker ended by itself)
         * - STOPPING → IDLE (stop reason observed)
         *
         * Transitioning to the current state is accepted and not reported.
         *
         * @return false if the transition is invalid (state unchanged)
         */
        bool transition_to(State new_state);

        /**
         * @brief Returns to IDLE from any state
         *
         * Used when the worker is found dead regardless of what was expected.
         */
        void force_idle();

        static bool is_valid_transition(State from, State to);

    private:
        std::atomic<State> current_state_;
        Observer observer_;
        mutable std::mutex mutex_;

        void notify(State from, State to) const;
    };

} // namespace asmd

//
// Created by opencode on 02/09/2026.
//

#include "asmd/state_machine.hpp"

namespace asmd {

    bool StateMachine::is_valid_transition(State from, State to) {
        switch (from) {
            case State::IDLE:
                return to == State::STARTING;

            case State::STARTING:
                return to == State::RUNNING || to == State::IDLE;

            case State::RUNNING:
                return to == State::STOPPING || to == State::IDLE;

            case State::STOPPING:
                return to == State::IDLE;

            default:
                return false;
        }
    }

    bool StateMachine::transition_to(State new_state) {
        State previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            previous = current_state_.load();
            if (previous == new_state) {
                return true;
            }
            if (!is_valid_transition(previous, new_state)) {
                return false;
            }
            current_state_.store(new_state);
        }

        notify(previous, new_state);
        return true;
    }

    void StateMachine::force_idle() {
        State previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = current_state_.exchange(State::IDLE);
        }

        if (previous != State::IDLE) {
            notify(previous, State::IDLE);
        }
    }

    void StateMachine::notify(State from, State to) const {
        if (observer_) {
            observer_(from, to);
        }
    }

} // namespace asmd

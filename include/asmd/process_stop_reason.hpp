/**
 * @file process_stop_reason.hpp
 * @brief Terminal outcome of a supervised worker run and related value types
 *
 * This header defines the plain data carried between the supervisor,
 * the probe and the lifecycle controller:
 * - ProcessStopReason: why a run ended (published once per run)
 * - DeviceConnectionEvent: a peer connected to / disconnected from the worker
 * - ServerEndpointRequest: parameters for one worker run
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace asmd {

    /**
     * @brief Tagged stop reason
     *
     * Only ExitedWithError carries a payload (the optional exit code).
     */
    class ProcessStopReason {
    public:
        enum class Kind {
            INVALID_BINDING,      ///< Worker could not bind the requested address
            INVALID_ARGUMENT,     ///< Worker rejected its arguments
            FIREWALL_BLOCKED,     ///< Network policy refused the bind address/port
            EXITED_SUCCESSFULLY,  ///< Stream ended with no fault marker
            RESETTING,            ///< Operator-initiated reset
            EXITED_WITH_ERROR,    ///< Unclassified failure, optional exit code
            FAILED_TO_KILL        ///< Termination request failed
        };

        static ProcessStopReason invalid_binding() { return ProcessStopReason(Kind::INVALID_BINDING); }
        static ProcessStopReason invalid_argument() { return ProcessStopReason(Kind::INVALID_ARGUMENT); }
        static ProcessStopReason firewall_blocked() { return ProcessStopReason(Kind::FIREWALL_BLOCKED); }
        static ProcessStopReason exited_successfully() { return ProcessStopReason(Kind::EXITED_SUCCESSFULLY); }
        static ProcessStopReason resetting() { return ProcessStopReason(Kind::RESETTING); }
        static ProcessStopReason failed_to_kill() { return ProcessStopReason(Kind::FAILED_TO_KILL); }
        static ProcessStopReason exited_with_error(std::optional<int> exit_code) {
            ProcessStopReason reason(Kind::EXITED_WITH_ERROR);
            reason.exit_code_ = exit_code;
            return reason;
        }

        [[nodiscard]] Kind kind() const { return kind_; }

        /**
         * @brief Exit code, only ever set for EXITED_WITH_ERROR
         */
        [[nodiscard]] std::optional<int> exit_code() const { return exit_code_; }

        /**
         * @brief Whether this reason was caused by bad operator input
         *
         * True for INVALID_BINDING, INVALID_ARGUMENT and FIREWALL_BLOCKED.
         */
        [[nodiscard]] bool is_operator_error() const {
            return kind_ == Kind::INVALID_BINDING ||
                   kind_ == Kind::INVALID_ARGUMENT ||
                   kind_ == Kind::FIREWALL_BLOCKED;
        }

        [[nodiscard]] std::string to_string() const;

        bool operator==(const ProcessStopReason& other) const {
            return kind_ == other.kind_ && exit_code_ == other.exit_code_;
        }
        bool operator!=(const ProcessStopReason& other) const { return !(*this == other); }

    private:
        explicit ProcessStopReason(Kind kind) : kind_(kind) {}

        Kind kind_;
        std::optional<int> exit_code_;
    };

    /**
     * @brief A peer connected to or disconnected from the worker
     *
     * Pairing of connect/disconnect is not guaranteed; consumers must
     * tolerate duplicates and orphan disconnects.
     */
    struct DeviceConnectionEvent {
        std::string peer_address;
        bool connected = false;

        bool operator==(const DeviceConnectionEvent& other) const {
            return peer_address == other.peer_address && connected == other.connected;
        }
    };

    /**
     * @brief Parameters for a single worker run
     *
     * bind_port != 0 and a non-empty bind_address are validated upstream.
     */
    struct ServerEndpointRequest {
        std::string bind_address;
        uint16_t bind_port = 0;
        uint32_t endpoint_id = 0;
        std::string encoding_key;
    };

} // namespace asmd

//
// Created by Sal Faris on 28/08/2026.
//

#include "asmd/process_stop_reason.hpp"

namespace asmd {

    std::string ProcessStopReason::to_string() const {
        switch (kind_) {
            case Kind::INVALID_BINDING:     return "InvalidBinding";
            case Kind::INVALID_ARGUMENT:    return "InvalidArgument";
            case Kind::FIREWALL_BLOCKED:    return "FirewallBlocked";
            case Kind::EXITED_SUCCESSFULLY: return "ExitedSuccessfully";
            case Kind::RESETTING:           return "Resetting";
            case Kind::EXITED_WITH_ERROR:
                if (exit_code_) {
                    return "ExitedWithError(" + std::to_string(*exit_code_) + ")";
                }
                return "ExitedWithError";
            case Kind::FAILED_TO_KILL:      return "FailedToKill";
            default:                        return "Unknown";
        }
    }

} // namespace asmd

//
// Created by opencode on 11/09/2026.
//

#include "asmd/presenter.hpp"

namespace asmd {

    Notification describe_stop_reason(const ProcessStopReason& reason) {
        const std::string check_address = "Please check the ip address and port then try again.";

        switch (reason.kind()) {
            case ProcessStopReason::Kind::INVALID_ARGUMENT:
                return {"Invalid Ip Address", check_address};
            case ProcessStopReason::Kind::INVALID_BINDING:
                return {"Cannot assign requested address", check_address};
            case ProcessStopReason::Kind::FIREWALL_BLOCKED:
                return {"Blocked by firewall",
                        "Allow TCP and UDP traffic to the server address and port, then try again."};
            case ProcessStopReason::Kind::EXITED_WITH_ERROR:
                if (reason.exit_code()) {
                    return {"Audio server stopped",
                            "The server exited with code " + std::to_string(*reason.exit_code()) + "."};
                }
                return {"Audio server stopped", "The server exited unexpectedly."};
            case ProcessStopReason::Kind::FAILED_TO_KILL:
                return {"Audio server did not stop", "The server process could not be terminated."};
            case ProcessStopReason::Kind::RESETTING:
                return {"Audio server reset", "The server was stopped to reset settings."};
            case ProcessStopReason::Kind::EXITED_SUCCESSFULLY:
            default:
                return {"Audio server stopped", "The server stopped."};
        }
    }

    ConsolePresenter::ConsolePresenter(std::ostream& out)
        : out_(out) {}

    void ConsolePresenter::show_error(const ProcessStopReason& reason) {
        Notification notification = describe_stop_reason(reason);
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[error] " << notification.title << ": " << notification.body << std::endl;
    }

    void ConsolePresenter::show_connection(const DeviceConnectionEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (event.connected) {
            out_ << "[device] Device connected: " << event.peer_address << std::endl;
        } else {
            out_ << "[device] Device disconnected: " << event.peer_address << std::endl;
        }
    }

    void ConsolePresenter::show_probe_result(bool reachable) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reachable) {
            out_ << "[probe] PASS: an inbound connection reached the server port" << std::endl;
        } else {
            out_ << "[probe] FAIL: no inbound connection reached the server port" << std::endl;
        }
    }

} // namespace asmd

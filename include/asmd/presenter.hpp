/**
 * @file presenter.hpp
 * @brief Presentation collaborator for user-facing notifications
 *
 * The lifecycle controller hands typed notifications to a Presenter; it
 * never formats user-facing text itself. ConsolePresenter is the headless
 * implementation used by the daemon; a desktop front-end would provide its
 * own (notifications, dialogs).
 */

#pragma once

#include <mutex>
#include <ostream>
#include <string>

#include "asmd/process_stop_reason.hpp"

namespace asmd {

    class Presenter {
    public:
        virtual ~Presenter() = default;

        /**
         * @brief A run ended for a reason the operator should see
         */
        virtual void show_error(const ProcessStopReason& reason) = 0;

        /**
         * @brief A device connected to or disconnected from the server
         */
        virtual void show_connection(const DeviceConnectionEvent& event) = 0;

        /**
         * @brief Pass/fail outcome of a firewall probe run
         */
        virtual void show_probe_result(bool reachable) = 0;
    };

    /**
     * @brief User-facing title/body for a stop reason
     */
    struct Notification {
        std::string title;
        std::string body;
    };

    Notification describe_stop_reason(const ProcessStopReason& reason);

    /**
     * @brief Writes notifications as text lines to a stream
     */
    class ConsolePresenter : public Presenter {
    public:
        explicit ConsolePresenter(std::ostream& out);

        void show_error(const ProcessStopReason& reason) override;
        void show_connection(const DeviceConnectionEvent& event) override;
        void show_probe_result(bool reachable) override;

    private:
        std::ostream& out_;
        std::mutex mutex_;
    };

} // namespace asmd

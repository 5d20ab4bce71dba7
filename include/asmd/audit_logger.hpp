/**
 * @file audit_logger.hpp
 * @brief Audit trail of operator intents, state transitions and outcomes
 *
 * Entries are appended to <logs dir>/audit.log (~/.audioshare/logs by
 * default) as:
 *   [2026-10-19 14:03:11] [STATE] IDLE -> STARTING
 */

#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace asmd {

    /**
     * @brief Categories of audit log entries
     */
    enum class AuditCategory {
        CMD,        // Operator intent received
        STATE,      // Lifecycle state transition
        ACTION,     // Action performed on the worker or probe
        ERROR,      // Error occurred
        SUCCESS,    // Successful operation
        INFO        // General information
    };

    /**
     * @brief Thread-safe append-only audit logger
     *
     * Used by the lifecycle controller and the control server. Components
     * below the controller log to the console only.
     */
    class AuditLogger {
    public:
        /**
         * @brief Opens <logs_dir>/audit.log in append mode
         *
         * Creates logs_dir if needed. If the file cannot be opened the
         * logger keeps retrying on each write and reports to stderr once.
         */
        explicit AuditLogger(std::filesystem::path logs_dir);

        ~AuditLogger();

        AuditLogger(const AuditLogger&) = delete;
        AuditLogger& operator=(const AuditLogger&) = delete;

        /**
         * @param intent The intent or command received
         * @param source Where it came from ("tcp_client", "startup", ...)
         */
        void log_command(const std::string& intent, const std::string& source);

        void log_state_transition(const std::string& from_state, const std::string& to_state);
        void log_action(const std::string& action, const std::string& details = "");
        void log_error(const std::string& error, const std::string& context = "");
        void log_success(const std::string& operation, const std::string& details = "");
        void log_info(const std::string& message);

        [[nodiscard]] std::filesystem::path get_log_path() const { return audit_log_path_; }

        /**
         * @brief Last `n` lines of the audit log
         */
        [[nodiscard]] std::string get_last_lines(size_t n = 50) const;

        /**
         * @brief Default directory: ~/.audioshare/logs
         */
        static std::filesystem::path default_logs_dir();

    private:
        std::filesystem::path logs_dir_;
        std::filesystem::path audit_log_path_;
        std::ofstream log_file_;
        bool open_failure_reported_ = false;
        mutable std::mutex mutex_;

        [[nodiscard]] static std::string get_timestamp();
        [[nodiscard]] static std::string category_to_string(AuditCategory category);

        void write_log(AuditCategory category, const std::string& message);
    };

} // namespace asmd

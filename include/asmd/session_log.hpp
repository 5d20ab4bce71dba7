/**
 * @file session_log.hpp
 * @brief Per-run worker log files with structured headers/footers
 *
 * Each supervised as-cmd run gets its own log file named:
 *   <timestamp>_<bind address>_<port>.log
 *
 * Layout:
 * - Header with start time, bind address, endpoint id, encoding key, binary
 * - Worker output section ("[out] ..." / "[err] ..." lines)
 * - Teardown footer with stop time and stop reason
 *
 * A SessionLog instance belongs to exactly one run; the supervisor hands it
 * to both reader threads, so all writes are serialized by a mutex.
 */

#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <cstdio>
#include <mutex>

#include "asmd/process_stop_reason.hpp"

namespace asmd {

    class SessionLog {
    public:
        /**
         * @brief Constructs a session log rooted at `logs_dir`
         *
         * Creates the directory if it doesn't exist.
         */
        explicit SessionLog(std::filesystem::path logs_dir);

        /**
         * @brief Closes the file without a footer if finalize() was never called
         */
        ~SessionLog();

        SessionLog(const SessionLog&) = delete;
        SessionLog& operator=(const SessionLog&) = delete;

        /**
         * @brief Creates the log file and writes the header
         *
         * @param request Parameters of the run being logged
         * @param worker_binary Path of the worker executable
         * @return Path to the created log file
         * @throws std::runtime_error if the file cannot be created
         */
        std::filesystem::path create_log(const ServerEndpointRequest& request,
                                         const std::filesystem::path& worker_binary);

        /**
         * @brief Appends one line of worker output
         *
         * @param stream "out" or "err"
         * @param line Line without trailing newline
         */
        void write_output(std::string_view stream, const std::string& line);

        /**
         * @brief Writes the teardown footer and closes the file
         *
         * Calling it more than once is a no-op.
         */
        void finalize(const std::string& stop_reason);

        [[nodiscard]] std::filesystem::path get_current_log_path() const { return current_log_path_; }

        [[nodiscard]] bool is_log_open() const;

    private:
        std::filesystem::path logs_dir_;
        std::filesystem::path current_log_path_;
        FILE* log_file_ = nullptr;
        mutable std::mutex mutex_;
    };

} // namespace asmd

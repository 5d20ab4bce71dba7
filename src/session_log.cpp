//
// Created by opencode on 02/09/2026.
//

#include "asmd/session_log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <algorithm>

namespace asmd {

    namespace {

        std::string format_local_time(std::chrono::system_clock::time_point when) {
            auto time_t_now = std::chrono::system_clock::to_time_t(when);
            std::tm local_time{};
            localtime_r(&time_t_now, &local_time);
            std::ostringstream time_stream;
            time_stream << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
            return time_stream.str();
        }

        const char* RULE =
            "================================================================================\n";

    } // namespace

    SessionLog::SessionLog(std::filesystem::path logs_dir)
        : logs_dir_(std::move(logs_dir)) {
        std::error_code ec;
        std::filesystem::create_directories(logs_dir_, ec);
    }

    SessionLog::~SessionLog() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_) {
            fclose(log_file_);
            log_file_ = nullptr;
        }
    }

    std::filesystem::path SessionLog::create_log(const ServerEndpointRequest& request,
                                                 const std::filesystem::path& worker_binary) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (log_file_) {
            fclose(log_file_);
            log_file_ = nullptr;
        }

        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
            now.time_since_epoch()).count();

        // IPv6 addresses carry colons; keep filenames portable
        std::string address_clean = request.bind_address;
        std::replace(address_clean.begin(), address_clean.end(), ':', '_');

        std::string filename = std::to_string(timestamp) + "_" + address_clean + "_" +
                               std::to_string(request.bind_port) + ".log";
        current_log_path_ = logs_dir_ / filename;

        log_file_ = fopen(current_log_path_.c_str(), "w");
        if (!log_file_) {
            throw std::runtime_error("Failed to create log file: " + current_log_path_.string());
        }

        // Line buffering so the file can be tailed while the worker runs
        setvbuf(log_file_, nullptr, _IOLBF, BUFSIZ);

        fprintf(log_file_, "%s", RULE);
        fprintf(log_file_, "AudioShare Worker Log\n");
        fprintf(log_file_, "%s", RULE);
        fprintf(log_file_, "Start Time: %s\n", format_local_time(now).c_str());
        fprintf(log_file_, "Unix Timestamp: %lld\n", static_cast<long long>(timestamp));
        fprintf(log_file_, "Bind Address: %s:%u\n", request.bind_address.c_str(),
                static_cast<unsigned>(request.bind_port));
        fprintf(log_file_, "Endpoint ID: %u\n", static_cast<unsigned>(request.endpoint_id));
        fprintf(log_file_, "Encoding: %s\n", request.encoding_key.c_str());
        fprintf(log_file_, "Worker Binary: %s\n", worker_binary.c_str());
        fprintf(log_file_, "\nProcess Output:\n");
        fprintf(log_file_, "%s", RULE);
        fflush(log_file_);

        return current_log_path_;
    }

    void SessionLog::write_output(std::string_view stream, const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!log_file_) {
            return;
        }
        fprintf(log_file_, "[%.*s] %s\n", static_cast<int>(stream.size()), stream.data(), line.c_str());
    }

    void SessionLog::finalize(const std::string& stop_reason) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!log_file_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
            now.time_since_epoch()).count();

        fprintf(log_file_, "\n%s", RULE);
        fprintf(log_file_, "AudioShare Worker Teardown\n");
        fprintf(log_file_, "%s", RULE);
        fprintf(log_file_, "Stop Time: %s\n", format_local_time(now).c_str());
        fprintf(log_file_, "Unix Timestamp: %lld\n", static_cast<long long>(timestamp));
        fprintf(log_file_, "Stop Reason: %s\n", stop_reason.c_str());
        fprintf(log_file_, "%s", RULE);
        fprintf(log_file_, "End of log\n");
        fprintf(log_file_, "%s", RULE);

        fclose(log_file_);
        log_file_ = nullptr;
    }

    bool SessionLog::is_log_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_file_ != nullptr;
    }

} // namespace asmd

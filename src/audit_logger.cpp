//
// Created by opencode on 14/09/2026.
//

#include "asmd/audit_logger.hpp"
#include "asmd/utils.hpp"
#include <array>
#include <chrono>
#include <ctime>
#include <deque>
#include <iostream>
#include <sstream>

namespace asmd {

    namespace {

        std::string joined(const std::string& head, const char* separator, const std::string& tail) {
            return tail.empty() ? head : head + separator + tail;
        }

    } // namespace

    AuditLogger::AuditLogger(std::filesystem::path logs_dir)
        : logs_dir_(std::move(logs_dir))
        , audit_log_path_(logs_dir_ / "audit.log") {
        std::error_code ec;
        std::filesystem::create_directories(logs_dir_, ec);
        if (ec) {
            std::cerr << "[AsDaemon] Failed to create log directory " << logs_dir_
                      << ": " << ec.message() << std::endl;
        }

        log_file_.open(audit_log_path_, std::ios::app);
        write_log(AuditCategory::INFO, "Audit logger initialized");
    }

    AuditLogger::~AuditLogger() {
        if (log_file_.is_open()) {
            write_log(AuditCategory::INFO, "Audit logger shutting down");
            log_file_.close();
        }
    }

    std::filesystem::path AuditLogger::default_logs_dir() {
        return get_state_dir() / "logs";
    }

    void AuditLogger::log_command(const std::string& intent, const std::string& source) {
        write_log(AuditCategory::CMD, joined("Intent received: " + intent, " from ", source));
    }

    void AuditLogger::log_state_transition(const std::string& from_state, const std::string& to_state) {
        write_log(AuditCategory::STATE, from_state + " -> " + to_state);
    }

    void AuditLogger::log_action(const std::string& action, const std::string& details) {
        write_log(AuditCategory::ACTION, joined(action, ": ", details));
    }

    void AuditLogger::log_error(const std::string& error, const std::string& context) {
        write_log(AuditCategory::ERROR, context.empty() ? error : "[" + context + "] " + error);
    }

    void AuditLogger::log_success(const std::string& operation, const std::string& details) {
        write_log(AuditCategory::SUCCESS, joined(operation, ": ", details));
    }

    void AuditLogger::log_info(const std::string& message) {
        write_log(AuditCategory::INFO, message);
    }

    std::string AuditLogger::get_last_lines(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream file(audit_log_path_);
        std::deque<std::string> tail;
        for (std::string line; std::getline(file, line);) {
            tail.push_back(std::move(line));
            if (tail.size() > n) {
                tail.pop_front();
            }
        }

        std::ostringstream out;
        for (const auto& line : tail) {
            out << line << '\n';
        }
        return out.str();
    }

    std::string AuditLogger::get_timestamp() {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local_time{};
        localtime_r(&now, &local_time);

        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_time);
        return buffer;
    }

    std::string AuditLogger::category_to_string(AuditCategory category) {
        static const std::array<const char*, 6> labels = {
            "[CMD]", "[STATE]", "[ACTION]", "[ERROR]", "[SUCCESS]", "[INFO]"
        };
        auto index = static_cast<size_t>(category);
        return index < labels.size() ? labels[index] : "[UNKNOWN]";
    }

    void AuditLogger::write_log(AuditCategory category, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!log_file_.is_open()) {
            log_file_.open(audit_log_path_, std::ios::app);
        }

        if (!log_file_.is_open()) {
            if (!open_failure_reported_) {
                std::cerr << "[AsDaemon] Failed to open audit log: " << audit_log_path_ << std::endl;
                open_failure_reported_ = true;
            }
            return;
        }
        if (open_failure_reported_) {
            std::cerr << "[AsDaemon] Audit log writable again: " << audit_log_path_ << std::endl;
            open_failure_reported_ = false;
        }

        log_file_ << '[' << get_timestamp() << "] " << category_to_string(category) << ' ' << message << std::endl;
    }

} // namespace asmd

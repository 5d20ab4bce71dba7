//
// Created by opencode on 02/09/2026.
//

#include "asmd/config_store.hpp"
#include "asmd/utils.hpp"
#include <arpa/inet.h>
#include <fstream>
#include <ifaddrs.h>
#include <iostream>
#include <limits>
#include <net/if.h>
#include <netinet/in.h>
#include <stdexcept>

namespace asmd {

    namespace {

        /**
         * @brief Reads an integer field, refusing values that do not fit in T
         *
         * @throws std::out_of_range if the stored number is outside T's range
         */
        template <typename T>
        T ranged_value(const nlohmann::json& j, const char* key, T fallback) {
            if (!j.contains(key)) {
                return fallback;
            }
            auto value = j.at(key).get<int64_t>();
            if (value < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                value > static_cast<int64_t>(std::numeric_limits<T>::max())) {
                throw std::out_of_range(std::string(key) + " out of range: " + std::to_string(value));
            }
            return static_cast<T>(value);
        }

    } // namespace

    void to_json(nlohmann::json& j, const AppConfig& config) {
        j = nlohmann::json{
            {"audio_endpoint", config.audio_endpoint},
            {"audio_encoding", config.audio_encoding},
            {"server_ip", config.server_ip},
            {"server_port", config.server_port},
            {"minimize_on_exit", config.minimize_on_exit},
            {"auto_start_server", config.auto_start_server},
            {"keep_last_state", config.keep_last_state},
            {"last_server_state", config.last_server_state},
            {"notification_error", config.notification_error},
            {"notification_device_connect", config.notification_device_connect},
            {"notification_device_disconnect", config.notification_device_disconnect}
        };
    }

    void from_json(const nlohmann::json& j, AppConfig& config) {
        // Missing keys keep whatever `config` already holds
        config.audio_endpoint = ranged_value(j, "audio_endpoint", config.audio_endpoint);
        config.audio_encoding = j.value("audio_encoding", config.audio_encoding);
        config.server_ip = j.value("server_ip", config.server_ip);
        config.server_port = ranged_value(j, "server_port", config.server_port);
        config.minimize_on_exit = j.value("minimize_on_exit", config.minimize_on_exit);
        config.auto_start_server = j.value("auto_start_server", config.auto_start_server);
        config.keep_last_state = j.value("keep_last_state", config.keep_last_state);
        config.last_server_state = j.value("last_server_state", config.last_server_state);
        config.notification_error = j.value("notification_error", config.notification_error);
        config.notification_device_connect =
            j.value("notification_device_connect", config.notification_device_connect);
        config.notification_device_disconnect =
            j.value("notification_device_disconnect", config.notification_device_disconnect);
    }

    std::optional<std::string> validate_config(const AppConfig& config) {
        if (config.server_ip.empty()) {
            return "server_ip cannot be empty";
        }
        if (config.server_port == 0) {
            return "server_port must be between 1 and 65535";
        }
        if (config.audio_encoding.empty()) {
            return "audio_encoding cannot be empty";
        }
        return std::nullopt;
    }

    std::string detect_local_ipv4() {
        ifaddrs* interfaces = nullptr;
        if (getifaddrs(&interfaces) != 0) {
            return "127.0.0.1";
        }

        std::string result = "127.0.0.1";
        for (ifaddrs* iface = interfaces; iface != nullptr; iface = iface->ifa_next) {
            if (!iface->ifa_addr || iface->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if (iface->ifa_flags & IFF_LOOPBACK) {
                continue;
            }

            char buffer[INET_ADDRSTRLEN];
            auto* addr = reinterpret_cast<sockaddr_in*>(iface->ifa_addr);
            if (inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer))) {
                result = buffer;
                break;
            }
        }

        freeifaddrs(interfaces);
        return result;
    }

    AppConfig default_config() {
        AppConfig config;
        config.server_ip = detect_local_ipv4();
        return config;
    }

    ConfigStore::ConfigStore()
        : config_path_(default_config_path()) {}

    ConfigStore::ConfigStore(std::filesystem::path config_path)
        : config_path_(std::move(config_path)) {}

    std::filesystem::path ConfigStore::default_config_path() {
        return get_config_dir() / "config.json";
    }

    AppConfig ConfigStore::load() {
        std::ifstream file(config_path_);
        if (!file.is_open()) {
            std::cout << "[AsDaemon] No config file found at " << config_path_
                      << ", creating one with defaults" << std::endl;
            AppConfig config = default_config();
            if (!save(config)) {
                std::cerr << "[AsDaemon] Continuing with unsaved defaults" << std::endl;
            }
            return config;
        }

        try {
            nlohmann::json j;
            file >> j;

            AppConfig config = default_config();
            from_json(j, config);

            if (auto error = validate_config(config)) {
                std::cerr << "[AsDaemon] Config validation failed: " << *error
                          << ". Using defaults" << std::endl;
                return default_config();
            }
            return config;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[AsDaemon] Config parse error: " << e.what() << ". Using defaults" << std::endl;
            return default_config();
        } catch (const std::out_of_range& e) {
            std::cerr << "[AsDaemon] Config value rejected: " << e.what() << ". Using defaults" << std::endl;
            return default_config();
        }
    }

    bool ConfigStore::save(const AppConfig& config) {
        std::error_code ec;
        if (config_path_.has_parent_path()) {
            std::filesystem::create_directories(config_path_.parent_path(), ec);
            if (ec) {
                std::cerr << "[AsDaemon] Failed to create config directory: " << ec.message() << std::endl;
                return false;
            }
        }

        std::ofstream file(config_path_, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "[AsDaemon] Failed to write config: " << config_path_ << std::endl;
            return false;
        }

        nlohmann::json j = config;
        file << j.dump(4) << std::endl;
        return file.good();
    }

} // namespace asmd

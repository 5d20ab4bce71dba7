/**
 * @file config_store.hpp
 * @brief Persistent application settings (JSON)
 *
 * The settings file lives at $XDG_CONFIG_HOME/audioshare/config.json
 * (or ~/.config/audioshare/config.json) and looks like:
 *
 *   {
 *     "audio_endpoint": 1,
 *     "audio_encoding": "opus",
 *     "server_ip": "192.168.1.10",
 *     "server_port": 65530,
 *     "minimize_on_exit": false,
 *     "auto_start_server": false,
 *     "keep_last_state": false,
 *     "last_server_state": false,
 *     "notification_error": true,
 *     "notification_device_connect": true,
 *     "notification_device_disconnect": false
 *   }
 *
 * Loading never fails: a missing file is created with defaults, and an
 * unparsable or invalid file falls back to defaults with a warning.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace asmd {

    struct AppConfig {
        uint32_t audio_endpoint = 0;             ///< Endpoint id passed to as-cmd -e
        std::string audio_encoding = "default";  ///< Encoding key passed to --encoding
        std::string server_ip = "127.0.0.1";
        uint16_t server_port = 65530;
        bool minimize_on_exit = false;
        bool auto_start_server = false;
        bool keep_last_state = false;
        bool last_server_state = false;          ///< Was the server running at last shutdown
        bool notification_error = true;
        bool notification_device_connect = true;
        bool notification_device_disconnect = false;
    };

    void to_json(nlohmann::json& j, const AppConfig& config);
    void from_json(const nlohmann::json& j, AppConfig& config);

    /**
     * @brief Checks the fields the daemon depends on
     *
     * @return Error message, or std::nullopt if the config is usable
     */
    std::optional<std::string> validate_config(const AppConfig& config);

    /**
     * @brief Defaults, with server_ip set to the first non-loopback IPv4 address
     */
    AppConfig default_config();

    /**
     * @brief First non-loopback IPv4 address of this host, or 127.0.0.1
     */
    std::string detect_local_ipv4();

    /**
     * @brief Configuration collaborator used by the lifecycle controller
     */
    class ConfigRepository {
    public:
        virtual ~ConfigRepository() = default;

        virtual AppConfig load() = 0;

        /**
         * @return true if the config was written
         */
        virtual bool save(const AppConfig& config) = 0;
    };

    /**
     * @brief JSON file backed ConfigRepository
     *
     * Usage:
     *   ConfigStore store;                 // default path
     *   AppConfig config = store.load();   // never throws
     *   config.server_port = 5000;
     *   store.save(config);
     */
    class ConfigStore : public ConfigRepository {
    public:
        ConfigStore();
        explicit ConfigStore(std::filesystem::path config_path);

        AppConfig load() override;
        bool save(const AppConfig& config) override;

        [[nodiscard]] std::filesystem::path get_config_path() const { return config_path_; }

        static std::filesystem::path default_config_path();

    private:
        std::filesystem::path config_path_;
    };

} // namespace asmd

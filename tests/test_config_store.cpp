/**
 * @file test_config_store.cpp
 * @brief Unit tests for the JSON config store
 */

#include "asmd/config_store.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <stdexcept>

using namespace asmd;
using asmd_test::TempDirTest;
namespace fs = std::filesystem;

class ConfigStoreTest : public TempDirTest {
protected:
    fs::path config_path() const { return temp_dir / "audioshare" / "config.json"; }

    void write_config(const std::string& content) {
        fs::create_directories(config_path().parent_path());
        std::ofstream file(config_path());
        file << content;
    }
};

// ============================================================
// load
// ============================================================

TEST_F(ConfigStoreTest, MissingFileIsCreatedWithDefaults) {
    ConfigStore store(config_path());

    AppConfig config = store.load();

    EXPECT_TRUE(fs::exists(config_path()));
    EXPECT_EQ(config.audio_endpoint, 0u);
    EXPECT_EQ(config.audio_encoding, "default");
    EXPECT_EQ(config.server_port, 65530);
    EXPECT_FALSE(config.server_ip.empty());
    EXPECT_FALSE(config.auto_start_server);
    EXPECT_TRUE(config.notification_error);
    EXPECT_TRUE(config.notification_device_connect);
    EXPECT_FALSE(config.notification_device_disconnect);
}

TEST_F(ConfigStoreTest, LoadsAllFields) {
    write_config(R"({
        "audio_endpoint": 3,
        "audio_encoding": "opus",
        "server_ip": "192.168.1.10",
        "server_port": 5000,
        "minimize_on_exit": true,
        "auto_start_server": true,
        "keep_last_state": true,
        "last_server_state": true,
        "notification_error": false,
        "notification_device_connect": false,
        "notification_device_disconnect": true
    })");

    AppConfig config = ConfigStore(config_path()).load();

    EXPECT_EQ(config.audio_endpoint, 3u);
    EXPECT_EQ(config.audio_encoding, "opus");
    EXPECT_EQ(config.server_ip, "192.168.1.10");
    EXPECT_EQ(config.server_port, 5000);
    EXPECT_TRUE(config.minimize_on_exit);
    EXPECT_TRUE(config.auto_start_server);
    EXPECT_TRUE(config.keep_last_state);
    EXPECT_TRUE(config.last_server_state);
    EXPECT_FALSE(config.notification_error);
    EXPECT_FALSE(config.notification_device_connect);
    EXPECT_TRUE(config.notification_device_disconnect);
}

TEST_F(ConfigStoreTest, MissingKeysTakeDefaults) {
    write_config(R"({"server_ip": "10.0.0.2"})");

    AppConfig config = ConfigStore(config_path()).load();

    EXPECT_EQ(config.server_ip, "10.0.0.2");
    EXPECT_EQ(config.server_port, 65530);
    EXPECT_EQ(config.audio_encoding, "default");
}

TEST_F(ConfigStoreTest, InvalidJsonFallsBackToDefaults) {
    write_config("{ not json");

    AppConfig config = ConfigStore(config_path()).load();

    EXPECT_EQ(config.server_port, 65530);
    EXPECT_EQ(config.audio_encoding, "default");
}

TEST_F(ConfigStoreTest, WrongTypeFallsBackToDefaults) {
    write_config(R"({"server_port": "not a number", "audio_endpoint": 9})");

    AppConfig config = ConfigStore(config_path()).load();

    EXPECT_EQ(config.server_port, 65530);
    EXPECT_EQ(config.audio_endpoint, 0u);
}

TEST_F(ConfigStoreTest, ValidationFailureFallsBackToDefaults) {
    write_config(R"({"server_port": 0, "audio_endpoint": 9})");

    AppConfig config = ConfigStore(config_path()).load();

    EXPECT_EQ(config.server_port, 65530);
    EXPECT_EQ(config.audio_endpoint, 0u);
}

TEST_F(ConfigStoreTest, OversizedPortFallsBackToDefaults) {
    write_config(R"({"server_port": 70000, "audio_endpoint": 9})");

    AppConfig config = ConfigStore(config_path()).load();

    EXPECT_EQ(config.server_port, 65530);
    EXPECT_EQ(config.audio_endpoint, 0u);
}

TEST_F(ConfigStoreTest, NegativeEndpointFallsBackToDefaults) {
    write_config(R"({"server_port": 5000, "audio_endpoint": -1})");

    AppConfig config = ConfigStore(config_path()).load();

    EXPECT_EQ(config.server_port, 65530);
    EXPECT_EQ(config.audio_endpoint, 0u);
}

TEST(ConfigJsonTest, FromJsonRejectsOutOfRangeNumbers) {
    AppConfig config;

    EXPECT_THROW(from_json(nlohmann::json{{"server_port", 70000}}, config), std::out_of_range);
    EXPECT_THROW(from_json(nlohmann::json{{"audio_endpoint", 4294967297LL}}, config), std::out_of_range);
    EXPECT_EQ(config.server_port, 65530);
}

// ============================================================
// save
// ============================================================

TEST_F(ConfigStoreTest, SaveThenLoadKeepsValues) {
    ConfigStore store(config_path());
    AppConfig config = default_config();
    config.server_ip = "192.168.0.50";
    config.server_port = 6000;
    config.audio_endpoint = 2;
    config.audio_encoding = "pcm";
    config.last_server_state = true;

    ASSERT_TRUE(store.save(config));
    AppConfig loaded = store.load();

    EXPECT_EQ(loaded.server_ip, "192.168.0.50");
    EXPECT_EQ(loaded.server_port, 6000);
    EXPECT_EQ(loaded.audio_endpoint, 2u);
    EXPECT_EQ(loaded.audio_encoding, "pcm");
    EXPECT_TRUE(loaded.last_server_state);
}

TEST_F(ConfigStoreTest, SaveWritesPrettyJson) {
    ConfigStore store(config_path());
    ASSERT_TRUE(store.save(default_config()));

    std::ifstream file(config_path());
    nlohmann::json j;
    file >> j;

    EXPECT_TRUE(j.contains("notification_device_disconnect"));
    EXPECT_EQ(j["server_port"], 65530);
}

// ============================================================
// validate_config
// ============================================================

TEST(ValidateConfigTest, DefaultsAreValid) {
    EXPECT_FALSE(validate_config(AppConfig{}).has_value());
}

TEST(ValidateConfigTest, RejectsEmptyFields) {
    AppConfig no_ip;
    no_ip.server_ip = "";
    AppConfig no_encoding;
    no_encoding.audio_encoding = "";

    EXPECT_TRUE(validate_config(no_ip).has_value());
    EXPECT_TRUE(validate_config(no_encoding).has_value());
}

TEST(DetectLocalIpv4Test, NeverEmpty) {
    EXPECT_FALSE(detect_local_ipv4().empty());
}

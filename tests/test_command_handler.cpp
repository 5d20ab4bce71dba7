/**
 * @file test_command_handler.cpp
 * @brief Tests for control-surface command parsing and JSON responses
 */

#include "asmd/command_handler.hpp"
#include "asmd/audit_logger.hpp"
#include "asmd/lifecycle_controller.hpp"
#include "asmd/tcp_server.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <sstream>

using namespace asmd;
using namespace std::chrono_literals;
using asmd_test::TempDirTest;
namespace fs = std::filesystem;

namespace {

    class MemoryConfigRepository : public ConfigRepository {
    public:
        AppConfig config;

        AppConfig load() override { return config; }

        bool save(const AppConfig& updated) override {
            config = updated;
            return true;
        }
    };

} // namespace

// ============================================================
// Parsing
// ============================================================

TEST(CommandParseTest, SplitsNameAndArgs) {
    auto parsed = CommandHandler::parse("start:192.168.1.10, 6000 ,2,opus\n");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->name, "start");
    std::vector<std::string> expected = {"192.168.1.10", "6000", "2", "opus"};
    EXPECT_EQ(parsed->args, expected);
}

TEST(CommandParseTest, NoArgs) {
    auto parsed = CommandHandler::parse("state:\r\n");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->name, "state");
    EXPECT_TRUE(parsed->args.empty());
}

TEST(CommandParseTest, MissingColonFails) {
    EXPECT_FALSE(CommandHandler::parse("state\n").has_value());
}

TEST(TcpFramingTest, ExtractsFirstLine) {
    auto [command, ok] = TCPServer::parse_command("stop:\nstate:\n");

    EXPECT_TRUE(ok);
    EXPECT_EQ(command, "stop:\n");
}

TEST(TcpFramingTest, IncompleteLineFails) {
    auto [command, ok] = TCPServer::parse_command("sta");

    EXPECT_FALSE(ok);
    EXPECT_TRUE(command.empty());
}

// ============================================================
// Execution
// ============================================================

class CommandHandlerTest : public TempDirTest {
protected:
    MemoryConfigRepository config_repo;
    std::ostringstream presenter_output;
    std::unique_ptr<ConsolePresenter> presenter;
    std::unique_ptr<AuditLogger> audit_logger;
    std::unique_ptr<FirewallProbe> probe;
    std::unique_ptr<ServerSupervisor> supervisor;
    std::unique_ptr<LifecycleController> controller;
    std::unique_ptr<CommandHandler> handler;

    void SetUp() override {
        TempDirTest::SetUp();
        config_repo.config.server_ip = "127.0.0.1";
        config_repo.config.server_port = 65530;
        config_repo.config.audio_endpoint = 1;
        config_repo.config.audio_encoding = "opus";

        presenter = std::make_unique<ConsolePresenter>(presenter_output);
        audit_logger = std::make_unique<AuditLogger>(temp_dir / "logs");
        probe = std::make_unique<FirewallProbe>(100ms, 10ms);
        supervisor = std::make_unique<ServerSupervisor>(write_worker("as-cmd", "sleep 30"));
        controller = std::make_unique<LifecycleController>(*supervisor, *probe, config_repo, *presenter,
                                                           audit_logger.get());
        handler = std::make_unique<CommandHandler>(*controller, audit_logger.get());
    }

    void TearDown() override {
        handler.reset();
        controller.reset();
        supervisor.reset();
        probe.reset();
        audit_logger.reset();
        TempDirTest::TearDown();
    }
};

TEST_F(CommandHandlerTest, UnknownCommand) {
    auto response = handler->execute("fly:\n");

    EXPECT_EQ(response["CMD"], "fly");
    EXPECT_TRUE(response["result"].is_null());
    EXPECT_EQ(response["error"], "Unknown command: fly");
}

TEST_F(CommandHandlerTest, ParsingError) {
    auto response = handler->execute("state\n");

    EXPECT_EQ(response["CMD"], "unknown");
    EXPECT_FALSE(response["error"].is_null());
}

TEST_F(CommandHandlerTest, StateWhenIdle) {
    auto response = handler->execute("state:\n");

    EXPECT_TRUE(response["error"].is_null());
    EXPECT_EQ(response["result"]["state"], "IDLE");
    EXPECT_EQ(response["result"]["running"], false);
    EXPECT_TRUE(response["result"]["request"].is_null());
    EXPECT_EQ(response["result"]["selection"]["encoding"], "opus");
}

TEST_F(CommandHandlerTest, StartWithConfigThenStop) {
    auto start = handler->execute("start:\n");

    ASSERT_TRUE(start["error"].is_null()) << start.dump();
    EXPECT_EQ(start["result"]["request"]["port"], 65530);

    auto state = handler->execute("state:\n");
    EXPECT_EQ(state["result"]["state"], "RUNNING");
    EXPECT_EQ(state["result"]["running"], true);

    auto stop = handler->execute("stop:\n");
    EXPECT_TRUE(stop["error"].is_null());
    EXPECT_EQ(stop["result"]["status"], "stopping");
}

TEST_F(CommandHandlerTest, StartWithExplicitRequest) {
    auto response = handler->execute("start:127.0.0.1,6000,3,pcm\n");

    ASSERT_TRUE(response["error"].is_null()) << response.dump();
    EXPECT_EQ(response["result"]["request"]["ip"], "127.0.0.1");
    EXPECT_EQ(response["result"]["request"]["port"], 6000);
    EXPECT_EQ(response["result"]["request"]["endpoint"], 3);
    EXPECT_EQ(response["result"]["request"]["encoding"], "pcm");
}

TEST_F(CommandHandlerTest, StartWithTooFewArgs) {
    auto response = handler->execute("start:127.0.0.1,6000\n");

    EXPECT_TRUE(response["result"].is_null());
    EXPECT_FALSE(response["error"].is_null());
    EXPECT_FALSE(controller->is_server_running());
}

TEST_F(CommandHandlerTest, BadPortIsReportedAsError) {
    auto zero = handler->execute("start:127.0.0.1,0,1,opus\n");
    auto text = handler->execute("probe:127.0.0.1,http\n");

    EXPECT_FALSE(zero["error"].is_null());
    EXPECT_FALSE(text["error"].is_null());
    EXPECT_FALSE(controller->is_server_running());
}

TEST_F(CommandHandlerTest, RejectionsBecomeErrors) {
    ASSERT_TRUE(handler->execute("start:\n")["error"].is_null());

    auto second = handler->execute("start:\n");
    auto probe_response = handler->execute("probe:\n");

    EXPECT_EQ(second["error"], controller_error_to_string(ControllerError::ALREADY_RUNNING));
    EXPECT_EQ(probe_response["error"], controller_error_to_string(ControllerError::SERVER_RUNNING));
}

TEST_F(CommandHandlerTest, StopWhenIdleIsError) {
    auto response = handler->execute("stop:\n");

    EXPECT_EQ(response["error"], controller_error_to_string(ControllerError::NOT_RUNNING));
}

TEST_F(CommandHandlerTest, SelectUpdatesSelection) {
    auto response = handler->execute("select:4,aac\n");

    ASSERT_TRUE(response["error"].is_null()) << response.dump();
    EXPECT_EQ(response["result"]["restarted"], false);
    EXPECT_EQ(controller->get_selection().endpoint_id, 4u);
    EXPECT_EQ(controller->get_selection().encoding_key, "aac");
}

TEST_F(CommandHandlerTest, ResetReloadsSelection) {
    handler->execute("select:4,aac\n");
    ASSERT_TRUE(handler->execute("start:\n")["error"].is_null());

    auto response = handler->execute("reset:\n");

    ASSERT_TRUE(response["error"].is_null());
    EXPECT_EQ(response["result"]["server_reset"], true);
    EXPECT_EQ(response["result"]["endpoint"], 1);
    EXPECT_FALSE(controller->is_server_running());
}

TEST_F(CommandHandlerTest, ProbeStartsProbe) {
    auto response = handler->execute("probe:127.0.0.1,0\n");
    EXPECT_FALSE(response["error"].is_null());

    response = handler->execute("probe:\n");
    EXPECT_TRUE(response["error"].is_null()) << response.dump();
    EXPECT_EQ(response["result"]["status"], "probing");
}

TEST_F(CommandHandlerTest, WhoAmI) {
    auto response = handler->execute("whoami:\n");

    EXPECT_EQ(response["result"]["version"], ASMD_VERSION);
    EXPECT_EQ(response["result"]["implementation"], "C++");
}

TEST_F(CommandHandlerTest, LogsReturnsAuditTail) {
    handler->execute("stop:\n");

    auto response = handler->execute("logs:5\n");

    ASSERT_TRUE(response["error"].is_null());
    std::string lines = response["result"]["lines"];
    EXPECT_NE(lines.find("Intent received: stop"), std::string::npos);
}

TEST_F(CommandHandlerTest, EndpointOutOfRangeIsRejected) {
    auto negative = handler->execute("select:-1,opus\n");
    auto oversized = handler->execute("start:127.0.0.1,6000,4294967297,opus\n");

    EXPECT_EQ(negative["error"], "Invalid endpoint: -1");
    EXPECT_EQ(oversized["error"], "Invalid endpoint: 4294967297");
    EXPECT_EQ(controller->get_selection().endpoint_id, 1u);
    EXPECT_FALSE(controller->is_server_running());
}

TEST_F(CommandHandlerTest, PortMustBeWholeNumberInRange) {
    EXPECT_EQ(handler->execute("probe:127.0.0.1,-1\n")["error"], "Invalid port: -1");
    EXPECT_EQ(handler->execute("probe:127.0.0.1,65536\n")["error"], "Invalid port: 65536");
    EXPECT_EQ(handler->execute("probe:127.0.0.1,80x\n")["error"], "Invalid port: 80x");
    EXPECT_FALSE(controller->is_probe_running());
}

TEST_F(CommandHandlerTest, ResetServerKeepsSelection) {
    handler->execute("select:4,aac\n");
    ASSERT_TRUE(handler->execute("start:\n")["error"].is_null());

    auto response = handler->execute("reset-server:\n");

    ASSERT_TRUE(response["error"].is_null()) << response.dump();
    EXPECT_EQ(response["result"]["status"], "resetting");
    EXPECT_FALSE(controller->is_server_running());
    EXPECT_EQ(controller->get_selection().endpoint_id, 4u);
    EXPECT_EQ(handler->execute("reset-server:\n")["error"],
              controller_error_to_string(ControllerError::NOT_RUNNING));
}

TEST_F(CommandHandlerTest, ProbeStopCancelsRunningProbe) {
    handler.reset();
    controller.reset();
    probe = std::make_unique<FirewallProbe>(5000ms, 10ms);
    controller = std::make_unique<LifecycleController>(*supervisor, *probe, config_repo, *presenter,
                                                       audit_logger.get());
    handler = std::make_unique<CommandHandler>(*controller, audit_logger.get());
    ASSERT_TRUE(handler->execute("probe:\n")["error"].is_null());

    auto response = handler->execute("probe-stop:\n");

    ASSERT_TRUE(response["error"].is_null()) << response.dump();
    EXPECT_FALSE(controller->is_probe_running());
    EXPECT_EQ(controller->process_events(std::chrono::milliseconds(200)), 0u);
    EXPECT_EQ(presenter_output.str().find("[probe]"), std::string::npos);
    EXPECT_EQ(handler->execute("probe-stop:\n")["error"],
              controller_error_to_string(ControllerError::NOT_RUNNING));
}

TEST_F(CommandHandlerTest, StartOutcomeIsAudited) {
    ASSERT_TRUE(handler->execute("start:\n")["error"].is_null());

    std::string lines = handler->execute("logs:20\n")["result"]["lines"];

    EXPECT_NE(lines.find("Supervisor start: STARTED"), std::string::npos);
}

/**
 * @file test_tcp_server.cpp
 * @brief Tests for the control server's client handling and shutdown
 */

#include "asmd/tcp_server.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <sockpp/inet_address.h>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_connector.h>

using namespace asmd;
using namespace std::chrono_literals;
using asmd_test::wait_until;

namespace {

    uint16_t free_port() {
        sockpp::tcp_acceptor acceptor;
        if (!acceptor.open(sockpp::inet_address("127.0.0.1", 0))) {
            return 0;
        }
        return acceptor.address().port();
    }

    bool connect_to(sockpp::tcp_connector& client, uint16_t port) {
        return wait_until([&client, port] {
            client = sockpp::tcp_connector();
            return client.connect(sockpp::inet_address("127.0.0.1", port)).is_ok();
        }, 2000ms);
    }

    /**
     * @brief Reads up to a newline; returns what was read on EOF or error
     */
    std::string read_line(sockpp::tcp_connector& client) {
        std::string line;
        char c;
        while (true) {
            auto result = client.read(&c, 1);
            if (!result.is_ok() || result.value() == 0 || c == '\n') {
                return line;
            }
            line += c;
        }
    }

    nlohmann::json echo(const std::string& command) {
        return {{"CMD", command.substr(0, command.find(':'))}, {"result", nullptr}, {"error", nullptr}};
    }

} // namespace

class TcpServerTest : public ::testing::Test {
protected:
    uint16_t port = 0;
    std::atomic<int> calls{0};
    std::unique_ptr<TCPServer> server;
    std::thread server_thread;

    void SetUp() override {
        port = free_port();
        ASSERT_NE(port, 0);
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }

    void run(TCPServer::Handler handler) {
        server = std::make_unique<TCPServer>(std::move(handler), port);
        server_thread = std::thread([this] { server->start(); });
    }
};

TEST_F(TcpServerTest, AnswersEachCommandOnItsOwnLine) {
    run([this](const std::string& command) {
        ++calls;
        return echo(command);
    });
    sockpp::tcp_connector client;
    ASSERT_TRUE(connect_to(client, port));
    ASSERT_TRUE(client.read_timeout(2s).is_ok());

    ASSERT_TRUE(client.write(std::string("state:\nwhoami:\n")).is_ok());

    EXPECT_EQ(nlohmann::json::parse(read_line(client))["CMD"], "state");
    EXPECT_EQ(nlohmann::json::parse(read_line(client))["CMD"], "whoami");
    EXPECT_EQ(calls.load(), 2);
}

TEST_F(TcpServerTest, StopDisconnectsIdleClients) {
    run([this](const std::string& command) {
        ++calls;
        return echo(command);
    });
    sockpp::tcp_connector client;
    ASSERT_TRUE(connect_to(client, port));
    ASSERT_TRUE(client.read_timeout(2s).is_ok());
    ASSERT_TRUE(client.write(std::string("state:\n")).is_ok());
    ASSERT_FALSE(read_line(client).empty());

    server->stop();
    server_thread.join();

    // EOF rather than a read timeout: the server closed its side
    char byte;
    auto result = client.read(&byte, 1);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 0u);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(TcpServerTest, StopWaitsForCommandInProgress) {
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    run([&](const std::string& command) {
        entered = true;
        std::this_thread::sleep_for(200ms);
        finished = true;
        return echo(command);
    });
    sockpp::tcp_connector client;
    ASSERT_TRUE(connect_to(client, port));
    ASSERT_TRUE(client.write(std::string("stop:\n")).is_ok());
    ASSERT_TRUE(wait_until([&entered] { return entered.load(); }, 2000ms));

    server->stop();

    EXPECT_TRUE(finished.load());
    server_thread.join();
}

TEST_F(TcpServerTest, StopBeforeStartReturnsPromptly) {
    server = std::make_unique<TCPServer>(echo, port);
    server->stop();

    EXPECT_TRUE(server->start());
    EXPECT_FALSE(server->is_running());
}

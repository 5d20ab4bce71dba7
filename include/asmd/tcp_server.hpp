/**
 * @file tcp_server.hpp
 * @brief Localhost control surface for the AudioShare daemon
 *
 * This header provides a TCP server that:
 * - Listens on 127.0.0.1 (port 23889 unless configured)
 * - Accepts client connections
 * - Parses incoming commands (CMD:ARGS\n format)
 * - Dispatches to CommandHandler
 * - Returns JSON responses
 *
 * Protocol details:
 * - Message format: CMD:ARG1,ARG2,...\n
 * - Response format: {"CMD": "...", "result": {...}, "error": null}\n
 * - Commands with no args still require colon: CMD:\n
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_socket.h>
#include <nlohmann/json.hpp>

namespace asmd {

    /**
     * @brief TCP server wrapping sockpp's acceptor
     *
     * Each client connection runs in its own thread, owned by the server.
     * start() blocks until stop() closes the acceptor. stop() also shuts
     * down every client socket and joins its thread, so the handler is
     * never called after stop() returns.
     *
     * Usage:
     *   TCPServer server([&](const std::string& cmd) { return handler.execute(cmd); });
     *   std::thread t([&] { server.start(); });
     *   ...
     *   server.stop();
     */
    class TCPServer {
    public:
        static constexpr uint16_t DEFAULT_PORT = 23889;

        using Handler = std::function<nlohmann::json(const std::string&)>;

        explicit TCPServer(Handler command_handler, uint16_t port = DEFAULT_PORT);

        /**
         * @brief Closes the acceptor socket
         */
        ~TCPServer();

        TCPServer(const TCPServer&) = delete;
        TCPServer& operator=(const TCPServer&) = delete;

        /**
         * @brief Binds 127.0.0.1:port and accepts until stop()
         *
         * @return false if the socket could not be bound
         */
        bool start();

        /**
         * @brief Closes the acceptor, disconnects clients and joins their threads
         *
         * Must not be called from inside the handler.
         */
        void stop();

        [[nodiscard]] uint16_t get_port() const { return port_; }

        [[nodiscard]] bool is_running() const { return running_; }

        /**
         * @brief Extracts the first newline-terminated command from `data`
         *
         * @return std::pair<std::string, bool> (command, success)
         *         If no newline is present, returns ("", false)
         */
        static std::pair<std::string, bool> parse_command(const std::string& data);

    private:
        uint16_t port_;
        sockpp::tcp_acceptor acceptor_;
        Handler on_recv_;
        std::atomic<bool> running_{false};
        std::atomic<bool> stop_requested_{false};  ///< stop() may run before start() binds

        struct ClientSession {
            sockpp::tcp_socket socket;
            std::thread thread;
            bool finished = false;  ///< Guarded by clients_mutex_; socket already closed
        };

        std::mutex clients_mutex_;
        std::list<std::unique_ptr<ClientSession>> clients_;

        /**
         * @brief Joins and drops sessions whose client has gone. Caller holds clients_mutex_
         */
        void reap_finished_clients_locked();

        void process_client(ClientSession& session);
    };

} // namespace asmd

//
// Created by opencode on 14/09/2026.
//

#include "asmd/tcp_server.hpp"
#include <sockpp/inet_address.h>
#include <iostream>
#include <thread>

namespace asmd {

    TCPServer::TCPServer(Handler command_handler, uint16_t port)
        : port_(port)
        , on_recv_(std::move(command_handler)) {}

    TCPServer::~TCPServer() {
        stop();
    }

    bool TCPServer::start() {
        sockpp::inet_address addr("127.0.0.1", port_);

        auto open_result = acceptor_.open(addr, 5, sockpp::tcp_acceptor::REUSE);
        if (!open_result) {
            std::cerr << "[AsDaemon] Failed to bind control port " << port_
                      << ": " << open_result.error_message() << std::endl;
            return false;
        }

        std::cout << "[AsDaemon] Control server listening on 127.0.0.1:" << port_ << std::endl;

        running_ = true;
        if (stop_requested_) {
            running_ = false;
            acceptor_.close();
            return true;
        }

        while (running_) {
            auto client = acceptor_.accept();

            if (!client.is_ok()) {
                if (running_) {
                    std::cerr << "[AsDaemon] Failed to accept client: " << client.error_message() << std::endl;
                }
                continue;
            }

            std::lock_guard<std::mutex> lock(clients_mutex_);
            reap_finished_clients_locked();
            if (stop_requested_) {
                // stop() has already drained the sessions; the socket closes here
                break;
            }

            auto session = std::make_unique<ClientSession>();
            session->socket = client.release();
            ClientSession& added = *session;
            clients_.push_back(std::move(session));
            added.thread = std::thread(&TCPServer::process_client, this, std::ref(added));
        }
        return true;
    }

    void TCPServer::stop() {
        stop_requested_ = true;
        running_ = false;
        if (acceptor_.is_open()) {
            acceptor_.shutdown();
            acceptor_.close();
        }

        std::list<std::unique_ptr<ClientSession>> sessions;
        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            for (auto& session : clients_) {
                if (session->finished) {
                    continue;
                }
                // Wakes a blocked read; the thread then exits on its own
                auto shutdown_result = session->socket.shutdown();
                if (!shutdown_result) {
                    std::cerr << "[AsDaemon] Failed to shut down client socket: "
                              << shutdown_result.error_message() << std::endl;
                }
            }
            sessions.swap(clients_);
        }

        for (auto& session : sessions) {
            if (session->thread.joinable()) {
                session->thread.join();
            }
        }
    }

    void TCPServer::reap_finished_clients_locked() {
        for (auto it = clients_.begin(); it != clients_.end();) {
            if ((*it)->finished) {
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void TCPServer::process_client(ClientSession& session) {
        sockpp::tcp_socket& client = session.socket;
        char buffer[4096];
        std::string pending;
        bool connected = true;

        while (connected && !stop_requested_) {
            auto read_result = client.read(buffer, sizeof(buffer));
            if (!read_result.is_ok() || read_result.value() == 0) {
                break;
            }

            pending.append(buffer, read_result.value());

            // A request may arrive split across reads, or several in one
            while (connected && !stop_requested_) {
                auto [command, success] = parse_command(pending);
                if (!success) {
                    break;
                }
                pending.erase(0, command.size());

                nlohmann::json response = on_recv_(command);
                if (stop_requested_) {
                    // The socket is already shut down
                    break;
                }
                auto write_result = client.write(response.dump() + "\n");
                if (!write_result.is_ok()) {
                    std::cerr << "[AsDaemon] Failed to send response: " << write_result.error_message() << std::endl;
                    connected = false;
                }
            }

            if (connected && pending.size() > sizeof(buffer)) {
                nlohmann::json response = {
                    {"CMD", "unknown"},
                    {"result", nullptr},
                    {"error", "Newline not found"}
                };
                auto write_result = client.write(response.dump() + "\n");
                if (!write_result.is_ok()) {
                    std::cerr << "[AsDaemon] Failed to send response: " << write_result.error_message() << std::endl;
                }
                connected = false;
            }
        }

        // stop() only shuts down sockets that are not yet finished
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto close_result = client.close();
        if (!close_result) {
            std::cerr << "[AsDaemon] Failed to close client socket: " << close_result.error_message() << std::endl;
        }
        session.finished = true;
    }

    std::pair<std::string, bool> TCPServer::parse_command(const std::string& data) {
        size_t newline_pos = data.find('\n');
        if (newline_pos == std::string::npos) {
            return {"", false};
        }
        return {data.substr(0, newline_pos + 1), true};
    }

} // namespace asmd

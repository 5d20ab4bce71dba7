//
// Created by Sal Faris on 31/08/2026.
//

#include "asmd/server_supervisor.hpp"
#include "asmd/log_classifier.hpp"
#include "asmd/network_policy.hpp"
#include "asmd/session_log.hpp"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>

namespace asmd {

    namespace {

        using FilePtr = std::unique_ptr<FILE, decltype(&fclose)>;

        /**
         * @brief Both ends of a close-on-exec pipe, closed on destruction
         */
        struct Pipe {
            int read_end = -1;
            int write_end = -1;

            bool open() {
                int fds[2];
                if (pipe2(fds, O_CLOEXEC) != 0) {
                    return false;
                }
                read_end = fds[0];
                write_end = fds[1];
                return true;
            }

            void close_write() {
                if (write_end >= 0) {
                    ::close(write_end);
                    write_end = -1;
                }
            }

            int release_read() {
                int fd = read_end;
                read_end = -1;
                return fd;
            }

            ~Pipe() {
                if (read_end >= 0) {
                    ::close(read_end);
                }
                close_write();
            }
        };

        /**
         * @brief Calls on_line for every line of `file` until EOF or it returns false
         */
        template <typename Fn>
        void for_each_line(FILE* file, Fn&& on_line) {
            char* buffer = nullptr;
            size_t capacity = 0;

            while (true) {
                ssize_t length = ::getline(&buffer, &capacity, file);
                if (length == -1) {
                    if (ferror(file) && errno == EINTR) {
                        clearerr(file);
                        continue;
                    }
                    break;
                }

                std::string line(buffer, static_cast<size_t>(length));
                while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                    line.pop_back();
                }

                if (!on_line(line)) {
                    break;
                }
            }

            free(buffer);
        }

        std::string describe_exit_status(int status) {
            if (WIFEXITED(status)) {
                return "exited with code " + std::to_string(WEXITSTATUS(status));
            }
            if (WIFSIGNALED(status)) {
                return "terminated by signal " + std::to_string(WTERMSIG(status));
            }
            return "changed state (" + std::to_string(status) + ")";
        }

    } // namespace

    ServerSupervisor::ServerSupervisor(std::filesystem::path worker_binary,
                                       std::shared_ptr<NetworkPolicy> policy,
                                       std::filesystem::path session_logs_dir)
        : worker_binary_(std::move(worker_binary))
        , policy_(std::move(policy))
        , session_logs_dir_(std::move(session_logs_dir))
        , stop_channel_(std::nullopt)
        , device_channel_(DEVICE_EVENT_CAPACITY) {}

    ServerSupervisor::~ServerSupervisor() {
        stop();

        std::vector<ReaderThread> readers;
        {
            std::lock_guard<std::mutex> lock(readers_mutex_);
            readers.swap(readers_);
        }

        // The worker is dead, so both streams reach EOF
        for (auto& reader : readers) {
            if (reader.thread.joinable()) {
                reader.thread.join();
            }
        }
    }

    std::vector<std::string> ServerSupervisor::build_arguments(const ServerEndpointRequest& request) {
        return {
            "--bind=" + request.bind_address + ":" + std::to_string(request.bind_port),
            "-e",
            std::to_string(request.endpoint_id),
            "--encoding",
            request.encoding_key
        };
    }

    StartOutcome ServerSupervisor::start(const ServerEndpointRequest& request) {
        reap_finished_readers();

        std::lock_guard<std::mutex> lock(run_mutex_);

        if (state_.running || state_.child) {
            std::cout << "[AsDaemon] Worker already running, ignoring start request" << std::endl;
            return StartOutcome::ALREADY_RUNNING;
        }

        if (policy_ && !policy_->allows(request.bind_address, request.bind_port)) {
            std::cout << "[AsDaemon] Firewall blocks " << request.bind_address << ":"
                      << request.bind_port << ", worker not started" << std::endl;
            stop_channel_.send(ProcessStopReason::firewall_blocked());
            return StartOutcome::FIREWALL_BLOCKED;
        }

        std::cout << "[AsDaemon] Starting worker: bind " << request.bind_address << ":"
                  << request.bind_port << ", endpoint " << request.endpoint_id
                  << ", encoding " << request.encoding_key << std::endl;

        std::shared_ptr<SessionLog> session;
        if (!session_logs_dir_.empty()) {
            session = std::make_shared<SessionLog>(session_logs_dir_);
            try {
                session->create_log(request, worker_binary_);
            } catch (const std::exception& e) {
                std::cerr << "[AsDaemon] Session log disabled for this run: " << e.what() << std::endl;
                session.reset();
            }
        }

        pid_t pid = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
        std::string error;

        if (!spawn_worker(request, pid, stdout_fd, stderr_fd, error)) {
            std::cerr << "[AsDaemon] Failed to start worker: " << error << std::endl;
            if (session) {
                session->finalize("Spawn failed: " + error);
            }
            state_.running = false;
            return StartOutcome::SPAWN_FAILED;
        }

        uint64_t run_id = ++state_.run_id;
        state_.child = ChildProcess{pid, run_id, request};
        state_.running = true;

        // A new run clears the previous terminal value
        stop_channel_.send(std::nullopt);

        try {
            launch_reader(&ServerSupervisor::read_stdout, stdout_fd, run_id, session);
        } catch (const std::system_error& e) {
            std::cerr << "[AsDaemon] Failed to start reader threads: " << e.what() << std::endl;
            ::close(stderr_fd);
            terminate_locked("reader launch");
            clear_locked();
            return StartOutcome::SPAWN_FAILED;
        }

        try {
            launch_reader(&ServerSupervisor::read_stderr, stderr_fd, run_id, session);
        } catch (const std::system_error& e) {
            std::cerr << "[AsDaemon] Failed to start reader threads: " << e.what() << std::endl;
            terminate_locked("reader launch");
            clear_locked();
            return StartOutcome::SPAWN_FAILED;
        }

        std::cout << "[AsDaemon] Worker started with PID " << pid << std::endl;
        return StartOutcome::STARTED;
    }

    void ServerSupervisor::stop() {
        std::lock_guard<std::mutex> lock(run_mutex_);

        if (state_.child) {
            std::cout << "[AsDaemon] Stopping worker PID " << state_.child->pid << std::endl;
            terminate_locked("stop");
        }

        clear_locked();
    }

    void ServerSupervisor::reset() {
        std::lock_guard<std::mutex> lock(run_mutex_);

        if (state_.child) {
            std::cout << "[AsDaemon] Resetting worker PID " << state_.child->pid << std::endl;
            terminate_locked("reset");
        }

        clear_locked();
        stop_channel_.send(ProcessStopReason::resetting());
    }

    bool ServerSupervisor::is_running() const {
        std::lock_guard<std::mutex> lock(run_mutex_);
        return state_.running;
    }

    std::optional<pid_t> ServerSupervisor::get_pid() const {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (!state_.child) {
            return std::nullopt;
        }
        return state_.child->pid;
    }

    std::optional<ServerEndpointRequest> ServerSupervisor::current_request() const {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (!state_.child) {
            return std::nullopt;
        }
        return state_.child->request;
    }

    ServerSupervisor::StopReceiver ServerSupervisor::subscribe_stop_event() const {
        return stop_channel_.subscribe();
    }

    ServerSupervisor::DeviceReceiver ServerSupervisor::subscribe_device_event() {
        return device_channel_.subscribe();
    }

    bool ServerSupervisor::spawn_worker(const ServerEndpointRequest& request,
                                        pid_t& pid, int& stdout_fd, int& stderr_fd,
                                        std::string& error) {
        // Everything the child needs is prepared before fork()
        std::string program = worker_binary_.string();
        std::vector<std::string> args = build_arguments(request);
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program.c_str()));
        for (auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        Pipe out_pipe;
        Pipe err_pipe;
        Pipe exec_pipe;
        if (!out_pipe.open() || !err_pipe.open() || !exec_pipe.open()) {
            error = std::string("pipe: ") + strerror(errno);
            return false;
        }

        pid_t child = fork();

        if (child < 0) {
            error = std::string("fork: ") + strerror(errno);
            return false;
        }

        if (child == 0) {
            // Own process group so the whole worker tree can be killed at once
            setpgid(0, 0);

            int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
            }
            dup2(out_pipe.write_end, STDOUT_FILENO);
            dup2(err_pipe.write_end, STDERR_FILENO);

            execv(program.c_str(), argv.data());

            // exec failed, report errno to the parent
            int exec_errno = errno;
            ssize_t written = write(exec_pipe.write_end, &exec_errno, sizeof(exec_errno));
            (void)written;
            _exit(127);
        }

        // Parent process
        setpgid(child, child);
        out_pipe.close_write();
        err_pipe.close_write();
        exec_pipe.close_write();

        int child_errno = 0;
        ssize_t n;
        do {
            n = read(exec_pipe.read_end, &child_errno, sizeof(child_errno));
        } while (n == -1 && errno == EINTR);

        if (n > 0) {
            error = "exec " + program + ": " + strerror(child_errno);
            int status = 0;
            pid_t result;
            do {
                result = waitpid(child, &status, 0);
            } while (result == -1 && errno == EINTR);
            return false;
        }

        pid = child;
        stdout_fd = out_pipe.release_read();
        stderr_fd = err_pipe.release_read();
        return true;
    }

    void ServerSupervisor::terminate_locked(const char* context) {
        if (!state_.child) {
            return;
        }

        pid_t pid = state_.child->pid;

        if (kill(-pid, SIGKILL) != 0) {
            int kill_errno = errno;
            if (kill_errno != ESRCH) {
                // Reported as FailedToKill in the log only; callers still reset to idle
                std::cerr << "[AsDaemon] Failed to kill worker PID " << pid << " (" << context
                          << "): " << strerror(kill_errno) << std::endl;
                int status = 0;
                waitpid(pid, &status, WNOHANG);
                return;
            }
            // Group already gone, make sure the leader is too
            kill(pid, SIGKILL);
        }

        int status = 0;
        pid_t result;
        do {
            result = waitpid(pid, &status, 0);
        } while (result == -1 && errno == EINTR);

        if (result == pid) {
            std::cout << "[AsDaemon] Worker PID " << pid << " " << describe_exit_status(status)
                      << " (" << context << ")" << std::endl;
        }
    }

    void ServerSupervisor::clear_locked() {
        state_.child.reset();
        state_.running = false;
    }

    void ServerSupervisor::read_stdout(int fd, uint64_t run_id, std::shared_ptr<SessionLog> session) {
        FilePtr stream(fdopen(fd, "r"), &fclose);
        if (!stream) {
            ::close(fd);
        } else {
            for_each_line(stream.get(), [&](const std::string& line) {
                std::cout << "[as-cmd out] " << line << std::endl;
                if (session) {
                    session->write_output("out", line);
                }
                if (auto event = classify_stdout_line(line)) {
                    device_channel_.send(*event);
                }
                return true;
            });
        }

        std::lock_guard<std::mutex> lock(run_mutex_);
        if (state_.run_id == run_id) {
            state_.running = false;
        }
    }

    void ServerSupervisor::read_stderr(int fd, uint64_t run_id, std::shared_ptr<SessionLog> session) {
        ProcessStopReason reason = ProcessStopReason::exited_successfully();

        FilePtr stream(fdopen(fd, "r"), &fclose);
        if (!stream) {
            ::close(fd);
        } else {
            for_each_line(stream.get(), [&](const std::string& line) {
                std::cout << "[as-cmd err] " << line << std::endl;
                if (session) {
                    session->write_output("err", line);
                }
                if (auto fault = classify_stderr_line(line)) {
                    std::cout << "[AsDaemon] Detected " << fault->to_string()
                              << " in worker output, stopping worker" << std::endl;
                    reason = *fault;
                    return false;
                }
                return true;
            });
        }

        {
            std::lock_guard<std::mutex> lock(run_mutex_);

            if (state_.child && state_.child->run_id == run_id) {
                terminate_locked("stderr closed");
                clear_locked();
            }

            if (state_.run_id == run_id) {
                stop_channel_.send(reason);
            } else {
                // A newer run already owns the channel
                std::cout << "[AsDaemon] Dropping stop reason " << reason.to_string()
                          << " of superseded run " << run_id << std::endl;
            }
        }

        if (session) {
            session->finalize(reason.to_string());
        }
    }

    void ServerSupervisor::launch_reader(
            void (ServerSupervisor::*reader)(int, uint64_t, std::shared_ptr<SessionLog>),
            int fd, uint64_t run_id, std::shared_ptr<SessionLog> session) {
        auto done = std::make_shared<std::atomic<bool>>(false);

        std::thread thread;
        try {
            thread = std::thread([this, reader, fd, run_id, session, done]() {
                (this->*reader)(fd, run_id, session);
                done->store(true);
            });
        } catch (const std::system_error&) {
            ::close(fd);
            throw;
        }

        std::lock_guard<std::mutex> lock(readers_mutex_);
        readers_.push_back(ReaderThread{std::move(thread), done});
    }

    void ServerSupervisor::reap_finished_readers() {
        std::lock_guard<std::mutex> lock(readers_mutex_);

        auto it = readers_.begin();
        while (it != readers_.end()) {
            if (it->done->load()) {
                if (it->thread.joinable()) {
                    it->thread.join();
                }
                it = readers_.erase(it);
            } else {
                ++it;
            }
        }
    }

} // namespace asmd

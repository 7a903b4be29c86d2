#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace coda::test {

// Line-protocol MPD stand-in on a loopback port. Answers the handful of
// commands MpdClient tests need; albumart requests can be held at a gate
// and are always answered with "No file exists".
class FakeMpdServer {
public:
    FakeMpdServer() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("FakeMpdServer: socket failed");
        }
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 16) < 0 ||
            ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
            ::close(listen_fd_);
            throw std::runtime_error("FakeMpdServer: bind failed");
        }
        port_ = ntohs(addr.sin_port);

        acceptor_ = std::thread([this]() { accept_loop(); });
    }

    ~FakeMpdServer() {
        stop_.store(true);
        open_art_gate();
        acceptor_.join();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int fd : client_fds_) ::shutdown(fd, SHUT_RDWR);
        }
        for (auto& worker : workers_) worker.join();
        for (int fd : client_fds_) ::close(fd);
        ::close(listen_fd_);
    }

    FakeMpdServer(const FakeMpdServer&) = delete;
    FakeMpdServer& operator=(const FakeMpdServer&) = delete;

    unsigned port() const { return port_; }

    // Answer binarylimit like a daemon that predates the command
    void reject_binarylimit() { reject_binarylimit_.store(true); }

    void close_art_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_art_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        cv_.notify_all();
    }

    // True once `count` albumart requests have arrived
    bool wait_for_art_requests(int count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return art_requests_ >= count; });
    }

    int art_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return art_requests_;
    }

    int art_answered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return art_answered_;
    }

    int connections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(client_fds_.size());
    }

    int count_command(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& c : commands_) {
            if (c == name) ++n;
        }
        return n;
    }

private:
    void accept_loop() {
        while (!stop_.load()) {
            pollfd pfd = {listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 20) <= 0) continue;

            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                client_fds_.push_back(fd);
            }
            workers_.emplace_back([this, fd]() { serve(fd); });
        }
    }

    void serve(int fd) {
        if (!send_all(fd, "OK MPD 0.23.5\n")) return;

        std::string buffer;
        char chunk[512];
        while (true) {
            auto newline = buffer.find('\n');
            if (newline == std::string::npos) {
                ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
                if (n <= 0) return;
                buffer.append(chunk, static_cast<size_t>(n));
                continue;
            }
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            if (!send_all(fd, respond(line))) return;
        }
    }

    std::string respond(const std::string& line) {
        std::string command = line.substr(0, line.find(' '));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            commands_.push_back(command);
        }

        if (command == "binarylimit") {
            if (reject_binarylimit_.load()) {
                return "ACK [5@0] {binarylimit} unknown command \"binarylimit\"\n";
            }
            return "OK\n";
        }
        if (command == "status") {
            return "volume: 40\nrepeat: 1\nrandom: 0\nsingle: 0\nconsume: 0\n"
                   "playlistlength: 0\nstate: stop\nOK\n";
        }
        if (command == "albumart") {
            std::unique_lock<std::mutex> lock(mutex_);
            ++art_requests_;
            cv_.notify_all();
            cv_.wait(lock, [this]() { return gate_open_; });
            ++art_answered_;
            return "ACK [50@0] {albumart} No file exists\n";
        }
        return "OK\n";
    }

    static bool send_all(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    int listen_fd_ = -1;
    unsigned port_ = 0;
    std::atomic<bool> stop_{false};
    std::atomic<bool> reject_binarylimit_{false};
    std::thread acceptor_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool gate_open_ = true;
    int art_requests_ = 0;
    int art_answered_ = 0;
    std::vector<int> client_fds_;
    std::vector<std::string> commands_;
};

}  // namespace coda::test

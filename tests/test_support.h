#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <httplib.h>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#endif

namespace lodestar_test {

// Record a failed expectation. Returns the condition so callers can bail out.
inline bool expect(bool condition, const std::string& message, int& failures) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << "\n";
        ++failures;
    }
    return condition;
}

inline int finish(const char* suite, int failures) {
    if (failures == 0) {
        std::cout << "[PASS] " << suite << "\n";
        return 0;
    }
    std::cerr << "[FAIL] " << suite << ": " << failures << " failure(s)\n";
    return 1;
}

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("lodestar-test-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// httplib server on an ephemeral loopback port, served from a background thread
class LoopbackServer {
public:
    LoopbackServer() = default;
    ~LoopbackServer() { stop(); }

    httplib::Server& routes() { return server_; }

    // Binds and starts serving. Returns the bound port, or 0 on failure.
    int start() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        if (port_ <= 0) {
            return 0;
        }
        thread_ = std::thread([this] { server_.listen_after_bind(); });

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!server_.is_running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return port_;
    }

    void stop() {
        if (thread_.joinable()) {
            server_.stop();
            thread_.join();
        }
    }

    int port() const { return port_; }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

#ifndef _WIN32
// Raw TCP server that starts an HTTP answer and then sends one header byte
// every `interval`, so no single read ever times out
class TrickleServer {
public:
    explicit TrickleServer(std::chrono::milliseconds interval = std::chrono::milliseconds(200))
        : interval_(interval) {}
    ~TrickleServer() { stop(); }

    // Returns the bound port, or 0 on failure
    int start() {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            return 0;
        }
        int yes = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
            listen(listen_fd_, 8) != 0 ||
            getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
            close(listen_fd_);
            listen_fd_ = -1;
            return 0;
        }
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serve(); });
        return port_;
    }

    void stop() {
        stop_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
        if (listen_fd_ >= 0) {
            close(listen_fd_);
            listen_fd_ = -1;
        }
    }

private:
    void serve() {
        while (!stop_) {
            struct pollfd pfd = {listen_fd_, POLLIN, 0};
            if (poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            int client = accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                continue;
            }
            char request[1024];
            recv(client, request, sizeof(request), 0);

            const char* head = "HTTP/1.1 200 OK\r\nX-Slow: ";
            send(client, head, std::strlen(head), MSG_NOSIGNAL);
            auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(30);
            while (!stop_ && std::chrono::steady_clock::now() < give_up) {
                std::this_thread::sleep_for(interval_);
                if (send(client, "a", 1, MSG_NOSIGNAL) < 0) {
                    break;  // Client gave up
                }
            }
            close(client);
        }
    }

    std::chrono::milliseconds interval_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};
#endif

// Poll `condition` until it holds or `timeout` passes
inline bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace lodestar_test

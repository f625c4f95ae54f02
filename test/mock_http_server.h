#pragma once
// Copyright (c) 2024-2026 The Chainboard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Loopback HTTP server for client tests. Each connection gets one request
// read (head plus Content-Length body) and one raw response written by the
// handler, then the connection is closed.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace test {

class MockHttpServer {
public:
    /// Receives the request body, returns the raw bytes to send back.
    /// An empty string means "accept but never answer".
    using Handler = std::function<std::string(const std::string& body)>;

    explicit MockHttpServer(Handler handler) : handler_(std::move(handler)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("socket() failed");
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 16) != 0) {
            ::close(fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~MockHttpServer() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    MockHttpServer(const MockHttpServer&) = delete;
    MockHttpServer& operator=(const MockHttpServer&) = delete;

    uint16_t port() const { return port_; }

    std::string url(const std::string& path = "/") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    /// Bodies of every request received so far.
    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    /// 200 OK with a JSON body and Content-Length framing.
    static std::string json_response(const std::string& body, int status = 200) {
        return "HTTP/1.1 " + std::to_string(status) + " X\r\n"
               "Content-Type: application/json\r\n"
               "Content-Length: " + std::to_string(body.size()) + "\r\n"
               "Connection: close\r\n\r\n" + body;
    }

private:
    void serve() {
        while (!stop_) {
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 20) <= 0) continue;
            int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) continue;
            handle(client);
            ::close(client);
        }
    }

    void handle(int client) {
        std::string raw;
        char buf[4096];
        size_t need = std::string::npos;
        while (true) {
            size_t head_end = raw.find("\r\n\r\n");
            if (head_end != std::string::npos && need == std::string::npos) {
                need = head_end + 4 + content_length(raw.substr(0, head_end));
            }
            if (need != std::string::npos && raw.size() >= need) break;

            pollfd pfd{client, POLLIN, 0};
            if (::poll(&pfd, 1, 2000) <= 0) return;
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) return;
            raw.append(buf, static_cast<size_t>(n));
        }

        std::string body = raw.substr(raw.find("\r\n\r\n") + 4);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(body);
        }

        std::string reply = handler_(body);
        if (reply.empty()) {
            // Hold the connection open until the client gives up.
            while (!stop_) {
                pollfd pfd{client, POLLIN, 0};
                if (::poll(&pfd, 1, 20) > 0) {
                    ssize_t n = ::recv(client, buf, sizeof(buf), 0);
                    if (n <= 0) return;
                }
            }
            return;
        }
        size_t sent = 0;
        while (sent < reply.size()) {
            ssize_t n = ::send(client, reply.data() + sent, reply.size() - sent,
                               MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    static size_t content_length(const std::string& head) {
        std::string lower;
        for (char c : head) lower.push_back(static_cast<char>(std::tolower(
            static_cast<unsigned char>(c))));
        size_t pos = lower.find("content-length:");
        if (pos == std::string::npos) return 0;
        return static_cast<size_t>(
            std::strtoul(head.c_str() + pos + 15, nullptr, 10));
    }

    Handler                  handler_;
    int                      fd_ = -1;
    uint16_t                 port_ = 0;
    std::atomic<bool>        stop_{false};
    std::thread              thread_;
    mutable std::mutex       mutex_;
    std::vector<std::string> requests_;
};

} // namespace test

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/format.h>

namespace partfetch::test {

// Loopback HTTP/1.1 server for one in-memory resource. Honours
// "Range: bytes=a-b" unless told to ignore it; one thread per connection,
// every response closes the connection.
class RangeServer {
public:
    explicit RangeServer(std::string body, bool honour_ranges = true)
        : body_(std::move(body)), honour_ranges_(honour_ranges) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        const int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 16) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("cannot listen on loopback");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        acceptor_ = std::thread([this] { acceptLoop(); });
    }

    ~RangeServer() {
        stop_.store(true);
        if (acceptor_.joinable()) {
            acceptor_.join();
        }
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        for (auto& handler : handlers_) {
            if (handler.joinable()) {
                handler.join();
            }
        }
        ::close(listen_fd_);
    }

    RangeServer(const RangeServer&) = delete;
    RangeServer& operator=(const RangeServer&) = delete;

    [[nodiscard]] std::string url(const std::string& path) const {
        return fmt::format("http://127.0.0.1:{}{}", port_, path);
    }

    [[nodiscard]] int requestCount() const { return requests_.load(); }

    // Headers keep announcing the full length, but at most `bytes` of each
    // body are sent before the connection closes.
    void truncateBodiesAt(std::size_t bytes) { body_limit_.store(bytes); }

private:
    void acceptLoop() {
        while (!stop_.load()) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            const int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                continue;
            }
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers_.emplace_back([this, client] { handle(client); });
        }
    }

    void handle(int fd) {
        std::string request;
        char buffer[4096];
        while (request.find("\r\n\r\n") == std::string::npos && request.size() < 65536) {
            const ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                ::close(fd);
                return;
            }
            request.append(buffer, static_cast<std::size_t>(n));
        }
        ++requests_;

        std::string lower = request;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const bool head = request.rfind("HEAD ", 0) == 0;
        const std::uint64_t size = body_.size();

        std::uint64_t first = 0;
        std::uint64_t last = size - 1;
        bool ranged = false;
        const auto pos = lower.find("\r\nrange: bytes=");
        if (honour_ranges_ && !head && pos != std::string::npos) {
            const auto value = lower.substr(pos + 15, lower.find("\r\n", pos + 2) - (pos + 15));
            const auto dash = value.find('-');
            first = std::stoull(value.substr(0, dash));
            if (dash + 1 < value.size()) {
                last = std::min<std::uint64_t>(std::stoull(value.substr(dash + 1)), size - 1);
            }
            ranged = true;
        }

        std::string response;
        if (ranged && first > last) {
            response = fmt::format("HTTP/1.1 416 Range Not Satisfiable\r\nContent-Range: bytes */{}\r\n"
                                   "Content-Length: 0\r\nConnection: close\r\n\r\n", size);
        } else if (ranged) {
            const std::uint64_t length = last - first + 1;
            response = fmt::format("HTTP/1.1 206 Partial Content\r\nContent-Length: {}\r\n"
                                   "Content-Range: bytes {}-{}/{}\r\nAccept-Ranges: bytes\r\n"
                                   "Connection: close\r\n\r\n", length, first, last, size);
            response.append(body_, first, std::min<std::uint64_t>(length, body_limit_.load()));
        } else {
            response = fmt::format("HTTP/1.1 200 OK\r\nContent-Length: {}\r\n{}Connection: close\r\n\r\n", size,
                                   honour_ranges_ ? "Accept-Ranges: bytes\r\n" : "");
            if (!head) {
                response.append(body_, 0, body_limit_.load());
            }
        }

        std::size_t sent = 0;
        while (sent < response.size()) {
            const ssize_t n = ::send(fd, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                break;
            }
            sent += static_cast<std::size_t>(n);
        }
        ::shutdown(fd, SHUT_WR);
        ::close(fd);
    }

    const std::string body_;
    const bool honour_ranges_;
    int listen_fd_{-1};
    std::uint16_t port_{0};
    std::atomic<bool> stop_{false};
    std::atomic<int> requests_{0};
    std::atomic<std::size_t> body_limit_{std::string::npos};
    std::thread acceptor_;
    std::mutex handlers_mutex_;
    std::vector<std::thread> handlers_;
};

} // namespace partfetch::test

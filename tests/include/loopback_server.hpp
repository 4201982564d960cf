#pragma once

// One-shot HTTP server on 127.0.0.1 for exercising the plain-socket client.
// Accepts a single connection, records the request, replies with `response`.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace romfetch_test {

class LoopbackServer {
public:
    explicit LoopbackServer(std::string response) : response_(std::move(response)) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listenFd_, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this]() { serveOnce(); });
    }

    ~LoopbackServer() {
        if (thread_.joinable()) thread_.join();
        if (listenFd_ >= 0) ::close(listenFd_);
    }

    int port() const { return port_; }
    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    // Valid after the client has received its response.
    const std::string& request() {
        if (thread_.joinable()) thread_.join();
        return request_;
    }

private:
    void serveOnce() {
        int client = ::accept(listenFd_, nullptr, nullptr);
        if (client < 0) return;
        char buf[4096];
        size_t expected = std::string::npos;
        while (true) {
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            request_.append(buf, buf + n);
            auto hdrEnd = request_.find("\r\n\r\n");
            if (hdrEnd == std::string::npos) continue;
            if (expected == std::string::npos) {
                size_t bodyLen = 0;
                auto cl = request_.find("Content-Length: ");
                if (cl != std::string::npos && cl < hdrEnd) bodyLen = std::stoul(request_.substr(cl + 16));
                expected = hdrEnd + 4 + bodyLen;
            }
            if (request_.size() >= expected) break;
        }
        ::send(client, response_.data(), response_.size(), 0);
        ::close(client);
    }

    std::string response_;
    std::string request_;
    int listenFd_{-1};
    int port_{0};
    std::thread thread_;
};

} // namespace romfetch_test

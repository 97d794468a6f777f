#pragma once

// Loopback HTTP server that answers one connection per canned response, in
// order, and records each request body.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

inline std::string http_response(int status, const std::string& body) {
    const char* reason = status == 200 ? "OK" : status == 400 ? "Bad Request" : "Error";
    return "HTTP/1.1 " + std::to_string(status) + " " + reason +
           "\r\n"
           "Content-Type: application/json-rpc\r\n"
           "Content-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
}

class ScriptedServer {
public:
    explicit ScriptedServer(std::vector<std::string> responses) {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int one    = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        // accept() gives up after this, so a failed test cannot hang the run
        struct timeval tv{};
        tv.tv_sec = 5;
        setsockopt(listen_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(listen_fd_, 8);

        socklen_t len = sizeof(addr);
        getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this, responses = std::move(responses)] {
            for (const auto& response : responses) {
                const int client = accept(listen_fd_, nullptr, nullptr);
                if (client < 0)
                    break;
                const std::string body = read_body(client);
                {
                    std::lock_guard lock(mtx_);
                    bodies_.push_back(body);
                }
                size_t sent = 0;
                while (sent < response.size()) {
                    ssize_t n = send(client, response.data() + sent, response.size() - sent,
                                     MSG_NOSIGNAL);
                    if (n <= 0)
                        break;
                    sent += static_cast<size_t>(n);
                }
                close(client);
            }
            close(listen_fd_);
        });
    }

    ~ScriptedServer() { wait(); }

    ScriptedServer(const ScriptedServer&)            = delete;
    ScriptedServer& operator=(const ScriptedServer&) = delete;

    // Blocks until every response was served and the port is closed.
    void wait() {
        if (thread_.joinable())
            thread_.join();
    }

    int port() const { return port_; }

    std::vector<std::string> bodies() {
        std::lock_guard lock(mtx_);
        return bodies_;
    }

private:
    int                      listen_fd_ = -1;
    int                      port_      = 0;
    std::thread              thread_;
    std::mutex               mtx_;
    std::vector<std::string> bodies_;

    static std::string read_body(int fd) {
        std::string data;
        char        buf[4096];
        size_t      header_end = std::string::npos;
        while (header_end == std::string::npos) {
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n <= 0)
                return {};
            data.append(buf, static_cast<size_t>(n));
            header_end = data.find("\r\n\r\n");
        }

        size_t     length = 0;
        const auto cl     = data.find("Content-Length: ");
        if (cl != std::string::npos && cl < header_end)
            length = std::strtoul(data.c_str() + cl + 16, nullptr, 10);

        std::string body = data.substr(header_end + 4);
        while (body.size() < length) {
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n <= 0)
                break;
            body.append(buf, static_cast<size_t>(n));
        }
        return body;
    }
};

// A loopback port with nothing listening on it.
inline int closed_port() {
    const int   fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    close(fd);
    return ntohs(addr.sin_port);
}

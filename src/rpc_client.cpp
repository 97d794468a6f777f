#include "rpc_client.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

RpcClient::RpcClient(RpcConfig config) : config_(std::move(config)) {}

// ---------------------------------------------------------------------------
// base64 encoder (RFC 4648), used for torrent and metalink payloads
// ---------------------------------------------------------------------------
std::string RpcClient::base64_encode(const std::string& input) {
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((input.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < input.size(); i += 3) {
        const auto b0 = static_cast<unsigned char>(input[i]);
        const auto b1 = static_cast<unsigned char>(input[i + 1]);
        const auto b2 = static_cast<unsigned char>(input[i + 2]);
        out += chars[b0 >> 2];
        out += chars[((b0 & 0x03) << 4) | (b1 >> 4)];
        out += chars[((b1 & 0x0f) << 2) | (b2 >> 6)];
        out += chars[b2 & 0x3f];
    }

    const size_t rest = input.size() - i;
    if (rest == 1) {
        const auto b0 = static_cast<unsigned char>(input[i]);
        out += chars[b0 >> 2];
        out += chars[(b0 & 0x03) << 4];
        out += "==";
    } else if (rest == 2) {
        const auto b0 = static_cast<unsigned char>(input[i]);
        const auto b1 = static_cast<unsigned char>(input[i + 1]);
        out += chars[b0 >> 2];
        out += chars[((b0 & 0x03) << 4) | (b1 >> 4)];
        out += chars[(b1 & 0x0f) << 2];
        out += '=';
    }
    return out;
}

// ---------------------------------------------------------------------------
// Low-level HTTP POST over a plain TCP socket
// ---------------------------------------------------------------------------
namespace {

// Closes the socket on every exit path.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0)
            close(fd_);
    }
    SocketGuard(const SocketGuard&)            = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

std::string RpcClient::http_post(const std::string& body) {
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string port_str = std::to_string(config_.port);
    int               err      = getaddrinfo(config_.host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0) {
        throw TransportError("getaddrinfo: " + std::string(gai_strerror(err)));
    }

    SocketGuard sock(socket(res->ai_family, res->ai_socktype, res->ai_protocol));
    if (sock.get() < 0) {
        freeaddrinfo(res);
        throw TransportError("socket(): " + std::string(strerror(errno)));
    }

    struct timeval tv{};
    tv.tv_sec = config_.timeout_seconds;
    setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (connect(sock.get(), res->ai_addr, res->ai_addrlen) < 0) {
        const int saved = errno;
        freeaddrinfo(res);
        throw TransportError("connect to " + config_.host + ":" + port_str +
                             " failed: " + strerror(saved));
    }
    freeaddrinfo(res);

    // HTTP/1.0 so the daemon closes the connection after the reply
    const std::string request = "POST " + config_.path + " HTTP/1.0\r\n"
                                "Host: " + config_.host + ":" + port_str + "\r\n"
                                "Content-Type: application/json\r\n"
                                "Accept: application/json\r\n"
                                "Content-Length: " + std::to_string(body.size()) + "\r\n"
                                "\r\n" +
                                body;

    size_t sent_total = 0;
    while (sent_total < request.size()) {
        ssize_t n = send(sock.get(), request.data() + sent_total, request.size() - sent_total,
                         MSG_NOSIGNAL);
        if (n <= 0) {
            throw TransportError("send() failed: " + std::string(strerror(errno)));
        }
        sent_total += static_cast<size_t>(n);
    }

    std::string response;
    char        buf[4096];
    ssize_t     n;
    while ((n = recv(sock.get(), buf, sizeof(buf), 0)) > 0) {
        response.append(buf, static_cast<size_t>(n));
    }
    if (n < 0 && response.empty()) {
        throw TransportError("recv() failed: " + std::string(strerror(errno)));
    }

    if (response.empty()) {
        throw TransportError("Empty response from aria2");
    }

    auto header_end = response.find("\r\n\r\n");
    if (response.compare(0, 5, "HTTP/") != 0 || header_end == std::string::npos) {
        throw TransportError("Malformed HTTP response from aria2");
    }

    // aria2 reports RPC failures with 400/500 and a JSON body, so the status
    // code is left to call() which inspects the body first.
    return response.substr(header_end + 4);
}

// ---------------------------------------------------------------------------
// JSON-RPC call
// ---------------------------------------------------------------------------
json RpcClient::call(const std::string& method, const json& params) {
    json full_params = json::array();
    full_params.push_back("token:" + config_.secret);
    for (const auto& p : params)
        full_params.push_back(p);

    json req = {
        {"jsonrpc", "2.0"},
        {"id", std::to_string(++request_id_)},
        {"method", method},
        {"params", full_params},
    };

    const std::string response = http_post(req.dump());

    json j;
    try {
        j = json::parse(response);
    } catch (const json::exception& e) {
        throw RpcError(method + ": unparsable response: " + std::string(e.what()));
    }

    if (j.contains("error") && !j["error"].is_null()) {
        const json& e = j["error"];
        throw RpcError(e.is_object() ? e.value("message", "RPC error") : e.dump());
    }

    return j["result"];
}

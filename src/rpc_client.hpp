#pragma once

#include "errors.hpp"
#include "json.hpp"

#include <atomic>
#include <string>

// Kept at namespace scope to avoid a clang bug where nested structs with
// default member initializers trigger "needed within definition of enclosing
// class outside of member functions".
struct RpcConfig {
    std::string host            = "127.0.0.1";
    int         port            = 6800;
    std::string path            = "/jsonrpc";
    std::string secret;
    int         timeout_seconds = 10;
};

// JSON-RPC 2.0 client for aria2. Every call carries "token:<secret>" as its
// first positional parameter. Thread-safe: each call opens its own socket.
class RpcClient {
public:
    explicit RpcClient(RpcConfig config = {});

    // Returns the "result" member. Throws TransportError when no response
    // was obtained and RpcError when the daemon reported an error.
    json call(const std::string& method, const json& params = json::array());

    static std::string base64_encode(const std::string& input);

private:
    RpcConfig        config_;
    std::atomic<int> request_id_{0};

    std::string http_post(const std::string& body);
};

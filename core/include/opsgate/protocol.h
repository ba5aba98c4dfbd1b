#pragma once

#include "opsgate/dispatcher.h"
#include "opsgate/json.h"

#include <string>

namespace opsgate {

constexpr const char* kProtocolVersion = "2024-11-05";

enum RpcErrorCode {
    RPC_PARSE_ERROR = -32700,
    RPC_INVALID_REQUEST = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS = -32602,
    RPC_INTERNAL_ERROR = -32603,
    RPC_AUTH_REQUIRED = -32001,
};

// JSON-RPC 2.0 surface over the Dispatcher. Stateless: every request is
// judged on its own, including authorization.
//
//   initialize                 no credential needed; server identity + capabilities
//   notifications/initialized  empty result
//   tools/list                 registry catalog
//   tools/call                 {name, arguments} -> Dispatcher
class RpcHandler {
public:
    explicit RpcHandler(const Dispatcher& dispatcher) : dispatcher_(dispatcher) {}

    // Raw body in, serialized response out. Never throws.
    std::string handle(const std::string& body, bool authorized) const;

    // Parsed request in (borrowed), response object out.
    json::Doc handle_request(json_object* req, bool authorized) const;

    static json::Doc error_response(json_object* id, int code, const std::string& message);
    static json::Doc result_response(json_object* id, json::Doc result);

private:
    json::Doc initialize_result() const;
    json::Doc tools_list_result() const;
    json::Doc tools_call(json_object* id, json_object* params) const;

    const Dispatcher& dispatcher_;
};

} // namespace opsgate

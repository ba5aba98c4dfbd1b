#pragma once

#include "opsgate/auth.h"
#include "opsgate/dispatcher.h"
#include "opsgate/http.h"
#include "opsgate/protocol.h"

#include <string>

namespace opsgate {

// HTTP routing for both surfaces. Transport-free: the serve loop hands in a
// parsed request and writes back the response.
//
//   OPTIONS *                         204 + CORS
//   GET  /health                      no credential
//   GET  /mcp/status                  server status
//   POST /mcp, /mcp/                  JSON-RPC (see RpcHandler)
//   GET  /mcp/tools/tail_logs/{svc}   path-parameter form of tail_logs
//   GET|POST /mcp/tools/{name}        REST form of tools/call
class Gateway {
public:
    Gateway(const Dispatcher& dispatcher, const AuthGate& auth)
        : dispatcher_(dispatcher), auth_(auth), rpc_(dispatcher) {}

    // Never throws.
    HttpResponse handle(const HttpRequest& req) const;

private:
    HttpResponse route(const HttpRequest& req) const;
    HttpResponse health() const;
    HttpResponse status() const;
    HttpResponse call_tool(const std::string& name, json_object* args) const;
    HttpResponse rest_tool(const HttpRequest& req, const std::string& name) const;

    const Dispatcher& dispatcher_;
    const AuthGate& auth_;
    RpcHandler rpc_;
};

HttpResponse json_response(int status, const std::string& body);
HttpResponse detail_response(int status, const std::string& detail);

// Build tool arguments from query parameters using the declared schema.
// "key" is never an argument. Returns empty string on success.
std::string query_to_args(const HttpRequest& req, const ToolDefinition& def, json_object* out);

} // namespace opsgate

#include "opsgate/protocol.h"
#include "opsgate/config.h"

#include <exception>
#include <iostream>

namespace opsgate {

json::Doc RpcHandler::error_response(json_object* id, int code, const std::string& message) {
    json::Doc resp = json::Doc::object();
    json::set_string(resp.get(), "jsonrpc", "2.0");
    json::set(resp.get(), "id", id ? json_object_get(id) : nullptr);
    json_object* err = json_object_new_object();
    json::set_int(err, "code", code);
    json::set_string(err, "message", message);
    json::set(resp.get(), "error", err);
    return resp;
}

json::Doc RpcHandler::result_response(json_object* id, json::Doc result) {
    json::Doc resp = json::Doc::object();
    json::set_string(resp.get(), "jsonrpc", "2.0");
    json::set(resp.get(), "id", id ? json_object_get(id) : nullptr);
    json::set(resp.get(), "result", result ? result.release() : json_object_new_object());
    return resp;
}

json::Doc RpcHandler::initialize_result() const {
    const GatewayConfig& cfg = dispatcher_.config();
    json::Doc r = json::Doc::object();
    json::set_string(r.get(), "protocolVersion", kProtocolVersion);

    json_object* caps = json_object_new_object();
    json_object* tools = json_object_new_object();
    json::set_bool(tools, "listChanged", false);
    json::set(caps, "tools", tools);
    json::set(r.get(), "capabilities", caps);

    json_object* info = json_object_new_object();
    json::set_string(info, "name", cfg.server_name);
    json::set_string(info, "version", cfg.version);
    json::set(r.get(), "serverInfo", info);
    return r;
}

json::Doc RpcHandler::tools_list_result() const {
    json::Doc r = json::Doc::object();
    json::set(r.get(), "tools", dispatcher_.registry().catalog_json().release());
    return r;
}

json::Doc RpcHandler::tools_call(json_object* id, json_object* params) const {
    auto name = json::get_string(params, "name");
    if (!name || name->empty()) {
        return error_response(id, RPC_INVALID_PARAMS, "Invalid params: tools/call requires a tool name");
    }
    json_object* args = json::member(params, "arguments");

    ToolResult tr = dispatcher_.dispatch(*name, args);

    json::Doc r = json::Doc::object();
    json_object* content = json_object_new_array();
    json_object* item = json_object_new_object();
    json::set_string(item, "type", "text");
    json::set_string(item, "text", json::dump(tr.payload.get()));
    json_object_array_add(content, item);
    json::set(r.get(), "content", content);
    json::set_bool(r.get(), "isError",
                   !(tr.status == ToolStatus::OK || tr.status == ToolStatus::CONFIRMATION_REQUIRED));
    return result_response(id, std::move(r));
}

json::Doc RpcHandler::handle_request(json_object* req, bool authorized) const {
    if (!json::is_object(req)) {
        return error_response(nullptr, RPC_INVALID_REQUEST, "Invalid Request: expected a JSON object");
    }
    json_object* id = json::member(req, "id");
    auto method = json::get_string(req, "method");
    if (!method) {
        return error_response(id, RPC_INVALID_REQUEST, "Invalid Request: missing method");
    }

    if (*method != "initialize" && !authorized) {
        return error_response(id, RPC_AUTH_REQUIRED, "Authentication required: missing or invalid API key");
    }

    if (*method == "initialize") return result_response(id, initialize_result());
    if (*method == "notifications/initialized") return result_response(id, json::Doc::object());
    if (*method == "tools/list") return result_response(id, tools_list_result());
    if (*method == "tools/call") return tools_call(id, json::member(req, "params"));

    return error_response(id, RPC_METHOD_NOT_FOUND, "Method not found: " + *method);
}

std::string RpcHandler::handle(const std::string& body, bool authorized) const {
    json::Doc req = json::parse(body);
    if (!req) {
        return json::dump(error_response(nullptr, RPC_PARSE_ERROR, "Parse error").get());
    }
    try {
        json::Doc resp = handle_request(req.get(), authorized);
        return json::dump(resp.get());
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] rpc handler failed: " << e.what() << "\n";
    }
    json::Doc err = error_response(json::member(req.get(), "id"), RPC_INTERNAL_ERROR, "Internal error");
    return json::dump(err.get());
}

} // namespace opsgate

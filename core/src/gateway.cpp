#include "opsgate/gateway.h"
#include "opsgate/config.h"
#include "opsgate/text.h"

#include <exception>
#include <iostream>

namespace opsgate {

namespace {

const char* const kToolsPrefix = "/mcp/tools/";
const char* const kUnauthorized = "Invalid or missing API key";

bool parse_int64(const std::string& s, int64_t* out) {
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        *out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

HttpResponse json_response(int status, const std::string& body) {
    HttpResponse r;
    r.status = status;
    r.body = body;
    return r;
}

HttpResponse detail_response(int status, const std::string& detail) {
    json::Doc d = json::Doc::object();
    json::set_string(d.get(), "detail", detail);
    return json_response(status, json::dump(d.get()));
}

std::string query_to_args(const HttpRequest& req, const ToolDefinition& def, json_object* out) {
    for (const auto& kv : req.query) {
        if (kv.first == "key") continue;
        const ParamSpec* p = def.param(kv.first);
        if (!p) {
            json::set_string(out, kv.first, kv.second);
            continue;
        }
        switch (p->type) {
            case ParamType::STRING:
                json::set_string(out, p->name, kv.second);
                break;
            case ParamType::INTEGER: {
                int64_t n = 0;
                if (!parse_int64(kv.second, &n)) return "argument " + p->name + " must be an integer";
                json::set_int(out, p->name, n);
                break;
            }
            case ParamType::BOOLEAN: {
                std::string v = lower_ascii(kv.second);
                if (v == "true" || v == "1") json::set_bool(out, p->name, true);
                else if (v == "false" || v == "0") json::set_bool(out, p->name, false);
                else return "argument " + p->name + " must be true or false";
                break;
            }
            case ParamType::OBJECT:
                return "argument " + p->name + " cannot be passed in the query string";
        }
    }
    return "";
}

HttpResponse Gateway::health() const {
    json::Doc d = json::Doc::object();
    json::set_string(d.get(), "status", "healthy");
    json::set_string(d.get(), "service", dispatcher_.config().server_name);
    json::set_string(d.get(), "timestamp", iso_now());
    return json_response(200, json::dump(d.get()));
}

HttpResponse Gateway::status() const {
    const GatewayConfig& cfg = dispatcher_.config();
    json::Doc d = json::Doc::object();
    json::set_string(d.get(), "status", "running");
    json::set_string(d.get(), "version", cfg.version);
    json::set(d.get(), "tools", json::string_array(dispatcher_.registry().names()));
    json::set(d.get(), "allowed_services", json::string_array(cfg.sandbox.allowed_services));
    std::vector<std::string> repos;
    for (const auto& kv : cfg.sandbox.repo_paths) repos.push_back(kv.first);
    json::set(d.get(), "allowed_repos", json::string_array(repos));
    return json_response(200, json::dump(d.get()));
}

HttpResponse Gateway::call_tool(const std::string& name, json_object* args) const {
    ToolResult r = dispatcher_.dispatch(name, args);
    if (r.status == ToolStatus::OK || r.status == ToolStatus::CONFIRMATION_REQUIRED) {
        return json_response(http_status_for(r.status), json::dump(r.payload.get()));
    }
    return detail_response(http_status_for(r.status), r.error);
}

HttpResponse Gateway::rest_tool(const HttpRequest& req, const std::string& name) const {
    const ToolDefinition* def = dispatcher_.registry().find(name);
    if (!def) return detail_response(404, "Unknown tool: " + name);

    json::Doc args;
    if (req.method == "POST") {
        if (trim_ws(req.body).empty()) {
            args = json::Doc::object();
        } else {
            args = json::parse(req.body);
            if (!args) return detail_response(400, "Request body is not valid JSON");
            if (!json::is_object(args.get())) return detail_response(400, "Request body must be a JSON object");
        }
    } else {
        args = json::Doc::object();
        std::string err = query_to_args(req, *def, args.get());
        if (!err.empty()) return detail_response(400, err);
    }
    return call_tool(def->name, args.get());
}

HttpResponse Gateway::route(const HttpRequest& req) const {
    const std::string& path = req.path;

    if (req.method == "OPTIONS") {
        HttpResponse r;
        r.status = 204;
        r.content_type.clear();
        r.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        r.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type, X-API-Key");
        r.headers.emplace_back("Access-Control-Max-Age", "600");
        return r;
    }

    if (path == "/health") {
        if (req.method != "GET") return detail_response(405, "Method Not Allowed");
        return health();
    }

    if (path == "/mcp" || path == "/mcp/") {
        if (req.method != "POST") return detail_response(405, "Method Not Allowed");
        return json_response(200, rpc_.handle(req.body, auth_.authorize(req)));
    }

    if (path == "/mcp/status") {
        if (req.method != "GET") return detail_response(405, "Method Not Allowed");
        if (!auth_.authorize(req)) return detail_response(401, kUnauthorized);
        return status();
    }

    if (starts_with(path, kToolsPrefix)) {
        if (req.method != "GET" && req.method != "POST") return detail_response(405, "Method Not Allowed");
        if (!auth_.authorize(req)) return detail_response(401, kUnauthorized);

        std::string rest = path.substr(std::string(kToolsPrefix).size());
        size_t slash = rest.find('/');
        if (slash == std::string::npos) return rest_tool(req, rest);

        // GET /mcp/tools/tail_logs/{service}?lines=N
        std::string name = rest.substr(0, slash);
        std::string service = rest.substr(slash + 1);
        if (name != "tail_logs" || req.method != "GET" || service.empty() || service.find('/') != std::string::npos) {
            return detail_response(404, "Not Found");
        }
        const ToolDefinition* def = dispatcher_.registry().find(name);
        if (!def) return detail_response(404, "Unknown tool: " + name);
        json::Doc args = json::Doc::object();
        std::string err = query_to_args(req, *def, args.get());
        if (!err.empty()) return detail_response(400, err);
        json::set_string(args.get(), "service", service);
        return call_tool(name, args.get());
    }

    return detail_response(404, "Not Found");
}

HttpResponse Gateway::handle(const HttpRequest& req) const {
    HttpResponse r;
    try {
        r = route(req);
    } catch (const std::exception& e) {
        std::cerr << "[http] " << req.method << " " << req.path << " failed: " << e.what() << "\n";
        r = detail_response(500, "Internal server error");
    }
    r.headers.emplace_back("Access-Control-Allow-Origin", "*");
    return r;
}

} // namespace opsgate

#include "test_common.h"
#include "opsgate/auth.h"
#include "opsgate/dispatcher.h"
#include "opsgate/gateway.h"
#include "opsgate/registry.h"
#include "serve_http.h"
#include "tools/ops/ops_tools.h"

using namespace opsgate;

namespace {

HttpRequest make_req(const std::string& method, const std::string& target,
                     const std::string& key = "", const std::string& body = "") {
    HttpRequest req;
    req.method = method;
    split_target(target, &req.path, &req.query);
    if (!key.empty()) req.headers["x-api-key"] = key;
    req.body = body;
    return req;
}

std::string header_of(const HttpResponse& r, const std::string& name) {
    for (const auto& h : r.headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

std::string detail_of(const HttpResponse& r) {
    json::Doc d = parse_or_die(r.body, "detail body");
    return json::get_string(d.get(), "detail").value_or("");
}

} // namespace

int main() {
    std::string root = make_temp_dir("gateway");
    write_text(root + "/notes.txt", "one\ntwo\nthree\n");
    GatewayConfig cfg = make_test_config(root);
    ToolRegistry reg;
    register_ops_tools(reg);
    FakeRunner runner;
    Dispatcher dispatcher(reg, cfg, runner, nullptr);
    AuthGate auth(cfg.api_keys);
    Gateway gw(dispatcher, auth);
    const std::string key = "test-key-1";

    // Test 1: health needs no credential
    {
        HttpResponse r = gw.handle(make_req("GET", "/health"));
        expect_eq_ll(r.status, 200, "health status");
        json::Doc d = parse_or_die(r.body, "health");
        expect_eq_str(json::get_string(d.get(), "status").value_or(""), "healthy", "health body");
        expect_true(json::get_string(d.get(), "timestamp").has_value(), "health timestamp");
        expect_eq_str(header_of(r, "Access-Control-Allow-Origin"), "*", "CORS on every response");
    }

    // Test 2: status requires a credential
    {
        HttpResponse no = gw.handle(make_req("GET", "/mcp/status"));
        expect_eq_ll(no.status, 401, "status without key");
        expect_eq_str(detail_of(no), "Invalid or missing API key", "401 detail");

        HttpResponse yes = gw.handle(make_req("GET", "/mcp/status", key));
        expect_eq_ll(yes.status, 200, "status with key");
        json::Doc d = parse_or_die(yes.body, "status");
        expect_eq_str(json::get_string(d.get(), "status").value_or(""), "running", "status running");
        expect_eq_ll((long long)json_object_array_length(json::member(d.get(), "tools")), (long long)reg.size(),
                     "status lists tools");
        expect_eq_ll((long long)json_object_array_length(json::member(d.get(), "allowed_services")), 2,
                     "status lists services");

        HttpResponse by_query = gw.handle(make_req("GET", "/mcp/status?key=test-key-2"));
        expect_eq_ll(by_query.status, 200, "key query parameter accepted");
    }

    // Test 3: JSON-RPC surface answers with HTTP 200, auth errors in the body
    {
        HttpResponse r = gw.handle(make_req("POST", "/mcp", "", R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
        expect_eq_ll(r.status, 200, "rpc always 200");
        expect_true(contains(r.body, "-32001"), "rpc auth error code");

        HttpResponse slash = gw.handle(make_req("POST", "/mcp/", key, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
        expect_true(contains(slash.body, "\"tools\""), "trailing-slash alias works");

        HttpResponse get = gw.handle(make_req("GET", "/mcp", key));
        expect_eq_ll(get.status, 405, "GET /mcp not allowed");
    }

    // Test 4: REST POST tool call
    {
        HttpResponse r = gw.handle(make_req("POST", "/mcp/tools/read_file", key,
                                            "{\"path\":\"" + root + "/notes.txt\",\"lines\":2}"));
        expect_eq_ll(r.status, 200, "read_file via REST");
        json::Doc d = parse_or_die(r.body, "read_file");
        expect_eq_str(json::get_string(d.get(), "content").value_or(""), "one\ntwo\n", "two lines read");

        HttpResponse noauth = gw.handle(make_req("POST", "/mcp/tools/read_file", "",
                                                 "{\"path\":\"" + root + "/notes.txt\"}"));
        expect_eq_ll(noauth.status, 401, "REST tool without key");
    }

    // Test 5: REST status mapping
    {
        HttpResponse denied = gw.handle(make_req("POST", "/mcp/tools/read_file", key, R"({"path":"/etc/passwd"})"));
        expect_eq_ll(denied.status, 403, "access denied -> 403");
        expect_true(contains(detail_of(denied), "Access denied"), "403 detail");

        HttpResponse missing = gw.handle(make_req("POST", "/mcp/tools/read_file", key,
                                                  "{\"path\":\"" + root + "/nope.txt\"}"));
        expect_eq_ll(missing.status, 404, "missing file -> 404");

        HttpResponse unknown = gw.handle(make_req("POST", "/mcp/tools/format_disk", key, "{}"));
        expect_eq_ll(unknown.status, 404, "unknown tool -> 404");

        HttpResponse bad = gw.handle(make_req("POST", "/mcp/tools/read_file", key, "{oops"));
        expect_eq_ll(bad.status, 400, "invalid JSON body -> 400");

        HttpResponse arr = gw.handle(make_req("POST", "/mcp/tools/read_file", key, "[]"));
        expect_eq_ll(arr.status, 400, "non-object body -> 400");

        HttpResponse noarg = gw.handle(make_req("POST", "/mcp/tools/read_file", key, ""));
        expect_eq_ll(noarg.status, 400, "empty body is {} and misses path");
        expect_eq_str(detail_of(noarg), "missing required argument: path", "missing arg detail");

        runner.calls.clear();
        HttpResponse gated = gw.handle(make_req("POST", "/mcp/tools/restart_service", key, R"({"service":"apis"})"));
        expect_eq_ll(gated.status, 200, "confirmation refusal -> 200");
        expect_true(contains(gated.body, "Must set confirm=true"), "refusal payload");
        expect_eq_ll((long long)runner.calls.size(), 0, "refusal spawned nothing");
    }

    // Test 6: GET with query-string arguments coerced by schema
    {
        runner.calls.clear();
        runner.push_ok("l1\nl2\n");
        HttpResponse r = gw.handle(make_req("GET", "/mcp/tools/read_log?service=apis&lines=20&key=" + key));
        expect_eq_ll(r.status, 200, "GET read_log");
        expect_eq_ll((long long)runner.calls.size(), 1, "one docker call");
        expect_eq_str(runner.argv_at(0, 3), "20", "lines coerced to integer and used");
        expect_true(!contains(r.body, key), "key not passed as an argument");

        HttpResponse bad_int = gw.handle(make_req("GET", "/mcp/tools/read_log?service=apis&lines=lots", key));
        expect_eq_ll(bad_int.status, 400, "non-integer query value -> 400");

        HttpResponse bad_bool = gw.handle(make_req("GET", "/mcp/tools/list_directory?path=/tmp&recursive=maybe", key));
        expect_eq_ll(bad_bool.status, 400, "bad boolean -> 400");
    }

    // Test 7: legacy tail_logs path form and alias
    {
        runner.calls.clear();
        runner.push_ok("tail\n");
        HttpResponse r = gw.handle(make_req("GET", "/mcp/tools/tail_logs/nginx?lines=5", key));
        expect_eq_ll(r.status, 200, "tail_logs path form");
        expect_eq_str(runner.argv_at(0, runner.calls[0].argv.size() - 1), "nginx", "service from path");

        HttpResponse bad = gw.handle(make_req("GET", "/mcp/tools/tail_logs/postgres", key));
        expect_eq_ll(bad.status, 400, "unknown service -> 400");

        HttpResponse other = gw.handle(make_req("GET", "/mcp/tools/read_log/apis", key));
        expect_eq_ll(other.status, 404, "path form only for tail_logs");

        runner.push_ok("[]");
        HttpResponse alias = gw.handle(make_req("POST", "/mcp/tools/query_neo4j", key, R"({"query":"MATCH (n) RETURN n"})"));
        expect_eq_ll(alias.status, 200, "query_neo4j alias");
    }

    // Test 8: OPTIONS, unknown routes, wrong methods
    {
        HttpResponse opt = gw.handle(make_req("OPTIONS", "/mcp"));
        expect_eq_ll(opt.status, 204, "preflight");
        expect_true(contains(header_of(opt, "Access-Control-Allow-Headers"), "X-API-Key"), "preflight headers");
        expect_eq_ll(gw.handle(make_req("GET", "/nope")).status, 404, "unknown route");
        expect_eq_ll(gw.handle(make_req("DELETE", "/mcp/tools/read_file", key)).status, 405, "DELETE not allowed");
        expect_eq_ll(gw.handle(make_req("POST", "/health")).status, 405, "POST /health not allowed");
    }

    // Test 9: request head parsing for the socket layer
    {
        HttpRequest req;
        std::string head = "post /mcp/tools/grep?pattern=a%20b&key=x+y HTTP/1.1\r\n"
                           "Host: localhost\r\nX-API-Key:  k1 \r\nContent-Length: 2\r\n\r\n";
        expect_true(parse_http_head(head, &req), "head parses");
        expect_eq_str(req.method, "POST", "method uppercased");
        expect_eq_str(req.path, "/mcp/tools/grep", "path split");
        expect_eq_str(req.query_param("pattern"), "a b", "percent decoded");
        expect_eq_str(req.query_param("key"), "x y", "plus decoded");
        expect_eq_str(req.header("x-api-key"), "k1", "header trimmed");

        HttpRequest bad;
        expect_true(!parse_http_head("GARBAGE\r\n\r\n", &bad), "malformed request line rejected");
        expect_true(!parse_http_head("GET http://evil/ HTTP/1.1\r\n\r\n", &bad), "absolute-form target rejected");
    }

    remove_tree(root);
    std::cerr << "test_gateway: ALL PASSED" << std::endl;
    return 0;
}

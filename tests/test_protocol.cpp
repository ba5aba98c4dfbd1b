#include "test_common.h"
#include "opsgate/dispatcher.h"
#include "opsgate/protocol.h"
#include "opsgate/registry.h"
#include "opsgate/text.h"
#include "tools/ops/ops_tools.h"

using namespace opsgate;

namespace {

struct Rpc {
    const RpcHandler& h;

    json::Doc call(const std::string& body, bool authorized) const {
        return parse_or_die(h.handle(body, authorized), "rpc response");
    }
};

int error_code(json_object* resp) {
    json_object* err = json::member(resp, "error");
    return (int)json::get_int(err, "code").value_or(0);
}

// tools/call result: the text content parsed back into JSON.
json::Doc call_payload(json_object* resp, bool* is_error) {
    json_object* result = json::member(resp, "result");
    if (!result) die("tools/call returned no result: " + json::dump(resp));
    *is_error = json::get_bool(result, "isError").value_or(false);
    json_object* content = json::member(result, "content");
    if (!content || json_object_array_length(content) != 1) die("tools/call content must have one item");
    json_object* item = json_object_array_get_idx(content, 0);
    expect_eq_str(json::get_string(item, "type").value_or(""), "text", "content type");
    return parse_or_die(json::get_string(item, "text").value_or(""), "content text");
}

} // namespace

int main() {
    std::string root = make_temp_dir("protocol");
    GatewayConfig cfg = make_test_config(root);
    ToolRegistry reg;
    register_ops_tools(reg);
    FakeRunner runner;
    Dispatcher dispatcher(reg, cfg, runner, nullptr);
    RpcHandler handler(dispatcher);
    Rpc rpc{handler};

    // Test 1: initialize needs no credential, tools/list right after does
    {
        json::Doc init = rpc.call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})", false);
        json_object* result = json::member(init.get(), "result");
        expect_true(result != nullptr, "initialize succeeds without credential");
        expect_eq_ll(json::get_int(init.get(), "id").value_or(-1), 1, "id echoed");
        expect_eq_str(json::get_string(result, "protocolVersion").value_or(""), "2024-11-05", "protocol version");
        json_object* tools_cap = json::member(json::member(result, "capabilities"), "tools");
        expect_true(json::get_bool(tools_cap, "listChanged").has_value(), "tools capability declared");
        expect_eq_str(json::get_string(json::member(result, "serverInfo"), "name").value_or(""), "opsgate", "server name");

        json::Doc list = rpc.call(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})", false);
        expect_eq_ll(error_code(list.get()), -32001, "tools/list without credential rejected");
        expect_eq_ll(json::get_int(list.get(), "id").value_or(-1), 2, "id kept on auth error");
        expect_true(!json::member(list.get(), "result"), "no result on auth error");
    }

    // Test 2: tools/list with credential returns the catalog, identically each time
    {
        json::Doc a = rpc.call(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})", true);
        json_object* tools = json::member(json::member(a.get(), "result"), "tools");
        expect_eq_ll((long long)json_object_array_length(tools), (long long)reg.size(), "full catalog listed");
        json::Doc b = rpc.call(R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})", true);
        expect_eq_str(json::dump(a.get()), json::dump(b.get()), "tools/list is idempotent");
    }

    // Test 3: read_file outside the allowed roots is denied, nothing read
    {
        json::Doc r = rpc.call(
            R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"read_file","arguments":{"path":"/etc/passwd"}}})",
            true);
        bool is_error = false;
        json::Doc p = call_payload(r.get(), &is_error);
        expect_true(is_error, "access denied is an error result");
        std::string err = json::get_string(p.get(), "error").value_or("");
        expect_true(contains(err, "Access denied"), "access denied message");
        expect_true(!json::member(p.get(), "content"), "no file content returned");
        expect_true(!contains(json::dump(r.get()), "root:"), "passwd content absent");
    }

    // Test 4: restart_service with confirm=false is refused without a spawn
    {
        runner.calls.clear();
        json::Doc r = rpc.call(
            R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"restart_service","arguments":{"service":"apis","confirm":false}}})",
            true);
        bool is_error = true;
        json::Doc p = call_payload(r.get(), &is_error);
        expect_true(!is_error, "confirmation refusal is a benign result");
        expect_true(starts_with(json::get_string(p.get(), "error").value_or(""), "Must set confirm=true"),
                    "confirm error text");
        expect_eq_ll((long long)runner.calls.size(), 0, "no restart attempted");
    }

    // Test 5: read-only query passes the mutation check and returns rows
    {
        runner.calls.clear();
        runner.push_ok(R"([{"t":{"name":"Rates"}},{"t":{"name":"Oil"}}])");
        json::Doc r = rpc.call(
            R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"query_database","arguments":{"query":"MATCH (t:Topic) RETURN t LIMIT 5"}}})",
            true);
        bool is_error = true;
        json::Doc p = call_payload(r.get(), &is_error);
        expect_true(!is_error, "query succeeds");
        expect_eq_ll((long long)runner.calls.size(), 1, "query executed once");
        expect_true(contains(runner.calls[0].stdin_data, "MATCH (t:Topic) RETURN t LIMIT 5"), "query sent on stdin");
        json_object* rows = json::member(p.get(), "rows");
        expect_true(rows && json_object_array_length(rows) == 2, "two rows returned");
    }

    // Test 6: mutating query is rejected before execution
    {
        runner.calls.clear();
        json::Doc r = rpc.call(
            R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"query_database","arguments":{"query":"match (n) detach delete n"}}})",
            true);
        bool is_error = false;
        json::Doc p = call_payload(r.get(), &is_error);
        expect_true(is_error, "mutation rejected");
        expect_eq_str(json::get_string(p.get(), "error").value_or(""),
                      "Write queries not allowed via MCP. Use read-only queries.", "mutation message");
        expect_eq_ll((long long)runner.calls.size(), 0, "mutation never executed");
    }

    // Test 7: unknown tool through tools/call
    {
        json::Doc r = rpc.call(
            R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"rm_rf","arguments":{}}})", true);
        bool is_error = false;
        json::Doc p = call_payload(r.get(), &is_error);
        expect_true(is_error, "unknown tool is an error result");
        expect_eq_str(json::get_string(p.get(), "error").value_or(""), "Unknown tool: rm_rf", "unknown tool text");
    }

    // Test 8: protocol-level errors
    {
        json::Doc parse = rpc.call("{not json", true);
        expect_eq_ll(error_code(parse.get()), -32700, "parse error");
        expect_true(json::member(parse.get(), "id") == nullptr, "parse error has null id");

        json::Doc arr = rpc.call("[1,2,3]", true);
        expect_eq_ll(error_code(arr.get()), -32600, "non-object request");

        json::Doc nomethod = rpc.call(R"({"jsonrpc":"2.0","id":9})", true);
        expect_eq_ll(error_code(nomethod.get()), -32600, "missing method");

        json::Doc unknown = rpc.call(R"({"jsonrpc":"2.0","id":10,"method":"resources/list"})", true);
        expect_eq_ll(error_code(unknown.get()), -32601, "unknown method");
        expect_true(contains(json::dump(unknown.get()), "resources/list"), "method named in error");

        json::Doc noname = rpc.call(R"({"jsonrpc":"2.0","id":11,"method":"tools/call","params":{}})", true);
        expect_eq_ll(error_code(noname.get()), -32602, "tools/call without name");

        json::Doc unauth_call = rpc.call(
            R"({"jsonrpc":"2.0","id":12,"method":"tools/call","params":{"name":"docker_status"}})", false);
        expect_eq_ll(error_code(unauth_call.get()), -32001, "tools/call needs credential");
    }

    // Test 9: string ids are echoed as-is
    {
        json::Doc r = rpc.call(R"({"jsonrpc":"2.0","id":"abc","method":"initialize"})", false);
        expect_eq_str(json::get_string(r.get(), "id").value_or(""), "abc", "string id echoed");
        expect_eq_str(json::get_string(r.get(), "jsonrpc").value_or(""), "2.0", "jsonrpc tag");
    }

    remove_tree(root);
    std::cerr << "test_protocol: ALL PASSED" << std::endl;
    return 0;
}
